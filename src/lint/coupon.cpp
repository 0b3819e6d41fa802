#include "gs1/lint/coupon.hpp"

#include <cstddef>

namespace gs1::lint {

namespace {

[[nodiscard]] LintResult fail(errc e, std::size_t pos, std::size_t len) noexcept {
    return LintResult{make_error_code(e), pos, len};
}

/**
 * @brief 按字段顺序消费优惠券数据的游标。
 *
 * 错误位置的约定：缺失字段报告整段数据；截断字段报告剩余部分，
 * 若已无剩余则同样报告整段数据。
 */
class CouponReader {
public:
    explicit CouponReader(std::string_view data) noexcept : data_(data) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ == data_.size(); }
    [[nodiscard]] char peek() const noexcept { return data_[pos_]; }
    [[nodiscard]] std::size_t pos() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept {
        return data_.size() - pos_;
    }
    [[nodiscard]] bool next_is(char c) const noexcept {
        return !at_end() && peek() == c;
    }

    void advance(std::size_t n = 1) noexcept { pos_ += n; }

    [[nodiscard]] std::string_view take(std::size_t n) noexcept {
        const auto field = data_.substr(pos_, n);
        pos_ += n;
        return field;
    }

    [[nodiscard]] LintResult missing(errc e) const noexcept {
        return fail(e, 0, data_.size());
    }
    [[nodiscard]] LintResult invalid(errc e) const noexcept {
        return fail(e, pos_, 1);
    }
    [[nodiscard]] LintResult truncated(errc e) const noexcept {
        if (at_end()) {
            return fail(e, 0, data_.size());
        }
        return fail(e, pos_, remaining());
    }

private:
    std::string_view data_;
    std::size_t pos_{0};
};

// 一组购买要求字段（VLI + 要求值 + 要求代码 + 三位 Family Code）对应的错误码
struct PurchaseErrors {
    errc missing_vli;
    errc invalid_length;
    errc truncated;
    errc missing_code;
    errc invalid_code;
    errc truncated_family;
};

constexpr PurchaseErrors kFirstPurchase{
    errc::coupon_missing_1st_purchase_requirement_vli,
    errc::coupon_invalid_1st_purchase_requirement_length,
    errc::coupon_truncated_1st_purchase_requirement,
    errc::coupon_missing_1st_purchase_requirement_code,
    errc::coupon_invalid_1st_purchase_requirement_code,
    errc::coupon_truncated_1st_purchase_family_code,
};

constexpr PurchaseErrors kSecondPurchase{
    errc::coupon_missing_2nd_purchase_requirement_vli,
    errc::coupon_invalid_2nd_purchase_requirement_length,
    errc::coupon_truncated_2nd_purchase_requirement,
    errc::coupon_missing_2nd_purchase_requirement_code,
    errc::coupon_invalid_2nd_purchase_requirement_code,
    errc::coupon_truncated_2nd_purchase_family_code,
};

constexpr PurchaseErrors kThirdPurchase{
    errc::coupon_missing_3rd_purchase_requirement_vli,
    errc::coupon_invalid_3rd_purchase_requirement_length,
    errc::coupon_truncated_3rd_purchase_requirement,
    errc::coupon_missing_3rd_purchase_requirement_code,
    errc::coupon_invalid_3rd_purchase_requirement_code,
    errc::coupon_truncated_3rd_purchase_family_code,
};

// 仅校验最短 GCP 前缀，失败时错误区间覆盖整个字段
[[nodiscard]] LintResult check_gcp_field(std::string_view gcp,
                                         std::size_t at) noexcept {
    if (gcp.empty()) {
        return {};
    }
    if (auto r = lint(Linter::key, gcp); !r) {
        return fail(errc::invalid_gcp_prefix, at, gcp.size());
    }
    return {};
}

[[nodiscard]] LintResult read_purchase(CouponReader &in,
                                       const PurchaseErrors &errs) noexcept {
    if (in.at_end()) {
        return in.missing(errs.missing_vli);
    }
    if (in.peek() < '1' || in.peek() > '5') {
        return in.invalid(errs.invalid_length);
    }
    const auto vli = static_cast<std::size_t>(in.peek() - '0');
    in.advance();
    if (in.remaining() < vli) {
        return in.truncated(errs.truncated);
    }
    in.advance(vli);

    if (in.at_end()) {
        return in.missing(errs.missing_code);
    }
    if (in.peek() > '4' && in.peek() != '9') {
        return in.invalid(errs.invalid_code);
    }
    in.advance();
    if (in.remaining() < 3) {
        return in.truncated(errs.truncated_family);
    }
    in.advance(3);
    return {};
}

// 第二、三购买要求之后的 GCP：VLI 为 "0".."6"，或 "9" 表示沿用主 GCP
[[nodiscard]] LintResult read_purchase_gcp(CouponReader &in,
                                           errc missing_vli,
                                           errc invalid_length,
                                           errc truncated) noexcept {
    if (in.at_end()) {
        return in.missing(missing_vli);
    }
    if (in.peek() > '6' && in.peek() != '9') {
        return in.invalid(invalid_length);
    }
    const std::size_t vli =
        in.peek() == '9' ? 0 : static_cast<std::size_t>(in.peek() - '0') + 6;
    in.advance();
    if (in.remaining() < vli) {
        return in.truncated(truncated);
    }
    const auto at = in.pos();
    return check_gcp_field(in.take(vli), at);
}

[[nodiscard]] LintResult read_date(CouponReader &in,
                                   errc too_short,
                                   errc invalid,
                                   std::string_view &date) noexcept {
    if (in.remaining() < 6) {
        return in.truncated(too_short);
    }
    const auto at = in.pos();
    date = in.take(6);
    if (auto r = lint(Linter::yymmdd, date); !r) {
        return fail(invalid, at, 6);
    }
    return {};
}

} // namespace

LintResult lint_couponcode(std::string_view value) noexcept {
    if (const auto pos = value.find_first_not_of("0123456789");
        pos != std::string_view::npos) {
        return fail(errc::non_digit_character, pos, 1);
    }

    CouponReader in{value};

    // 主 GCP
    if (in.at_end()) {
        return in.missing(errc::coupon_missing_gcp_vli);
    }
    if (in.peek() > '6') {
        return in.invalid(errc::coupon_invalid_gcp_length);
    }
    std::size_t vli = static_cast<std::size_t>(in.peek() - '0') + 6;
    in.advance();
    if (in.remaining() < vli) {
        return in.truncated(errc::coupon_truncated_gcp);
    }
    {
        const auto at = in.pos();
        if (auto r = check_gcp_field(in.take(vli), at); !r) {
            return r;
        }
    }

    if (in.remaining() < 6) {
        return in.truncated(errc::coupon_truncated_offer_code);
    }
    in.advance(6);

    // Save Value
    if (in.at_end()) {
        return in.missing(errc::coupon_missing_save_value_vli);
    }
    if (in.peek() < '1' || in.peek() > '5') {
        return in.invalid(errc::coupon_invalid_save_value_length);
    }
    vli = static_cast<std::size_t>(in.peek() - '0');
    in.advance();
    if (in.remaining() < vli) {
        return in.truncated(errc::coupon_truncated_save_value);
    }
    in.advance(vli);

    if (auto r = read_purchase(in, kFirstPurchase); !r) {
        return r;
    }

    // 可选字段 1：附加购买规则 + 第二购买要求
    if (in.next_is('1')) {
        in.advance();
        if (in.at_end()) {
            return in.missing(errc::coupon_missing_additional_purchase_rules_code);
        }
        if (in.peek() > '3') {
            return in.invalid(errc::coupon_invalid_additional_purchase_rules_code);
        }
        in.advance();
        if (auto r = read_purchase(in, kSecondPurchase); !r) {
            return r;
        }
        if (auto r = read_purchase_gcp(in,
                                       errc::coupon_missing_2nd_purchase_gcp_vli,
                                       errc::coupon_invalid_2nd_purchase_gcp_length,
                                       errc::coupon_truncated_2nd_purchase_gcp);
            !r) {
            return r;
        }
    }

    // 可选字段 2：第三购买要求
    if (in.next_is('2')) {
        in.advance();
        if (auto r = read_purchase(in, kThirdPurchase); !r) {
            return r;
        }
        if (auto r = read_purchase_gcp(in,
                                       errc::coupon_missing_3rd_purchase_gcp_vli,
                                       errc::coupon_invalid_3rd_purchase_gcp_length,
                                       errc::coupon_truncated_3rd_purchase_gcp);
            !r) {
            return r;
        }
    }

    // 可选字段 3、4：到期日与开始日，开始日不得晚于到期日
    std::string_view expiry;
    if (in.next_is('3')) {
        in.advance();
        if (auto r = read_date(in,
                               errc::coupon_too_short_for_expiration_date,
                               errc::coupon_invalid_expiration_date,
                               expiry);
            !r) {
            return r;
        }
    }
    if (in.next_is('4')) {
        in.advance();
        const auto at = in.pos();
        std::string_view start;
        if (auto r = read_date(in,
                               errc::coupon_too_short_for_start_date,
                               errc::coupon_invalid_start_date,
                               start);
            !r) {
            return r;
        }
        // 相邻的两个字段：'3' + 到期日 + '4' + 开始日
        if (!expiry.empty() && start > expiry) {
            return fail(errc::coupon_expiration_before_start, at - 8, 14);
        }
    }

    // 可选字段 5：序列号
    if (in.next_is('5')) {
        in.advance();
        if (in.at_end()) {
            return in.missing(errc::coupon_missing_serial_number_vli);
        }
        vli = static_cast<std::size_t>(in.peek() - '0') + 6;
        in.advance();
        if (in.remaining() < vli) {
            return in.truncated(errc::coupon_truncated_serial_number);
        }
        in.advance(vli);
    }

    // 可选字段 6：零售商 GCP/GLN
    if (in.next_is('6')) {
        in.advance();
        if (in.at_end()) {
            return in.missing(errc::coupon_missing_retailer_gcp_or_gln_vli);
        }
        if (in.peek() < '1' || in.peek() > '7') {
            return in.invalid(errc::coupon_invalid_retailer_gcp_or_gln_length);
        }
        vli = static_cast<std::size_t>(in.peek() - '0') + 6;
        in.advance();
        if (in.remaining() < vli) {
            return in.truncated(errc::coupon_truncated_retailer_gcp_or_gln);
        }
        const auto at = in.pos();
        if (auto r = check_gcp_field(in.take(vli), at); !r) {
            return r;
        }
    }

    // 可选字段 9：杂项
    if (in.next_is('9')) {
        in.advance();
        if (in.at_end()) {
            return in.missing(errc::coupon_missing_save_value_code);
        }
        const char code = in.peek();
        if (code != '0' && code != '1' && code != '2' && code != '5' &&
            code != '6') {
            return in.invalid(errc::coupon_invalid_save_value_code);
        }
        in.advance();
        if (in.at_end()) {
            return in.missing(errc::coupon_missing_save_value_applies_to_item);
        }
        if (in.peek() > '2') {
            return in.invalid(errc::coupon_invalid_save_value_applies_to_item);
        }
        in.advance();
        if (in.at_end()) {
            return in.missing(errc::coupon_missing_store_coupon_flag);
        }
        in.advance();
        if (in.at_end()) {
            return in.missing(errc::coupon_missing_dont_multiply_flag);
        }
        if (in.peek() != '0' && in.peek() != '1') {
            return in.invalid(errc::coupon_invalid_dont_multiply_flag);
        }
        in.advance();
    }

    if (!in.at_end()) {
        return fail(errc::coupon_excess_data, in.pos(), in.remaining());
    }
    return {};
}

LintResult lint_couponposoffer(std::string_view value) noexcept {
    if (const auto pos = value.find_first_not_of("0123456789");
        pos != std::string_view::npos) {
        return fail(errc::non_digit_character, pos, 1);
    }

    CouponReader in{value};

    if (in.at_end()) {
        return in.missing(errc::coupon_missing_format_code);
    }
    if (in.peek() != '0' && in.peek() != '1') {
        return in.invalid(errc::coupon_invalid_format_code);
    }
    in.advance();

    if (in.at_end()) {
        return in.missing(errc::coupon_missing_funder_vli);
    }
    if (in.peek() > '6') {
        return in.invalid(errc::coupon_invalid_funder_length);
    }
    std::size_t vli = static_cast<std::size_t>(in.peek() - '0') + 6;
    in.advance();
    if (in.remaining() < vli) {
        return in.truncated(errc::coupon_truncated_funder);
    }
    in.advance(vli);

    if (in.remaining() < 6) {
        return in.truncated(errc::coupon_truncated_offer_code);
    }
    in.advance(6);

    if (in.at_end()) {
        return in.missing(errc::coupon_missing_serial_number_vli);
    }
    vli = static_cast<std::size_t>(in.peek() - '0') + 6;
    in.advance();
    if (in.remaining() < vli) {
        return in.truncated(errc::coupon_truncated_serial_number);
    }
    in.advance(vli);

    if (!in.at_end()) {
        return fail(errc::coupon_excess_data, in.pos(), in.remaining());
    }
    return {};
}

} // namespace gs1::lint
