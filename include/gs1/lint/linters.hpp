#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>

namespace gs1::lint {

/**
 * @brief 组件 linter 的错误码（错误域 "gs1.lint"）。
 *
 * message() 返回面向用户的英文句子，会被拼接到 "AI (xx): " 之后作为错误消息。
 */
enum class errc : int {
    ok = 0,
    non_digit_character = 1,
    invalid_cset82_character = 2,
    invalid_cset39_character = 3,
    invalid_cset64_character = 4,
    invalid_cset64_padding = 5,
    incorrect_check_digit = 6,
    too_short_for_check_digit = 7,
    incorrect_check_pair = 8,
    too_short_for_check_pair = 9,
    too_long_for_check_pair = 10,
    importer_idx_must_be_one_character = 11,
    invalid_importer_idx_character = 12,
    illegal_zero_value = 13,
    not_zero = 14,
    illegal_zero_prefix = 15,
    not_zero_or_one = 16,
    invalid_winding_direction = 17,
    date_too_short = 18,
    date_too_long = 19,
    date_with_hour_too_short = 20,
    date_with_hour_too_long = 21,
    hour_with_minute_too_short = 22,
    hour_with_minute_too_long = 23,
    illegal_month = 24,
    illegal_day = 25,
    illegal_hour = 26,
    illegal_minute = 27,
    invalid_length_for_piece_of_total = 28,
    zero_piece_number = 29,
    zero_total_pieces = 30,
    piece_number_exceeds_total = 31,
    invalid_percent_sequence = 32,
    requires_non_digit_character = 33,
    illegal_second = 34,
    hour_too_short = 35,
    hour_too_long = 36,
    minute_too_short = 37,
    minute_too_long = 38,
    second_too_short = 39,
    second_too_long = 40,
    mmss_invalid_length = 41,
    not_iso3166 = 42,
    not_iso3166_or_999 = 43,
    not_iso3166_alpha2 = 44,
    not_iso4217 = 45,
    iban_too_short = 46,
    iban_too_long = 47,
    invalid_iban_character = 48,
    illegal_iban_country_code = 49,
    incorrect_iban_checksum = 50,
    invalid_latitude = 51,
    invalid_longitude = 52,
    latitude_invalid_length = 53,
    longitude_invalid_length = 54,
    latlong_invalid_length = 55,
    invalid_media_type = 56,
    not_hyphen = 57,
    invalid_biological_sex_code = 58,
    position_in_sequence_malformed = 59,
    position_exceeds_end = 60,
    invalid_package_type = 61,
    too_short_for_gcp = 62,
    invalid_gcp_prefix = 63,

    // 优惠券（AI 8110 / 8112）
    coupon_missing_format_code = 64,
    coupon_invalid_format_code = 65,
    coupon_missing_funder_vli = 66,
    coupon_invalid_funder_length = 67,
    coupon_truncated_funder = 68,
    coupon_truncated_offer_code = 69,
    coupon_missing_serial_number_vli = 70,
    coupon_truncated_serial_number = 71,
    coupon_missing_gcp_vli = 72,
    coupon_invalid_gcp_length = 73,
    coupon_truncated_gcp = 74,
    coupon_missing_save_value_vli = 75,
    coupon_invalid_save_value_length = 76,
    coupon_truncated_save_value = 77,
    coupon_missing_1st_purchase_requirement_vli = 78,
    coupon_invalid_1st_purchase_requirement_length = 79,
    coupon_truncated_1st_purchase_requirement = 80,
    coupon_missing_1st_purchase_requirement_code = 81,
    coupon_invalid_1st_purchase_requirement_code = 82,
    coupon_truncated_1st_purchase_family_code = 83,
    coupon_missing_additional_purchase_rules_code = 84,
    coupon_invalid_additional_purchase_rules_code = 85,
    coupon_missing_2nd_purchase_requirement_vli = 86,
    coupon_invalid_2nd_purchase_requirement_length = 87,
    coupon_truncated_2nd_purchase_requirement = 88,
    coupon_missing_2nd_purchase_requirement_code = 89,
    coupon_invalid_2nd_purchase_requirement_code = 90,
    coupon_truncated_2nd_purchase_family_code = 91,
    coupon_missing_2nd_purchase_gcp_vli = 92,
    coupon_invalid_2nd_purchase_gcp_length = 93,
    coupon_truncated_2nd_purchase_gcp = 94,
    coupon_missing_3rd_purchase_requirement_vli = 95,
    coupon_invalid_3rd_purchase_requirement_length = 96,
    coupon_truncated_3rd_purchase_requirement = 97,
    coupon_missing_3rd_purchase_requirement_code = 98,
    coupon_invalid_3rd_purchase_requirement_code = 99,
    coupon_truncated_3rd_purchase_family_code = 100,
    coupon_missing_3rd_purchase_gcp_vli = 101,
    coupon_invalid_3rd_purchase_gcp_length = 102,
    coupon_truncated_3rd_purchase_gcp = 103,
    coupon_too_short_for_expiration_date = 104,
    coupon_invalid_expiration_date = 105,
    coupon_too_short_for_start_date = 106,
    coupon_invalid_start_date = 107,
    coupon_expiration_before_start = 108,
    coupon_missing_retailer_gcp_or_gln_vli = 109,
    coupon_invalid_retailer_gcp_or_gln_length = 110,
    coupon_truncated_retailer_gcp_or_gln = 111,
    coupon_missing_save_value_code = 112,
    coupon_invalid_save_value_code = 113,
    coupon_missing_save_value_applies_to_item = 114,
    coupon_invalid_save_value_applies_to_item = 115,
    coupon_missing_store_coupon_flag = 116,
    coupon_missing_dont_multiply_flag = 117,
    coupon_invalid_dont_multiply_flag = 118,
    coupon_excess_data = 119,
};

const std::error_category &error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief AI 组件的字符集：N 数字、X CSET 82、Y CSET 39、Z CSET 64（base64url）。
 */
enum class Cset : std::uint8_t {
    numeric = 0,
    cset82 = 1,
    cset39 = 2,
    cset64 = 3,
};

/**
 * @brief 语法字典中可引用的组件 linter。
 */
enum class Linter : std::uint8_t {
    csum,
    csumalpha,
    zero,
    nonzero,
    nozeroprefix,
    yesno,
    winding,
    importeridx,
    hasnondigit,
    pcenc,
    pieceoftotal,
    yymmd0,
    yymmdd,
    yyyymmd0,
    yyyymmdd,
    yymmddhh,
    hhmi,
    hhmm,
    hh,
    mi,
    mm,
    ss,
    mmoptss,
    iso3166,
    iso3166999,
    iso3166alpha2,
    iso3166list,
    iso4217,
    iso5218,
    iban,
    latitude,
    longitude,
    latlong,
    mediatype,
    hyphen,
    posinseqslash,
    packagetype,
    gcppos1,
    gcppos2,
    key,
    couponcode,
    couponposoffer,
};

/**
 * @brief linter 结果：失败时 error_pos/error_length 指出组件内出错片段。
 */
struct LintResult {
    std::error_code ec;
    std::size_t error_pos{0};
    std::size_t error_length{0};

    [[nodiscard]] explicit operator bool() const noexcept { return !ec; }
};

[[nodiscard]] std::optional<Cset> cset_from_letter(char c) noexcept;
[[nodiscard]] char cset_letter(Cset cset) noexcept;

[[nodiscard]] std::optional<Linter> linter_from_name(std::string_view name) noexcept;
[[nodiscard]] std::string_view linter_name(Linter linter) noexcept;

[[nodiscard]] LintResult lint_cset(Cset cset, std::string_view value) noexcept;
[[nodiscard]] LintResult lint(Linter linter, std::string_view value) noexcept;

/**
 * @brief 把两位年份 YY 按 GS1 年份窗口换算为四位年份。
 *
 * YY 比当前年份的后两位大 51 及以上视为上个世纪，小 50 及以上视为下个世纪。
 */
[[nodiscard]] int expand_two_digit_year(int yy, int current_year) noexcept;

} // namespace gs1::lint

namespace std {
template <>
struct is_error_code_enum<gs1::lint::errc> : true_type {};
} // namespace std
