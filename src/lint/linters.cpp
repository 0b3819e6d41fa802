#include "gs1/lint/linters.hpp"

#include "gs1/core/common.hpp"
#include "gs1/lint/check_digit.hpp"
#include "gs1/lint/code_lists.hpp"
#include "gs1/lint/coupon.hpp"

#include <array>
#include <chrono>
#include <string>

namespace gs1::lint {

namespace {

class LintErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char *name() const noexcept override {
        return "gs1.lint";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::ok:
            return "No issues were detected by the linter.";
        case errc::non_digit_character:
            return "A non-digit character was found where a digit is expected.";
        case errc::invalid_cset82_character:
            return "A non-CSET 82 character was found where a CSET 82 "
                   "character is expected.";
        case errc::invalid_cset39_character:
            return "A non-CSET 39 character was found where a CSET 39 "
                   "character is expected.";
        case errc::invalid_cset64_character:
            return "A non-CSET 64 character was found where a CSET 64 "
                   "character is expected.";
        case errc::invalid_cset64_padding:
            return "Incorrect number of CSET 64 pad characters.";
        case errc::incorrect_check_digit:
            return "The numeric check digit is incorrect.";
        case errc::too_short_for_check_digit:
            return "The component is too short to perform a numeric check "
                   "digit calculation.";
        case errc::incorrect_check_pair:
            return "The alphanumeric check-character pair are incorrect.";
        case errc::too_short_for_check_pair:
            return "The component is too short to perform an alphanumeric "
                   "check character pair calculation.";
        case errc::too_long_for_check_pair:
            return "The component is too long to perform an alphanumeric "
                   "check character pair calculation.";
        case errc::importer_idx_must_be_one_character:
            return "The Importer Index must be a single character.";
        case errc::invalid_importer_idx_character:
            return "The Importer Index is an invalid character.";
        case errc::illegal_zero_value:
            return "A non-zero value is required.";
        case errc::not_zero:
            return "A zero is required.";
        case errc::illegal_zero_prefix:
            return "A zero prefix is not permitted.";
        case errc::not_zero_or_one:
            return "A \"0\" or \"1\" is required.";
        case errc::invalid_winding_direction:
            return "The winding direction must be either \"0\", \"1\" or \"9\".";
        case errc::date_too_short:
            return "The date is too short.";
        case errc::date_too_long:
            return "The date is too long.";
        case errc::date_with_hour_too_short:
            return "The date with hour is too short.";
        case errc::date_with_hour_too_long:
            return "The date with hour is too long.";
        case errc::hour_with_minute_too_short:
            return "The hour with minute is too short for HHMI format.";
        case errc::hour_with_minute_too_long:
            return "The hour with minute is too long for HHMI format.";
        case errc::illegal_month:
            return "The date contains an illegal month of the year.";
        case errc::illegal_day:
            return "The date contains an illegal day of the month.";
        case errc::illegal_hour:
            return "The time contains an illegal hour.";
        case errc::illegal_minute:
            return "The time contains an illegal minute.";
        case errc::invalid_length_for_piece_of_total:
            return "The piece with total must have an even length, having "
                   "equal-length components.";
        case errc::zero_piece_number:
            return "The piece number must not have a value of zero.";
        case errc::zero_total_pieces:
            return "The piece total must not have a value of zero.";
        case errc::piece_number_exceeds_total:
            return "The piece number must not exceed the piece total.";
        case errc::invalid_percent_sequence:
            return "The input contains an invalid percent hex-encoding "
                   "\"%hh\" sequence.";
        case errc::requires_non_digit_character:
            return "A non-digit character is required.";
        case errc::illegal_second:
            return "The time contains an illegal seconds.";
        case errc::hour_too_short:
            return "The hour is too short for HH format.";
        case errc::hour_too_long:
            return "The hour is too long for HH format.";
        case errc::minute_too_short:
            return "The minute is too short for MI format.";
        case errc::minute_too_long:
            return "The minute is too long for MI format.";
        case errc::second_too_short:
            return "The second is too short for SS format.";
        case errc::second_too_long:
            return "The second is too long for SS format.";
        case errc::mmss_invalid_length:
            return "The minutes with optional seconds must be two or four "
                   "digits.";
        case errc::not_iso3166:
            return "A valid ISO 3166 three-digit country code is required.";
        case errc::not_iso3166_or_999:
            return "A valid ISO 3166 three-digit country code or \"999\" is "
                   "required.";
        case errc::not_iso3166_alpha2:
            return "A valid ISO 3166 two-character country code is required.";
        case errc::not_iso4217:
            return "A valid ISO 4217 three-digit currency code is required.";
        case errc::iban_too_short:
            return "The IBAN is too short.";
        case errc::iban_too_long:
            return "The IBAN is too long.";
        case errc::invalid_iban_character:
            return "The IBAN contains an invalid character.";
        case errc::illegal_iban_country_code:
            return "The IBAN must start with a valid ISO 3166 two-character "
                   "country code.";
        case errc::incorrect_iban_checksum:
            return "The IBAN is invalid since the check characters are "
                   "incorrect.";
        case errc::invalid_latitude:
            return "The latitude is outside of the range \"0000000000\" to "
                   "\"1800000000\".";
        case errc::invalid_longitude:
            return "The longitude is outside of the range \"0000000000\" to "
                   "\"3600000000\".";
        case errc::latitude_invalid_length:
            return "The latitude must be 10 digits.";
        case errc::longitude_invalid_length:
            return "The longitude must be 10 digits.";
        case errc::latlong_invalid_length:
            return "The latitude with longitude must be 20 digits.";
        case errc::invalid_media_type:
            return "A valid AIDC media type is required.";
        case errc::not_hyphen:
            return "Only hyphens are permitted.";
        case errc::invalid_biological_sex_code:
            return "A valid ISO/IEC 5218 biological sex code required.";
        case errc::position_in_sequence_malformed:
            return "The data must have the format \"<pos>/<end>\".";
        case errc::position_exceeds_end:
            return "The position number must not exceed the end number.";
        case errc::invalid_package_type:
            return "A valid PackageTypeCode is required.";
        case errc::too_short_for_gcp:
            return "The component is shorter than the minimum length GS1 "
                   "Company Prefix.";
        case errc::invalid_gcp_prefix:
            return "The GS1 Company Prefix is invalid.";
        case errc::coupon_missing_format_code:
            return "The coupon's Format Code is missing.";
        case errc::coupon_invalid_format_code:
            return "The coupon's Format Code must be \"0\" or \"1\".";
        case errc::coupon_missing_funder_vli:
            return "The coupon's Funder VLI is missing.";
        case errc::coupon_invalid_funder_length:
            return "The coupon's Funder VLI must be \"0\" to \"6\".";
        case errc::coupon_truncated_funder:
            return "The coupon's Funder is shorter than what is indicated by "
                   "its VLI.";
        case errc::coupon_truncated_offer_code:
            return "The coupon's Offer Code is shorter than the required six "
                   "digits.";
        case errc::coupon_missing_serial_number_vli:
            return "The coupon's Serial Number VLI is missing.";
        case errc::coupon_truncated_serial_number:
            return "The coupon's Serial Number is shorter than what is "
                   "indicated by its VLI.";
        case errc::coupon_missing_gcp_vli:
            return "The coupon's primary GS1 Company Prefix VLI is missing.";
        case errc::coupon_invalid_gcp_length:
            return "The coupon's primary GS1 Company Prefix VLI must be \"0\" "
                   "to \"6\".";
        case errc::coupon_truncated_gcp:
            return "The coupon's primary GS1 Company Prefix is shorter than "
                   "what is indicated by its VLI.";
        case errc::coupon_missing_save_value_vli:
            return "The coupon's Save Value VLI is missing.";
        case errc::coupon_invalid_save_value_length:
            return "The coupon's Save Value VLI must be \"1\" to \"5\".";
        case errc::coupon_truncated_save_value:
            return "The coupon's Save Value is shorter than what is indicated "
                   "by its VLI.";
        case errc::coupon_missing_1st_purchase_requirement_vli:
            return "The coupon's primary purchase Requirement VLI is missing.";
        case errc::coupon_invalid_1st_purchase_requirement_length:
            return "The coupon's primary purchase Requirement VLI must be "
                   "\"1\" to \"5\".";
        case errc::coupon_truncated_1st_purchase_requirement:
            return "The coupon's primary purchase Requirement is shorter than "
                   "what is indicated by its VLI.";
        case errc::coupon_missing_1st_purchase_requirement_code:
            return "The coupon's primary purchase Requirement Code is missing.";
        case errc::coupon_invalid_1st_purchase_requirement_code:
            return "The coupon's primary purchase Requirement Code must be "
                   "\"0\" to \"4\" or \"9\".";
        case errc::coupon_truncated_1st_purchase_family_code:
            return "The coupon's primary purchase Family Code is shorter than "
                   "the required three digits.";
        case errc::coupon_missing_additional_purchase_rules_code:
            return "The coupon's Additional Purchase Rules Code is missing.";
        case errc::coupon_invalid_additional_purchase_rules_code:
            return "The coupon's Additional Purchase Rules Code must be \"0\" "
                   "to \"3\".";
        case errc::coupon_missing_2nd_purchase_requirement_vli:
            return "The coupon's second purchase Requirement VLI is missing.";
        case errc::coupon_invalid_2nd_purchase_requirement_length:
            return "The coupon's second purchase Requirement VLI must be \"1\" "
                   "to \"5\".";
        case errc::coupon_truncated_2nd_purchase_requirement:
            return "The coupon's second purchase Requirement is shorter than "
                   "what is indicated by its VLI.";
        case errc::coupon_missing_2nd_purchase_requirement_code:
            return "The coupon's second purchase Requirement Code is missing.";
        case errc::coupon_invalid_2nd_purchase_requirement_code:
            return "The coupon's second purchase Requirement Code must be "
                   "\"0\" to \"4\" or \"9\".";
        case errc::coupon_truncated_2nd_purchase_family_code:
            return "The coupon's second purchase Family Code is shorter than "
                   "the required three digits.";
        case errc::coupon_missing_2nd_purchase_gcp_vli:
            return "The coupon's second purchase GS1 Company Prefix VLI is "
                   "missing.";
        case errc::coupon_invalid_2nd_purchase_gcp_length:
            return "The coupon's second purchase GS1 Company Prefix VLI must "
                   "be \"0\" to \"6\" or \"9\".";
        case errc::coupon_truncated_2nd_purchase_gcp:
            return "The coupon's second purchase GS1 Company Prefix is shorter "
                   "than what is indicated by its VLI.";
        case errc::coupon_missing_3rd_purchase_requirement_vli:
            return "The coupon's third purchase Requirement VLI is missing.";
        case errc::coupon_invalid_3rd_purchase_requirement_length:
            return "The coupon's third purchase Requirement VLI must be \"1\" "
                   "to \"5\".";
        case errc::coupon_truncated_3rd_purchase_requirement:
            return "The coupon's third purchase Requirement is shorter than "
                   "what is indicated by its VLI.";
        case errc::coupon_missing_3rd_purchase_requirement_code:
            return "The coupon's third purchase Requirement Code is missing.";
        case errc::coupon_invalid_3rd_purchase_requirement_code:
            return "The coupon's third purchase Requirement Code must be \"0\" "
                   "to \"4\" or \"9\".";
        case errc::coupon_truncated_3rd_purchase_family_code:
            return "The coupon's third purchase Family Code is shorter than "
                   "the required three digits.";
        case errc::coupon_missing_3rd_purchase_gcp_vli:
            return "The coupon's third purchase GS1 Company Prefix VLI is "
                   "missing.";
        case errc::coupon_invalid_3rd_purchase_gcp_length:
            return "The coupon's third purchase GS1 Company Prefix VLI must be "
                   "\"0\" to \"6\" or \"9\".";
        case errc::coupon_truncated_3rd_purchase_gcp:
            return "The coupon's third purchase GS1 Company Prefix is shorter "
                   "than what is indicated by its VLI.";
        case errc::coupon_too_short_for_expiration_date:
            return "The coupon's expiration date is too short for YYMMDD "
                   "format.";
        case errc::coupon_invalid_expiration_date:
            return "The coupon's expiration date is invalid.";
        case errc::coupon_too_short_for_start_date:
            return "The coupon's start date is too short to YYMMDD format.";
        case errc::coupon_invalid_start_date:
            return "The coupon's start date is invalid.";
        case errc::coupon_expiration_before_start:
            return "The coupon's expiration date precede the start date.";
        case errc::coupon_missing_retailer_gcp_or_gln_vli:
            return "The coupon's Retailer GCP/GLN VLI is missing.";
        case errc::coupon_invalid_retailer_gcp_or_gln_length:
            return "The coupon's Retailer GCP/GLN VLI must be \"1\" to \"7\".";
        case errc::coupon_truncated_retailer_gcp_or_gln:
            return "The coupon's Retailer GCP/GLN is shorter than what is "
                   "indicated by its VLI.";
        case errc::coupon_missing_save_value_code:
            return "The coupon's Save Value Code is missing.";
        case errc::coupon_invalid_save_value_code:
            return "The coupon's Save Value Code must be \"0\", \"1\", \"2\", "
                   "\"5\" or \"6\".";
        case errc::coupon_missing_save_value_applies_to_item:
            return "The coupon's Save Value Applies to Item is missing.";
        case errc::coupon_invalid_save_value_applies_to_item:
            return "The coupon's Save Value Applies to Item must be \"0\" to "
                   "\"2\".";
        case errc::coupon_missing_store_coupon_flag:
            return "The coupon's Store Coupon Flag is missing.";
        case errc::coupon_missing_dont_multiply_flag:
            return "The coupon's Don't Multiply Flag is missing.";
        case errc::coupon_invalid_dont_multiply_flag:
            return "The coupon's Don't Multiply Flag must be \"0\" or \"1\".";
        case errc::coupon_excess_data:
            return "The coupon contains excess data after the recognised "
                   "optional fields.";
        }
        return "unknown gs1.lint error";
    }
};

const LintErrorCategory kLintErrorCategory{};

constexpr std::string_view kCset82 =
    "!\"%&'()*+,-./0123456789:;<=>?ABCDEFGHIJKLMNOPQRSTUVWXYZ_"
    "abcdefghijklmnopqrstuvwxyz";
constexpr std::string_view kCset39 = "#-/0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::string_view kCset64 =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
constexpr std::string_view kCset32 = "23456789ABCDEFGHJKLMNPQRSTUVWXYZ";
constexpr std::string_view kHexDigits = "0123456789ABCDEFabcdef";

struct LinterName {
    std::string_view name;
    Linter linter;
};

// 按名称升序排列
constexpr std::array<LinterName, 42> kLinterNames{{
    {"couponcode", Linter::couponcode},
    {"couponposoffer", Linter::couponposoffer},
    {"csum", Linter::csum},
    {"csumalpha", Linter::csumalpha},
    {"gcppos1", Linter::gcppos1},
    {"gcppos2", Linter::gcppos2},
    {"hasnondigit", Linter::hasnondigit},
    {"hh", Linter::hh},
    {"hhmi", Linter::hhmi},
    {"hhmm", Linter::hhmm},
    {"hyphen", Linter::hyphen},
    {"iban", Linter::iban},
    {"importeridx", Linter::importeridx},
    {"iso3166", Linter::iso3166},
    {"iso3166999", Linter::iso3166999},
    {"iso3166alpha2", Linter::iso3166alpha2},
    {"iso3166list", Linter::iso3166list},
    {"iso4217", Linter::iso4217},
    {"iso5218", Linter::iso5218},
    {"key", Linter::key},
    {"latitude", Linter::latitude},
    {"latlong", Linter::latlong},
    {"longitude", Linter::longitude},
    {"mediatype", Linter::mediatype},
    {"mi", Linter::mi},
    {"mm", Linter::mm},
    {"mmoptss", Linter::mmoptss},
    {"nonzero", Linter::nonzero},
    {"nozeroprefix", Linter::nozeroprefix},
    {"packagetype", Linter::packagetype},
    {"pcenc", Linter::pcenc},
    {"pieceoftotal", Linter::pieceoftotal},
    {"posinseqslash", Linter::posinseqslash},
    {"ss", Linter::ss},
    {"winding", Linter::winding},
    {"yesno", Linter::yesno},
    {"yymmd0", Linter::yymmd0},
    {"yymmdd", Linter::yymmdd},
    {"yymmddhh", Linter::yymmddhh},
    {"yyyymmd0", Linter::yyyymmd0},
    {"yyyymmdd", Linter::yyyymmdd},
    {"zero", Linter::zero},
}};

// 前 97 个素数，csumalpha 的加权因子（从右往左）。
constexpr std::array<unsigned int, 97> kPrimes{
    2,   3,   5,   7,   11,  13,  17,  19,  23,  29,  31,  37,  41,  43,  47,
    53,  59,  61,  67,  71,  73,  79,  83,  89,  97,  101, 103, 107, 109, 113,
    127, 131, 137, 139, 149, 151, 157, 163, 167, 173, 179, 181, 191, 193, 197,
    199, 211, 223, 227, 229, 233, 239, 241, 251, 257, 263, 269, 271, 277, 281,
    283, 293, 307, 311, 313, 317, 331, 337, 347, 349, 353, 359, 367, 373, 379,
    383, 389, 397, 401, 409, 419, 421, 431, 433, 439, 443, 449, 457, 461, 463,
    467, 479, 487, 491, 499, 503, 509};

[[nodiscard]] LintResult ok() noexcept { return {}; }

[[nodiscard]] LintResult fail(errc e, std::size_t pos, std::size_t len) noexcept {
    return LintResult{make_error_code(e), pos, len};
}

[[nodiscard]] LintResult first_not_in(std::string_view value,
                                      std::string_view charset,
                                      errc e) noexcept {
    const auto pos = value.find_first_not_of(charset);
    if (pos != std::string_view::npos) {
        return fail(e, pos, 1);
    }
    return ok();
}

[[nodiscard]] int two_digits(std::string_view s, std::size_t at) noexcept {
    return (s[at] - '0') * 10 + (s[at + 1] - '0');
}

[[nodiscard]] int current_year() noexcept {
    const std::chrono::year_month_day ymd{
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
    return static_cast<int>(ymd.year());
}

[[nodiscard]] int days_in_month(int year, int month) noexcept {
    static constexpr std::array<int, 12> kDays{31, 28, 31, 30, 31, 30,
                                               31, 31, 30, 31, 30, 31};
    if (month == 2) {
        const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[static_cast<std::size_t>(month - 1)];
}

// value 已确认是 8 位数字 YYYYMMDD
[[nodiscard]] LintResult check_yyyymmdd(std::string_view value,
                                        bool permit_zero_day) noexcept {
    const int year = two_digits(value, 0) * 100 + two_digits(value, 2);
    const int month = two_digits(value, 4);
    const int day = two_digits(value, 6);

    if (month < 1 || month > 12) {
        return fail(errc::illegal_month, 4, 2);
    }
    if ((day == 0 && !permit_zero_day) || day > days_in_month(year, month)) {
        return fail(errc::illegal_day, 6, 2);
    }
    return ok();
}

[[nodiscard]] LintResult lint_yyyymmdd(std::string_view value,
                                       bool permit_zero_day) noexcept {
    if (value.size() != 8) {
        return fail(value.size() < 8 ? errc::date_too_short : errc::date_too_long,
                    0,
                    value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    return check_yyyymmdd(value, permit_zero_day);
}

[[nodiscard]] LintResult lint_yymmdd(std::string_view value,
                                     bool permit_zero_day) noexcept {
    if (value.size() != 6) {
        return fail(value.size() < 6 ? errc::date_too_short : errc::date_too_long,
                    0,
                    value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }

    const int year = expand_two_digit_year(two_digits(value, 0), current_year());
    std::string yyyymmdd = std::to_string(year);
    yyyymmdd.append(value.substr(2));

    auto r = check_yyyymmdd(yyyymmdd, permit_zero_day);
    if (!r) {
        r.error_pos -= 2;
    }
    return r;
}

[[nodiscard]] LintResult lint_yymmddhh(std::string_view value) noexcept {
    if (value.size() != 8) {
        return fail(value.size() < 8 ? errc::date_with_hour_too_short
                                     : errc::date_with_hour_too_long,
                    0,
                    value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    if (auto r = lint_yymmdd(value.substr(0, 6), false); !r) {
        return r;
    }
    if (two_digits(value, 6) > 23) {
        return fail(errc::illegal_hour, 6, 2);
    }
    return ok();
}

[[nodiscard]] LintResult lint_hhmi(std::string_view value) noexcept {
    if (value.size() != 4) {
        return fail(value.size() < 4 ? errc::hour_with_minute_too_short
                                     : errc::hour_with_minute_too_long,
                    0,
                    value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    if (two_digits(value, 0) > 23) {
        return fail(errc::illegal_hour, 0, 2);
    }
    if (two_digits(value, 2) > 59) {
        return fail(errc::illegal_minute, 2, 2);
    }
    return ok();
}

[[nodiscard]] LintResult lint_csum(std::string_view value) noexcept {
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    if (value.size() < 2) {
        return fail(errc::too_short_for_check_digit, 0, value.size());
    }
    if (!verify_check_digit(value)) {
        return fail(errc::incorrect_check_digit, value.size() - 1, 1);
    }
    return ok();
}

[[nodiscard]] LintResult lint_csumalpha(std::string_view value) noexcept {
    if (value.size() > kPrimes.size() + 2) {
        return fail(errc::too_long_for_check_pair, 0, value.size());
    }
    if (value.size() < 2) {
        return fail(errc::too_short_for_check_pair, 0, value.size());
    }

    const std::size_t n = value.size();
    unsigned int sum = 0;
    for (std::size_t pos = 0; pos < n - 2; ++pos) {
        const auto weight = kCset82.find(value[pos]);
        if (weight == std::string_view::npos) {
            return fail(errc::invalid_cset82_character, pos, 1);
        }
        sum += static_cast<unsigned int>(weight) * kPrimes[n - 3 - pos];
    }
    sum %= 1021;

    if (value[n - 2] != kCset32[sum >> 5] || value[n - 1] != kCset32[sum & 31]) {
        return fail(errc::incorrect_check_pair, n - 2, 2);
    }
    return ok();
}

[[nodiscard]] LintResult lint_pieceoftotal(std::string_view value) noexcept {
    const std::size_t n = value.size();
    if (n == 0 || n % 2 != 0) {
        return fail(errc::invalid_length_for_piece_of_total, 0, n);
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }

    const auto piece = value.substr(0, n / 2);
    const auto total = value.substr(n / 2);
    if (piece.find_first_not_of('0') == std::string_view::npos) {
        return fail(errc::zero_piece_number, 0, n / 2);
    }
    if (total.find_first_not_of('0') == std::string_view::npos) {
        return fail(errc::zero_total_pieces, n / 2, n / 2);
    }
    // 等长数字串的字典序即数值序
    if (piece > total) {
        return fail(errc::piece_number_exceeds_total, 0, n);
    }
    return ok();
}

[[nodiscard]] LintResult lint_pcenc(std::string_view value) noexcept {
    std::size_t pos = value.find('%');
    while (pos != std::string_view::npos) {
        if (value.size() - pos < 3) {
            return fail(errc::invalid_percent_sequence, pos, value.size() - pos);
        }
        if (kHexDigits.find(value[pos + 1]) == std::string_view::npos ||
            kHexDigits.find(value[pos + 2]) == std::string_view::npos) {
            return fail(errc::invalid_percent_sequence, pos, 3);
        }
        pos = value.find('%', pos + 3);
    }
    return ok();
}

[[nodiscard]] LintResult lint_two_digit_field(std::string_view value,
                                              errc too_short,
                                              errc too_long,
                                              int max,
                                              errc illegal) noexcept {
    if (value.size() != 2) {
        return fail(value.size() < 2 ? too_short : too_long, 0, value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    if (two_digits(value, 0) > max) {
        return fail(illegal, 0, 2);
    }
    return ok();
}

[[nodiscard]] LintResult lint_mmoptss(std::string_view value) noexcept {
    if (value.size() != 2 && value.size() != 4) {
        return fail(errc::mmss_invalid_length, 0, value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    if (two_digits(value, 0) > 59) {
        return fail(errc::illegal_minute, 0, 2);
    }
    if (value.size() == 4 && two_digits(value, 2) > 59) {
        return fail(errc::illegal_second, 2, 2);
    }
    return ok();
}

// 三位一组的国家代码列表
[[nodiscard]] LintResult lint_iso3166list(std::string_view value) noexcept {
    if (value.empty()) {
        return fail(errc::not_iso3166, 0, 0);
    }
    std::size_t pos = 0;
    for (; pos + 3 <= value.size(); pos += 3) {
        if (!is_iso3166_numeric(value.substr(pos, 3))) {
            return fail(errc::not_iso3166, pos, 3);
        }
    }
    if (pos != value.size()) {
        return fail(errc::not_iso3166, pos, value.size() - pos);
    }
    return ok();
}

/**
 * @brief IBAN：国家代码 + 两位校验 + BBAN，按 ISO 13616 做 mod 97 校验。
 *
 * 把前四位移到末尾后逐字符折算：数字取其值，字母 A..Z 取 10..35，
 * 余数须为 1。
 */
[[nodiscard]] LintResult lint_iban(std::string_view value) noexcept {
    const std::size_t n = value.size();
    if (n < 4) {
        return fail(errc::iban_too_short, 0, n);
    }
    if (!is_iso3166_alpha2(value.substr(0, 2))) {
        return fail(errc::illegal_iban_country_code, 0, 2);
    }
    if (n > 34) {
        return fail(errc::iban_too_long, 0, n);
    }
    if (n <= 10) {
        return fail(errc::iban_too_short, 0, n);
    }

    unsigned int csum = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const std::size_t pos = (i + 4) % n;
        const char c = value[pos];
        if (c >= '0' && c <= '9') {
            csum = csum * 10 + static_cast<unsigned int>(c - '0');
        } else if (c >= 'A' && c <= 'Z') {
            csum = csum * 100 + static_cast<unsigned int>(c - 'A') + 10;
        } else {
            return fail(errc::invalid_iban_character, pos, 1);
        }
        csum %= 97;
    }
    if (csum != 1) {
        return fail(errc::incorrect_iban_checksum, 2, 2);
    }
    return ok();
}

// 十位数字坐标，上限以字符串比较（等长数字串字典序即数值序）
[[nodiscard]] LintResult lint_coordinate(std::string_view value,
                                         errc invalid_length,
                                         std::string_view limit,
                                         errc out_of_range) noexcept {
    if (value.size() != 10) {
        return fail(invalid_length, 0, value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    if (value > limit) {
        return fail(out_of_range, 0, 10);
    }
    return ok();
}

[[nodiscard]] LintResult lint_latlong(std::string_view value) noexcept {
    if (value.size() != 20) {
        return fail(errc::latlong_invalid_length, 0, value.size());
    }
    if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
        return r;
    }
    if (value.substr(0, 10) > "1800000000") {
        return fail(errc::invalid_latitude, 0, 10);
    }
    if (value.substr(10) > "3600000000") {
        return fail(errc::invalid_longitude, 10, 10);
    }
    return ok();
}

// AIDC 介质类型："01".."10" 与 "80".."99"
[[nodiscard]] LintResult lint_mediatype(std::string_view value) noexcept {
    if (value.size() == 2 && core::all_digits(value)) {
        const int type = two_digits(value, 0);
        if ((type >= 1 && type <= 10) || type >= 80) {
            return ok();
        }
    }
    return fail(errc::invalid_media_type, 0, value.size());
}

[[nodiscard]] LintResult lint_posinseqslash(std::string_view value) noexcept {
    const std::size_t n = value.size();
    const auto slash = value.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == n) {
        return fail(errc::position_in_sequence_malformed, 0, n);
    }
    const auto position = value.substr(0, slash);
    const auto end = value.substr(slash + 1);
    if (!core::all_digits(position) || !core::all_digits(end)) {
        return fail(errc::position_in_sequence_malformed, 0, n);
    }

    if (position.front() == '0') {
        return fail(errc::illegal_zero_prefix, 0, slash);
    }
    if (end.front() == '0') {
        return fail(errc::illegal_zero_prefix, slash + 1, end.size());
    }
    if (position.size() > end.size() ||
        (position.size() == end.size() && position > end)) {
        return fail(errc::position_exceeds_end, 0, n);
    }
    return ok();
}

// 最短 GCP 为四位数字
constexpr std::size_t kGcpMinLength = 4;

[[nodiscard]] LintResult lint_gcppos1(std::string_view value) noexcept {
    if (value.size() < kGcpMinLength) {
        return fail(errc::too_short_for_gcp, 0, value.size());
    }
    return first_not_in(value.substr(0, kGcpMinLength), "0123456789",
                        errc::invalid_gcp_prefix);
}

// 首位为扩展位或指示位，GCP 从第二位开始
[[nodiscard]] LintResult lint_gcppos2(std::string_view value) noexcept {
    if (value.size() < 2) {
        return fail(errc::too_short_for_gcp, 0, value.size());
    }
    auto r = lint_gcppos1(value.substr(1));
    if (!r) {
        r.error_pos += 1;
    }
    return r;
}

} // namespace

const std::error_category &error_category() noexcept {
    return kLintErrorCategory;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

std::optional<Cset> cset_from_letter(char c) noexcept {
    switch (c) {
    case 'N':
        return Cset::numeric;
    case 'X':
        return Cset::cset82;
    case 'Y':
        return Cset::cset39;
    case 'Z':
        return Cset::cset64;
    default:
        return std::nullopt;
    }
}

char cset_letter(Cset cset) noexcept {
    switch (cset) {
    case Cset::numeric:
        return 'N';
    case Cset::cset82:
        return 'X';
    case Cset::cset39:
        return 'Y';
    case Cset::cset64:
        return 'Z';
    }
    return '?';
}

std::optional<Linter> linter_from_name(std::string_view name) noexcept {
    for (const auto &entry : kLinterNames) {
        if (entry.name == name) {
            return entry.linter;
        }
    }
    return std::nullopt;
}

std::string_view linter_name(Linter linter) noexcept {
    for (const auto &entry : kLinterNames) {
        if (entry.linter == linter) {
            return entry.name;
        }
    }
    return {};
}

int expand_two_digit_year(int yy, int current_year) noexcept {
    const int century = current_year / 100 * 100;
    const int diff = yy - current_year % 100;
    if (diff >= 51) {
        return century - 100 + yy;
    }
    if (diff > -50) {
        return century + yy;
    }
    return century + 100 + yy;
}

LintResult lint_cset(Cset cset, std::string_view value) noexcept {
    switch (cset) {
    case Cset::numeric:
        return first_not_in(value, "0123456789", errc::non_digit_character);
    case Cset::cset82:
        return first_not_in(value, kCset82, errc::invalid_cset82_character);
    case Cset::cset39:
        return first_not_in(value, kCset39, errc::invalid_cset39_character);
    case Cset::cset64: {
        std::size_t pads = 0;
        while (pads < value.size() && value[value.size() - pads - 1] == '=') {
            ++pads;
        }
        const std::size_t len = value.size() - pads;
        if (pads > 2 || (pads > 0 && value.size() % 3 != 0)) {
            return fail(errc::invalid_cset64_padding, len, pads);
        }
        return first_not_in(value.substr(0, len), kCset64,
                            errc::invalid_cset64_character);
    }
    }
    return ok();
}

LintResult lint(Linter linter, std::string_view value) noexcept {
    switch (linter) {
    case Linter::csum:
        return lint_csum(value);
    case Linter::csumalpha:
        return lint_csumalpha(value);
    case Linter::zero:
        if (value.empty() || value.find_first_not_of('0') != std::string_view::npos) {
            return fail(errc::not_zero, 0, value.size());
        }
        return ok();
    case Linter::nonzero:
        if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
            return r;
        }
        if (value.find_first_not_of('0') == std::string_view::npos) {
            return fail(errc::illegal_zero_value, 0, value.size());
        }
        return ok();
    case Linter::nozeroprefix:
        if (auto r = first_not_in(value, "0123456789", errc::non_digit_character); !r) {
            return r;
        }
        if (!value.empty() && value.front() == '0') {
            return fail(errc::illegal_zero_prefix, 0, 1);
        }
        return ok();
    case Linter::yesno:
        if (value != "0" && value != "1") {
            return fail(errc::not_zero_or_one, 0, value.size());
        }
        return ok();
    case Linter::winding:
        if (value != "0" && value != "1" && value != "9") {
            return fail(errc::invalid_winding_direction, 0, value.size());
        }
        return ok();
    case Linter::importeridx:
        if (value.size() != 1) {
            return fail(errc::importer_idx_must_be_one_character, 0, value.size());
        }
        return first_not_in(value, kCset64, errc::invalid_importer_idx_character);
    case Linter::hasnondigit:
        if (core::all_digits(value)) {
            return fail(errc::requires_non_digit_character, 0, value.size());
        }
        return ok();
    case Linter::pcenc:
        return lint_pcenc(value);
    case Linter::pieceoftotal:
        return lint_pieceoftotal(value);
    case Linter::yymmd0:
        return lint_yymmdd(value, true);
    case Linter::yymmdd:
        return lint_yymmdd(value, false);
    case Linter::yyyymmd0:
        return lint_yyyymmdd(value, true);
    case Linter::yyyymmdd:
        return lint_yyyymmdd(value, false);
    case Linter::yymmddhh:
        return lint_yymmddhh(value);
    case Linter::hhmi:
    case Linter::hhmm:
        return lint_hhmi(value);
    case Linter::hh:
        return lint_two_digit_field(value, errc::hour_too_short,
                                    errc::hour_too_long, 23, errc::illegal_hour);
    case Linter::mi:
    case Linter::mm:
        return lint_two_digit_field(value, errc::minute_too_short,
                                    errc::minute_too_long, 59,
                                    errc::illegal_minute);
    case Linter::ss:
        return lint_two_digit_field(value, errc::second_too_short,
                                    errc::second_too_long, 59,
                                    errc::illegal_second);
    case Linter::mmoptss:
        return lint_mmoptss(value);
    case Linter::iso3166:
        if (!is_iso3166_numeric(value)) {
            return fail(errc::not_iso3166, 0, value.size());
        }
        return ok();
    case Linter::iso3166999:
        if (value != "999" && !is_iso3166_numeric(value)) {
            return fail(errc::not_iso3166_or_999, 0, value.size());
        }
        return ok();
    case Linter::iso3166alpha2:
        if (!is_iso3166_alpha2(value)) {
            return fail(errc::not_iso3166_alpha2, 0, value.size());
        }
        return ok();
    case Linter::iso3166list:
        return lint_iso3166list(value);
    case Linter::iso4217:
        if (!is_iso4217_numeric(value)) {
            return fail(errc::not_iso4217, 0, value.size());
        }
        return ok();
    case Linter::iso5218:
        if (value != "0" && value != "1" && value != "2" && value != "9") {
            return fail(errc::invalid_biological_sex_code, 0, value.size());
        }
        return ok();
    case Linter::iban:
        return lint_iban(value);
    case Linter::latitude:
        return lint_coordinate(value, errc::latitude_invalid_length,
                               "1800000000", errc::invalid_latitude);
    case Linter::longitude:
        return lint_coordinate(value, errc::longitude_invalid_length,
                               "3600000000", errc::invalid_longitude);
    case Linter::latlong:
        return lint_latlong(value);
    case Linter::mediatype:
        return lint_mediatype(value);
    case Linter::hyphen:
        if (value.empty()) {
            return fail(errc::not_hyphen, 0, 0);
        }
        if (value.find_first_not_of('-') != std::string_view::npos) {
            return fail(errc::not_hyphen, 0, value.size());
        }
        return ok();
    case Linter::posinseqslash:
        return lint_posinseqslash(value);
    case Linter::packagetype:
        if (!is_package_type(value)) {
            return fail(errc::invalid_package_type, 0, value.size());
        }
        return ok();
    case Linter::gcppos1:
    case Linter::key:
        return lint_gcppos1(value);
    case Linter::gcppos2:
        return lint_gcppos2(value);
    case Linter::couponcode:
        return lint_couponcode(value);
    case Linter::couponposoffer:
        return lint_couponposoffer(value);
    }
    return ok();
}

} // namespace gs1::lint
