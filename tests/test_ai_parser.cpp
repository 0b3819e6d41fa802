#include "gs1/ai/hri.hpp"
#include "gs1/ai/parser.hpp"
#include "gs1/core/error.hpp"
#include "gs1/dict/syntax_dictionary.hpp"
#include "gs1/lint/linters.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using gs1::ai::ElementKind;
using gs1::ai::errc;
using gs1::ai::make_error_code;
using gs1::ai::ParseOptions;
using gs1::ai::ParseResult;
using gs1::ai::Parser;

const gs1::dict::AiTable& table() {
  static const auto loaded = gs1::dict::load_embedded_syntax_dictionary();
  if (!loaded.table) {
    std::cerr << "embedded dictionary failed: " << loaded.error_message << "\n";
    std::exit(1);
  }
  return *loaded.table;
}

Parser parser(ParseOptions options = {}) { return Parser(table(), options); }

void expect_failed(const ParseResult& r, std::error_code expected, std::string_view message) {
  TEST_EXPECT_ERR(r.ec, expected);
  TEST_EXPECT_EQ(r.error_message, std::string(message));
  TEST_EXPECT(r.elements.empty());
  TEST_EXPECT(r.data_str.empty());
}

void test_parse_element_string() {
  const auto r = parser().parse_data_str("^010952123454321310ABC123^99TEST");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT_EQ(r.data_str, "^010952123454321310ABC123^99TEST");
  TEST_EXPECT_EQ(r.elements.size(), std::size_t{3});
  if (r.elements.size() == 3) {
    TEST_EXPECT_EQ(r.elements[0].ai, "01");
    TEST_EXPECT_EQ(r.elements[0].value, "09521234543213");
    TEST_EXPECT_EQ(r.elements[1].ai, "10");
    TEST_EXPECT_EQ(r.elements[1].value, "ABC123");
    TEST_EXPECT_EQ(r.elements[2].ai, "99");
    TEST_EXPECT_EQ(r.elements[2].value, "TEST");
    TEST_EXPECT(r.elements[0].entry == table().find("01"));
  }

  // 定长 AI 之后多余的 FNC1 被保留
  const auto tolerated = parser().parse_data_str("^0112312312312319^10ABC");
  TEST_EXPECT_OK(tolerated.ec);
  TEST_EXPECT_EQ(tolerated.data_str, "^0112312312312319^10ABC");
  TEST_EXPECT_EQ(tolerated.elements.size(), std::size_t{2});
}

void test_parse_bracketed() {
  const auto r = parser().parse_ai_data_str("(01)12312312312319(99)TESTING123");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT_EQ(r.data_str, "^011231231231231999TESTING123");
  TEST_EXPECT_EQ(r.elements.size(), std::size_t{2});

  const auto fnc1 = parser().parse_ai_data_str("(01)12312312312319(10)ABC(99)XYZ");
  TEST_EXPECT_OK(fnc1.ec);
  TEST_EXPECT_EQ(fnc1.data_str, "^011231231231231910ABC^99XYZ");

  const auto escaped = parser().parse_ai_data_str("(01)12312312312319(10)ABC\\(123(99)X");
  TEST_EXPECT_OK(escaped.ec);
  if (escaped.elements.size() == 3) {
    TEST_EXPECT_EQ(escaped.elements[1].value, "ABC(123");
  } else {
    TEST_FAIL("expected three elements");
  }
  TEST_EXPECT_VALUE(gs1::ai::to_bracketed(escaped.elements),
                    "(01)12312312312319(10)ABC\\(123(99)X");
}

void test_plain_and_bracketed_agree() {
  const std::string plain = "^011231231231231910ABC^99XYZ";
  const auto from_plain = parser().parse_data_str(plain);
  TEST_EXPECT_OK(from_plain.ec);

  const auto bracketed = gs1::ai::to_bracketed(from_plain.elements);
  TEST_EXPECT_VALUE(bracketed, "(01)12312312312319(10)ABC(99)XYZ");
  if (!bracketed) {
    return;
  }
  const auto from_bracketed = parser().parse_ai_data_str(*bracketed);
  TEST_EXPECT_OK(from_bracketed.ec);
  TEST_EXPECT_EQ(from_bracketed.data_str, plain);
}

void test_composite_data() {
  const auto r = parser().parse_data_str("^0112312312312319|^98XYZ");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT_EQ(r.data_str, "^0112312312312319|^98XYZ");
  TEST_EXPECT_EQ(r.elements.size(), std::size_t{3});
  if (r.elements.size() == 3) {
    TEST_EXPECT_EQ(r.elements[1].kind, ElementKind::composite_separator);
  }
  TEST_EXPECT_VALUE(gs1::ai::to_bracketed(r.elements), "(01)12312312312319|(98)XYZ");

  // 线性部分可为 EAN/UPC 主数据
  const auto ean = parser().parse_data_str("2112233789657|^99XYZ");
  TEST_EXPECT_OK(ean.ec);
  TEST_EXPECT_EQ(ean.data_str, "2112233789657|^99XYZ");

  const auto bracketed = parser().parse_ai_data_str("(01)12312312312319|(98)XYZ");
  TEST_EXPECT_OK(bracketed.ec);
  TEST_EXPECT_EQ(bracketed.data_str, "^0112312312312319|^98XYZ");
}

void test_non_ai_data() {
  const auto r = parser().parse_data_str("TESTING");
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT_EQ(r.data_str, "TESTING");
  TEST_EXPECT(r.elements.empty());
  TEST_EXPECT(!gs1::ai::to_bracketed(r.elements).has_value());
}

void test_element_string_errors() {
  expect_failed(parser().parse_element_string("0112312312312319"),
                make_error_code(errc::missing_fnc1), "Missing FNC1 in first position");
  expect_failed(parser().parse_data_str("^"), make_error_code(errc::empty_data),
                "The AI data is empty");
  expect_failed(parser().parse_data_str("^8999ABC"), make_error_code(errc::no_ai_for_prefix),
                "No known AI is a prefix of: 8999...");
  expect_failed(parser().parse_data_str("^011231231231231"),
                make_error_code(errc::value_too_short), "AI (01) value is too short");
  expect_failed(parser().parse_data_str("^10" + std::string(21, 'X')),
                make_error_code(errc::missing_separator), "AI (10) data is too long");

  const auto csum = parser().parse_data_str("^0112312312312318");
  TEST_EXPECT_ERR(csum.ec, gs1::lint::make_error_code(gs1::lint::errc::incorrect_check_digit));
  TEST_EXPECT_EQ(csum.error_message, "AI (01): The numeric check digit is incorrect.");
  TEST_EXPECT_EQ(csum.error_markup, "(01)1231231231231|8|");

  const auto yesno = parser().parse_data_str("^0112312312312319^43212");
  TEST_EXPECT_ERR(yesno.ec, gs1::lint::make_error_code(gs1::lint::errc::not_zero_or_one));
  TEST_EXPECT_EQ(yesno.error_markup, "(4321)|2|");
  TEST_EXPECT(yesno.elements.empty());
}

void test_bracketed_errors() {
  for (const char* bad : {"01)123", "(01", "(01)", ""}) {
    expect_failed(parser().parse_ai_data_str(bad), make_error_code(errc::malformed_ai_data),
                  "Failed to parse AI data");
  }
  expect_failed(parser().parse_ai_data_str("(2391)X"), make_error_code(errc::unrecognised_ai),
                "Unrecognised AI: 2391");
  expect_failed(parser().parse_ai_data_str("(10)" + std::string(21, 'X')),
                make_error_code(errc::value_too_long), "AI (10) value is too long");
  expect_failed(parser().parse_ai_data_str("(01)123"), make_error_code(errc::value_too_short),
                "AI (01) value is too short");
  expect_failed(parser().parse_ai_data_str("(10)AB^C"), make_error_code(errc::illegal_carat),
                "AI (10) contains illegal ^ character");

  const auto csum = parser().parse_ai_data_str("(01)12312312312318");
  TEST_EXPECT_EQ(csum.error_markup, "(01)1231231231231|8|");
}

void test_unknown_ais() {
  const auto rejected = parser().parse_data_str("^23912345");
  TEST_EXPECT_ERR(rejected.ec, make_error_code(errc::no_ai_for_prefix));

  ParseOptions permit;
  permit.permit_unknown_ais = true;
  const auto accepted = parser(permit).parse_data_str("^23912345");
  TEST_EXPECT_OK(accepted.ec);
  if (accepted.elements.size() == 1) {
    TEST_EXPECT_EQ(accepted.elements[0].ai, "239");
    TEST_EXPECT_EQ(accepted.elements[0].value, "12345");
    TEST_EXPECT(accepted.elements[0].entry->is_unknown());
  } else {
    TEST_FAIL("expected a single unknown AI element");
  }

  const auto bracketed = parser(permit).parse_ai_data_str("(89)ABC");
  TEST_EXPECT_OK(bracketed.ec);
  TEST_EXPECT_EQ(bracketed.data_str, "^89ABC");

  // 长度无从得知的未知 AI 在无分隔数据中仍无法切分
  const auto unsplittable = parser(permit).parse_data_str("^89ABC");
  TEST_EXPECT_ERR(unsplittable.ec, make_error_code(errc::no_ai_for_prefix));
}

void test_add_check_digit() {
  ParseOptions opts;
  opts.add_check_digit = true;

  const auto plain = parser(opts).parse_data_str("^011231231231231^10ABC");
  TEST_EXPECT_OK(plain.ec);
  TEST_EXPECT_EQ(plain.data_str, "^0112312312312319^10ABC");

  const auto bracketed = parser(opts).parse_ai_data_str("(01)1231231231231(10)ABC");
  TEST_EXPECT_OK(bracketed.ec);
  TEST_EXPECT_EQ(bracketed.data_str, "^011231231231231910ABC");

  // 完整长度的值照常校验
  const auto full = parser(opts).parse_ai_data_str("(01)12312312312318");
  TEST_EXPECT_ERR(full.ec, gs1::lint::make_error_code(gs1::lint::errc::incorrect_check_digit));
}

void test_limits() {
  std::string many;
  for (int i = 0; i < 65; ++i) {
    many += "^99A";
  }
  expect_failed(parser().parse_data_str(many), make_error_code(errc::too_many_ais),
                "Too many AIs");

  const auto too_long = parser().parse_data_str(std::string(8192, 'A'));
  TEST_EXPECT_ERR(too_long.ec, gs1::core::make_error_code(gs1::core::errc::data_too_long));
  const auto bracketed_too_long = parser().parse_ai_data_str(std::string(8192, 'A'));
  TEST_EXPECT_ERR(bracketed_too_long.ec,
                  gs1::core::make_error_code(gs1::core::errc::data_too_long));
}

void test_validate_ai_value_markup() {
  const auto* entry = table().find("8013");
  if (!entry) {
    TEST_FAIL("AI 8013 missing");
    return;
  }
  const auto good = gs1::ai::validate_ai_value(*entry, "8013", "1987654Ad4X4bL5ttr2310c2K");
  TEST_EXPECT_OK(good.ec);
  TEST_EXPECT_EQ(good.consumed, std::size_t{25});

  const auto bad = gs1::ai::validate_ai_value(*entry, "8013", "1987654Ad4X4bL5ttr2310c2L");
  TEST_EXPECT_EQ(bad.error_markup, "(8013)1987654Ad4X4bL5ttr2310c|2L|");

  const auto* gdti = table().find("253");
  if (gdti) {
    const auto serial = gs1::ai::validate_ai_value(*gdti, "253", "1234567890128ABC");
    TEST_EXPECT_OK(serial.ec);
    TEST_EXPECT_EQ(serial.consumed, std::size_t{16});
    const auto bad_serial = gs1::ai::validate_ai_value(*gdti, "253", "1234567890128A C");
    TEST_EXPECT_EQ(bad_serial.error_markup, "(253)1234567890128A| |C");
  }
}

void expect_lint_failure(std::string_view ai_data, gs1::lint::errc expected) {
  const auto r = parser().parse_ai_data_str(ai_data);
  if (r.ec != gs1::lint::make_error_code(expected)) {
    TEST_FAIL(std::string(ai_data) + ": [" + r.ec.message() + "] " + r.error_message);
  }
  TEST_EXPECT(r.elements.empty());
}

void test_component_linters() {
  using gs1::lint::errc;

  TEST_EXPECT_OK(parser().parse_ai_data_str("(00)123456789012345675").ec);
  TEST_EXPECT_OK(parser().parse_ai_data_str("(01)95012345678903(3103)000123").ec);
  TEST_EXPECT_OK(parser().parse_ai_data_str("(8007)GB82WEST12345698765432").ec);
  TEST_EXPECT_OK(parser().parse_ai_data_str("(7258)1/3").ec);

  expect_lint_failure("(00)A23456789012345675", errc::non_digit_character);
  expect_lint_failure("(00)123456789012345670", errc::incorrect_check_digit);
  expect_lint_failure("(01)95012345678902(3103)000123", errc::incorrect_check_digit);
  expect_lint_failure("(01)95012345678903(11)131313", errc::illegal_month);
  expect_lint_failure("(8010)123456_", errc::invalid_cset39_character);
  expect_lint_failure("(8030)ABC:123", errc::invalid_cset64_character);
  expect_lint_failure("(8030)123=", errc::invalid_cset64_padding);
  expect_lint_failure("(8013)123456ABXX", errc::incorrect_check_pair);
  expect_lint_failure("(8013)A", errc::too_short_for_check_pair);

  expect_lint_failure("(401)123", errc::too_short_for_gcp);
  expect_lint_failure("(7023)12A4", errc::invalid_gcp_prefix);
  expect_lint_failure("(7040)1AB=", errc::invalid_importer_idx_character);
  expect_lint_failure("(8001)12340000012311", errc::illegal_zero_value);
  expect_lint_failure("(8001)12341234512321", errc::invalid_winding_direction);
  expect_lint_failure("(8003)112345678901281234567890123456", errc::not_zero);
  expect_lint_failure("(8011)023456789012", errc::illegal_zero_prefix);
  expect_lint_failure("(4321)2", errc::not_zero_or_one);

  expect_lint_failure("(426)987", errc::not_iso3166);
  expect_lint_failure("(7030)987ABC", errc::not_iso3166_or_999);
  expect_lint_failure("(4307)AA", errc::not_iso3166_alpha2);
  expect_lint_failure("(3910)9870", errc::not_iso4217);
  expect_lint_failure("(8007)FR1234", errc::iban_too_short);
  expect_lint_failure("(8007)FR12_45678901234", errc::invalid_iban_character);
  expect_lint_failure("(8007)AB12345678901234", errc::illegal_iban_country_code);
  expect_lint_failure("(8007)FR12345678901234", errc::incorrect_iban_checksum);

  expect_lint_failure("(4326)201300", errc::illegal_month);
  expect_lint_failure("(4326)201200", errc::illegal_day);
  expect_lint_failure("(4324)2012252400", errc::illegal_hour);
  expect_lint_failure("(4324)2012252360", errc::illegal_minute);
  expect_lint_failure("(8008)201225230060", errc::illegal_second);

  expect_lint_failure("(8026)123456789012310099", errc::zero_piece_number);
  expect_lint_failure("(8026)123456789012310100", errc::zero_total_pieces);
  expect_lint_failure("(8026)123456789012310302", errc::piece_number_exceeds_total);
  expect_lint_failure("(4300)ABC%0g", errc::invalid_percent_sequence);

  expect_lint_failure("(4309)18000000010000000000", errc::invalid_latitude);
  expect_lint_failure("(4309)00000000003600000001", errc::invalid_longitude);
  expect_lint_failure("(4330)000000X", errc::not_hyphen);
  expect_lint_failure("(7252)5", errc::invalid_biological_sex_code);
  expect_lint_failure("(7258)111", errc::position_in_sequence_malformed);
  expect_lint_failure("(7258)0/3", errc::illegal_zero_prefix);
  expect_lint_failure("(7258)2/1", errc::position_exceeds_end);

  expect_lint_failure("(8112)201234561234560123456", errc::coupon_invalid_format_code);
  expect_lint_failure("(8112)07", errc::coupon_invalid_funder_length);
  expect_lint_failure("(8110)71234567890123", errc::coupon_invalid_gcp_length);
  expect_lint_failure("(8110)012345612345611110123900000", errc::coupon_excess_data);
}

void test_hri_rendering() {
  const auto r = parser().parse_data_str("^010952123454321310ABC123^99TEST");
  TEST_EXPECT_EQ(gs1::ai::render_hri(r.elements, false),
                 (std::vector<std::string>{"(01) 09521234543213", "(10) ABC123", "(99) TEST"}));
  TEST_EXPECT_EQ(gs1::ai::render_hri(r.elements, true),
                 (std::vector<std::string>{"GTIN (01) 09521234543213", "BATCH/LOT (10) ABC123",
                                           "INTERNAL (99) TEST"}));
}

}  // namespace

int main() {
  test_parse_element_string();
  test_parse_bracketed();
  test_plain_and_bracketed_agree();
  test_composite_data();
  test_non_ai_data();
  test_element_string_errors();
  test_bracketed_errors();
  test_unknown_ais();
  test_add_check_digit();
  test_limits();
  test_validate_ai_value_markup();
  test_component_linters();
  test_hri_rendering();
  return ::gs1::tests::run_and_report();
}
