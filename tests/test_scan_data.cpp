#include "gs1/ai/parser.hpp"
#include "gs1/core/error.hpp"
#include "gs1/dict/syntax_dictionary.hpp"
#include "gs1/scan/scan_data.hpp"
#include "gs1/scan/symbology.hpp"

#include "test_main.hpp"

#include <string>

namespace {

using gs1::scan::errc;
using gs1::scan::make_error_code;
using gs1::scan::Symbology;

const gs1::dict::AiTable& table() {
  static const auto loaded = gs1::dict::load_embedded_syntax_dictionary();
  if (!loaded.table) {
    std::cerr << "embedded dictionary failed: " << loaded.error_message << "\n";
    std::exit(1);
  }
  return *loaded.table;
}

gs1::scan::EncodeResult encode(Symbology sym, std::string_view data_str,
                               bool add_check_digit = false) {
  const gs1::ai::Parser parser(table(), {});
  const auto parsed = parser.parse_data_str(data_str);
  if (parsed.ec) {
    TEST_FAIL("parse failed: " + parsed.error_message);
  }
  return gs1::scan::encode_scan_data(sym, parsed.data_str, parsed.elements, add_check_digit);
}

void expect_encoded(Symbology sym, std::string_view data_str, std::string_view expected,
                    bool add_check_digit = false) {
  const auto r = encode(sym, data_str, add_check_digit);
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT_EQ(r.scan_data, std::string(expected));
}

void expect_encode_error(Symbology sym, std::string_view data_str, errc expected,
                         std::string_view message, bool add_check_digit = false) {
  const auto r = encode(sym, data_str, add_check_digit);
  TEST_EXPECT_ERR(r.ec, make_error_code(expected));
  TEST_EXPECT_EQ(r.error_message, std::string(message));
  TEST_EXPECT(r.scan_data.empty());
}

void test_encode_gs1_128_and_2d() {
  expect_encoded(Symbology::gs1_128_cca, "^011231231231231910ABC^99XYZ",
                 "]C1011231231231231910ABC\x1D" "99XYZ");
  expect_encoded(Symbology::qr, "^011231231231231910ABC^99XYZ",
                 "]Q3011231231231231910ABC\x1D" "99XYZ");
  expect_encoded(Symbology::dm, "^0112312312312319", "]d20112312312312319");
  expect_encoded(Symbology::dotcode, "^0112312312312319", "]J10112312312312319");

  expect_encoded(Symbology::qr, "TESTING", "]Q1TESTING");
  // 转义的前导 '^' 还原为数据字符
  expect_encoded(Symbology::qr, "\\^ABC", "]Q1^ABC");
  expect_encoded(Symbology::qr, "https://id.gs1.org/01/12312312312319",
                 "]Q1https://id.gs1.org/01/12312312312319");
}

void test_encode_composite() {
  expect_encoded(Symbology::gs1_128_cca, "^011231231231231910ABC|^99XYZ",
                 "]e0011231231231231910ABC\x1D" "99XYZ");
  expect_encoded(Symbology::gs1_128_ccc, "^0112312312312319|^99XYZ",
                 "]e0011231231231231999XYZ");
  expect_encoded(Symbology::databar_expanded, "^011231231231231910ABC",
                 "]e0011231231231231910ABC");
  expect_encoded(Symbology::databar_omni, "^0112312312312319|^10ABC",
                 "]e0011231231231231910ABC");
  expect_encoded(Symbology::ean13, "2112233789657|^99XYZ", "]E02112233789657|]e099XYZ");
}

void test_encode_linear_primary() {
  expect_encoded(Symbology::databar_omni, "^0109521234543213", "]e00109521234543213");
  expect_encoded(Symbology::databar_truncated, "09521234543213", "]e00109521234543213");
  expect_encoded(Symbology::databar_stacked, "0952123454321", "]e00109521234543213", true);
  expect_encoded(Symbology::databar_limited, "^0109521234543213", "]e00109521234543213");

  expect_encoded(Symbology::ean13, "^0102112233789657", "]E02112233789657");
  expect_encoded(Symbology::ean13, "2112233789657", "]E02112233789657");
  expect_encoded(Symbology::ean13, "211223378965", "]E02112233789657", true);
  expect_encoded(Symbology::ean8, "^0100000002345680", "]E402345680");
  expect_encoded(Symbology::ean8, "02345680", "]E402345680");
  expect_encoded(Symbology::upca, "^0100416000336108", "]E00416000336108");
  expect_encoded(Symbology::upce, "416000336108", "]E00416000336108");
}

void test_encode_errors() {
  expect_encode_error(Symbology::none, "^0112312312312319", errc::no_symbology,
                      "No symbology selected");
  expect_encode_error(Symbology::gs1_128_cca, "TESTING", errc::incompatible_data,
                      "GS1-128 requires AI data");
  expect_encode_error(Symbology::qr, "^0112312312312319|^99XYZ", errc::incompatible_data,
                      "Composite component is not supported by QR");
  expect_encode_error(Symbology::databar_limited, "^0124012345678905",
                      errc::primary_data_too_large, "Primary data item value is too large");
  expect_encode_error(Symbology::databar_omni, "0952123454321",
                      errc::primary_data_wrong_length, "Primary data must be 14 digits");
  expect_encode_error(Symbology::databar_omni, "095212345432", errc::primary_data_wrong_length,
                      "Primary data must be 13 digits without check digit", true);
  expect_encode_error(Symbology::ean13, "2112233789658",
                      errc::primary_data_check_digit_incorrect,
                      "Primary data check digit is incorrect");
  expect_encode_error(Symbology::ean8, "0234568A", errc::primary_data_not_digits,
                      "Primary data must be all digits");
  expect_encode_error(Symbology::upca, "2112233789657", errc::primary_data_wrong_length,
                      "Primary data must be 12 digits");
}

void expect_decoded(std::string_view scan_data, Symbology sym, std::string_view data_str) {
  const auto r = gs1::scan::decode_scan_data(scan_data);
  TEST_EXPECT_OK(r.ec);
  TEST_EXPECT_EQ(r.symbology, sym);
  TEST_EXPECT_EQ(r.data_str, std::string(data_str));
}

void expect_decode_error(std::string_view scan_data, errc expected, std::string_view message) {
  const auto r = gs1::scan::decode_scan_data(scan_data);
  TEST_EXPECT_ERR(r.ec, make_error_code(expected));
  TEST_EXPECT_EQ(r.error_message, std::string(message));
  TEST_EXPECT_EQ(r.symbology, Symbology::none);
  TEST_EXPECT(r.data_str.empty());
}

void test_decode() {
  expect_decoded("]C1011231231231231910ABC\x1D" "99XYZ", Symbology::gs1_128_cca,
                 "^011231231231231910ABC^99XYZ");
  expect_decoded("]e00109521234543213", Symbology::databar_expanded, "^0109521234543213");
  expect_decoded("]E02112233789657", Symbology::ean13, "2112233789657");
  expect_decoded("]E402345680", Symbology::ean8, "02345680");
  expect_decoded("]E02112233789657|]e099XYZ", Symbology::ean13, "2112233789657|^99XYZ");
  expect_decoded("]Q3011231231231231999XYZ", Symbology::qr, "^011231231231231999XYZ");
  expect_decoded("]Q1https://id.gs1.org/01/12312312312319", Symbology::qr,
                 "https://id.gs1.org/01/12312312312319");
  expect_decoded("]d1^ABC", Symbology::dm, "\\^ABC");
  expect_decoded("]J0TEXT", Symbology::dotcode, "TEXT");
}

void test_decode_errors() {
  expect_decode_error("abc", errc::missing_symbology_identifier, "Missing symbology identifier");
  expect_decode_error("]C", errc::missing_symbology_identifier, "Missing symbology identifier");
  expect_decode_error("]Z1abc", errc::unsupported_symbology_identifier,
                      "Unsupported symbology identifier");
  expect_decode_error("]E0211223378965", errc::primary_scan_data_too_short,
                      "Primary scan data is too short");
  expect_decode_error("]E02112233789657X", errc::primary_message_too_long,
                      "Primary message is too long");
  expect_decode_error("]E0211223378965A", errc::primary_message_not_digits,
                      "Primary message may only contain digits");
  expect_decode_error("]E02112233789658", errc::primary_message_check_digit_incorrect,
                      "Primary message check digit is incorrect");
  expect_decode_error("]C10112^3", errc::illegal_carat, "Scan data contains illegal ^ character");

  const auto too_long = gs1::scan::decode_scan_data("]Q1" + std::string(8192, 'A'));
  TEST_EXPECT_ERR(too_long.ec, gs1::core::make_error_code(gs1::core::errc::data_too_long));
}

void test_symbology_names() {
  TEST_EXPECT_EQ(gs1::scan::symbology_name(Symbology::qr), std::string_view("QR"));
  TEST_EXPECT_EQ(gs1::scan::symbology_name(Symbology::gs1_128_cca),
                 std::string_view("GS1_128_CCA"));
  TEST_EXPECT_EQ(gs1::scan::symbology_name(Symbology::none), std::string_view("NONE"));
  TEST_EXPECT_EQ(gs1::scan::symbology_from_index(-1), std::optional<Symbology>(Symbology::none));
  TEST_EXPECT_EQ(gs1::scan::symbology_from_index(14),
                 std::optional<Symbology>(Symbology::dotcode));
  TEST_EXPECT(!gs1::scan::symbology_from_index(15).has_value());
  TEST_EXPECT(!gs1::scan::symbology_from_index(-2).has_value());
}

void test_error_category() {
  const auto ec = make_error_code(errc::illegal_carat);
  TEST_EXPECT_EQ(std::string_view(ec.category().name()), "gs1.scan");
  TEST_EXPECT_EQ(ec.message(), "scan data contains illegal ^ character");
  std::error_code unknown(999, gs1::scan::error_category());
  TEST_EXPECT_EQ(unknown.message(), "unknown gs1.scan error");
}

}  // namespace

int main() {
  test_encode_gs1_128_and_2d();
  test_encode_composite();
  test_encode_linear_primary();
  test_encode_errors();
  test_decode();
  test_decode_errors();
  test_symbology_names();
  test_error_category();
  return ::gs1::tests::run_and_report();
}
