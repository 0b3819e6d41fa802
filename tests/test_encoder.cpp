#include "gs1/encoder.hpp"

#include "gs1/ai/element.hpp"
#include "gs1/core/error.hpp"
#include "gs1/dict/syntax_dictionary.hpp"
#include "gs1/dl/uri.hpp"
#include "gs1/lint/linters.hpp"
#include "gs1/scan/scan_data.hpp"

#include "test_main.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

using gs1::Encoder;
using gs1::ErrorKind;
using gs1::ai::Validation;
using gs1::scan::Symbology;
using Lines = std::vector<std::string>;

void test_defaults() {
  Encoder enc;
  TEST_EXPECT(enc.initialized());
  TEST_EXPECT(!Encoder::version().empty());
  TEST_EXPECT_EQ(enc.symbology(), Symbology::none);
  TEST_EXPECT(!enc.add_check_digit());
  TEST_EXPECT(!enc.permit_unknown_ais());
  TEST_EXPECT(!enc.permit_zero_suppressed_gtin_in_dl_uris());
  TEST_EXPECT(!enc.permit_convenience_alphas_in_dl_uris());
  TEST_EXPECT(!enc.include_data_titles_in_hri());
  TEST_EXPECT(enc.validation_enabled(Validation::requisite_ais));
  TEST_EXPECT(enc.data_str().empty());
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::none);
}

void test_hri_with_titles() {
  Encoder enc;
  enc.set_include_data_titles_in_hri(true);
  TEST_EXPECT_OK(enc.set_data_str("^010952123454321310ABC123^99TEST"));
  TEST_EXPECT_EQ(enc.hri(), (Lines{"GTIN (01) 09521234543213", "BATCH/LOT (10) ABC123",
                                   "INTERNAL (99) TEST"}));
  TEST_EXPECT_VALUE(enc.ai_data_str(), "(01)09521234543213(10)ABC123(99)TEST");

  enc.set_include_data_titles_in_hri(false);
  TEST_EXPECT_EQ(enc.hri(),
                 (Lines{"(01) 09521234543213", "(10) ABC123", "(99) TEST"}));
}

void test_bracketed_to_dl_uri() {
  Encoder enc;
  TEST_EXPECT_OK(enc.set_ai_data_str("(01)12312312312319(99)TESTING123"));
  TEST_EXPECT_EQ(enc.data_str(), "^011231231231231999TESTING123");
  TEST_EXPECT_VALUE(enc.dl_uri(), "https://id.gs1.org/01/12312312312319?99=TESTING123");
  TEST_EXPECT_VALUE(enc.dl_uri(std::string_view("https://example.com/")),
                    "https://example.com/01/12312312312319?99=TESTING123");
}

void test_dl_uri_input() {
  Encoder enc;
  const std::string uri = "https://id.gs1.org/01/12312312312319?singleton&compound=XYZ";
  TEST_EXPECT_OK(enc.set_data_str(uri));
  TEST_EXPECT_EQ(enc.data_str(), uri);
  TEST_EXPECT_EQ(enc.dl_ignored_query_params(), (Lines{"singleton", "compound=XYZ"}));
  TEST_EXPECT_EQ(enc.hri(), Lines{"(01) 12312312312319"});
  TEST_EXPECT_VALUE(enc.ai_data_str(), "(01)12312312312319");

  // 路径中的零抑制 GTIN 需显式放行
  TEST_EXPECT_ERR(enc.set_data_str("https://id.gs1.org/01/2112233789657"),
                  gs1::ai::make_error_code(gs1::ai::errc::value_too_short));
  enc.set_permit_zero_suppressed_gtin_in_dl_uris(true);
  TEST_EXPECT_OK(enc.set_data_str("https://id.gs1.org/01/2112233789657"));
  TEST_EXPECT_VALUE(enc.ai_data_str(), "(01)02112233789657");

  TEST_EXPECT_ERR(enc.set_data_str("https://id.gs1.org/gtin/12312312312319"),
                  gs1::dl::make_error_code(gs1::dl::errc::no_key_in_path));
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::digital_link);
  enc.set_permit_convenience_alphas_in_dl_uris(true);
  TEST_EXPECT_OK(enc.set_data_str("https://id.gs1.org/gtin/12312312312319"));

  // DL 数据同样经过组合规则校验
  TEST_EXPECT_ERR(enc.set_data_str("https://id.gs1.org/01/12312312312319?37=5"),
                  gs1::ai::make_error_code(gs1::ai::errc::mutex_ais));
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::parameter);
}

void test_requisite_toggle() {
  Encoder enc;
  auto ec = enc.set_ai_data_str("(02)12312312312319");
  TEST_EXPECT_ERR(ec, gs1::ai::make_error_code(gs1::ai::errc::requisite_not_satisfied));
  TEST_EXPECT_EQ(enc.err_msg(), "Required AIs for AI (02) are not satisfied: 37");
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::parameter);
  TEST_EXPECT_EQ(enc.last_error(), ec);

  TEST_EXPECT_OK(enc.set_validation_enabled(Validation::requisite_ais, false));
  TEST_EXPECT_OK(enc.set_ai_data_str("(02)12312312312319"));
  TEST_EXPECT_EQ(enc.data_str(), "^0212312312312319");

  TEST_EXPECT_OK(enc.set_validation_enabled(Validation::requisite_ais, true));
  TEST_EXPECT_ERR(enc.set_ai_data_str("(02)12312312312319"),
                  gs1::ai::make_error_code(gs1::ai::errc::requisite_not_satisfied));
}

void test_locked_validation() {
  Encoder enc;
  TEST_EXPECT_ERR(enc.set_validation_enabled(Validation::repeated_ais, false),
                  gs1::core::make_error_code(gs1::core::errc::validation_locked));
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::parameter);
  TEST_EXPECT(!enc.err_msg().empty());
  TEST_EXPECT(enc.validation_enabled(Validation::repeated_ais));

  TEST_EXPECT_ERR(enc.set_ai_data_str("(01)12312312312319(10)A(10)B"),
                  gs1::ai::make_error_code(gs1::ai::errc::repeated_ai));
  TEST_EXPECT_OK(enc.set_ai_data_str("(01)12312312312319(10)A(10)A"));
}

void test_failed_input_keeps_previous_state() {
  Encoder enc;
  TEST_EXPECT_OK(enc.set_ai_data_str("(01)12312312312319(10)ABC"));
  const auto before = enc.data_str();
  const auto hri_before = enc.hri();

  const auto ec = enc.set_ai_data_str("(01)12312312312318");
  TEST_EXPECT_ERR(ec, gs1::lint::make_error_code(gs1::lint::errc::incorrect_check_digit));
  TEST_EXPECT_EQ(enc.err_msg(), "AI (01): The numeric check digit is incorrect.");
  TEST_EXPECT_EQ(enc.err_markup(), "(01)1231231231231|8|");
  TEST_EXPECT_EQ(enc.data_str(), before);
  TEST_EXPECT_EQ(enc.hri(), hri_before);

  // 成功的操作清除上一次的错误
  TEST_EXPECT_OK(enc.set_data_str("^0112312312312319"));
  TEST_EXPECT(enc.err_msg().empty());
  TEST_EXPECT(enc.err_markup().empty());
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::none);
  TEST_EXPECT(!enc.last_error());

  TEST_EXPECT_ERR(enc.set_data_str(std::string(8192, 'A')),
                  gs1::core::make_error_code(gs1::core::errc::data_too_long));
  TEST_EXPECT_EQ(enc.data_str(), "^0112312312312319");
}

void test_dl_uri_without_primary_key() {
  Encoder enc;
  TEST_EXPECT_OK(enc.set_ai_data_str("(99)ABC"));
  TEST_EXPECT(!enc.dl_uri().has_value());
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::digital_link);
  TEST_EXPECT_EQ(enc.err_msg(), "Cannot create a DL URI without a primary key AI");
}

void test_non_ai_data() {
  Encoder enc;
  TEST_EXPECT_OK(enc.set_data_str("TESTING"));
  TEST_EXPECT_EQ(enc.data_str(), "TESTING");
  TEST_EXPECT(!enc.ai_data_str().has_value());
  TEST_EXPECT(enc.hri().empty());
}

void test_scan_data_round_trip() {
  Encoder enc;
  TEST_EXPECT(!enc.scan_data().has_value());
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::scan_data);

  TEST_EXPECT_OK(enc.set_symbology(Symbology::gs1_128_cca));
  TEST_EXPECT_OK(enc.set_ai_data_str("(01)12312312312319(10)ABC(99)XYZ"));
  const auto scan = enc.scan_data();
  TEST_EXPECT_VALUE(scan, "]C1011231231231231910ABC\x1D" "99XYZ");
  if (!scan) {
    return;
  }

  Encoder reader;
  TEST_EXPECT_OK(reader.set_scan_data(*scan));
  TEST_EXPECT_EQ(reader.symbology(), Symbology::gs1_128_cca);
  TEST_EXPECT_VALUE(reader.ai_data_str(), "(01)12312312312319(10)ABC(99)XYZ");

  TEST_EXPECT_OK(reader.set_scan_data("]Q1https://id.gs1.org/01/12312312312319"));
  TEST_EXPECT_EQ(reader.symbology(), Symbology::qr);
  TEST_EXPECT_EQ(reader.data_str(), "https://id.gs1.org/01/12312312312319");
  TEST_EXPECT_VALUE(reader.scan_data(), "]Q1https://id.gs1.org/01/12312312312319");
}

void test_set_scan_data_failure_keeps_symbology() {
  Encoder enc;
  TEST_EXPECT_OK(enc.set_symbology(Symbology::qr));
  TEST_EXPECT_ERR(enc.set_scan_data("]Z1xx"),
                  gs1::scan::make_error_code(gs1::scan::errc::unsupported_symbology_identifier));
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::scan_data);
  TEST_EXPECT_EQ(enc.symbology(), Symbology::qr);

  // 标识符合法但内容不合法
  TEST_EXPECT_ERR(enc.set_scan_data("]C10112312312312318"),
                  gs1::lint::make_error_code(gs1::lint::errc::incorrect_check_digit));
  TEST_EXPECT_EQ(enc.symbology(), Symbology::qr);

  TEST_EXPECT_ERR(enc.set_symbology(static_cast<Symbology>(99)),
                  gs1::core::make_error_code(gs1::core::errc::unknown_symbology));
  TEST_EXPECT_EQ(enc.symbology(), Symbology::qr);
}

void test_add_check_digit() {
  Encoder enc;
  enc.set_add_check_digit(true);
  TEST_EXPECT(enc.add_check_digit());
  TEST_EXPECT_OK(enc.set_ai_data_str("(01)1231231231231"));
  TEST_EXPECT_EQ(enc.data_str(), "^0112312312312319");

  TEST_EXPECT_OK(enc.set_symbology(Symbology::ean13));
  TEST_EXPECT_OK(enc.set_data_str("211223378965"));
  TEST_EXPECT_VALUE(enc.scan_data(), "]E02112233789657");
}

void test_unknown_ais() {
  Encoder enc;
  TEST_EXPECT_ERR(enc.set_ai_data_str("(89)ABC"),
                  gs1::ai::make_error_code(gs1::ai::errc::unrecognised_ai));

  enc.set_permit_unknown_ais(true);
  enc.set_include_data_titles_in_hri(true);
  TEST_EXPECT_OK(enc.set_ai_data_str("(01)12312312312319(89)ABC"));
  TEST_EXPECT_EQ(enc.hri(), (Lines{"GTIN (01) 12312312312319", "UNKNOWN (89) ABC"}));

  TEST_EXPECT(!enc.dl_uri().has_value());
  TEST_EXPECT_ERR(enc.last_error(), gs1::dl::make_error_code(gs1::dl::errc::not_data_attribute));

  TEST_EXPECT_OK(enc.set_validation_enabled(Validation::unknown_ai_not_dl_attr, false));
  TEST_EXPECT_VALUE(enc.dl_uri(), "https://id.gs1.org/01/12312312312319?89=ABC");
}

void test_options_constructor() {
  gs1::EncoderOptions options;
  options.symbology = Symbology::dm;
  options.include_data_titles_in_hri = true;
  options.validations[static_cast<std::size_t>(Validation::requisite_ais)] = false;
  options.validations[static_cast<std::size_t>(Validation::mutex_ais)] = false;

  Encoder enc(options);
  TEST_EXPECT_EQ(enc.symbology(), Symbology::dm);
  TEST_EXPECT(enc.include_data_titles_in_hri());
  TEST_EXPECT(!enc.validation_enabled(Validation::requisite_ais));
  // 锁定的规则不受初始选项影响
  TEST_EXPECT(enc.validation_enabled(Validation::mutex_ais));
  TEST_EXPECT_OK(enc.set_ai_data_str("(02)12312312312319"));
}

void test_load_syntax_dictionary() {
  Encoder enc;
  TEST_EXPECT_OK(enc.set_ai_data_str("(10)ABC(01)12312312312319"));

  TEST_EXPECT_ERR(enc.load_syntax_dictionary("/nonexistent/gs1-dict.txt"),
                  gs1::dict::make_error_code(gs1::dict::errc::cannot_read_file));
  TEST_EXPECT_EQ(enc.error_kind(), ErrorKind::parameter);
  TEST_EXPECT_EQ(enc.data_str(), "^10ABC^0112312312312319");

  const auto path = std::filesystem::temp_directory_path() / "gs1syntax_encoder_dict.txt";
  {
    std::ofstream out(path, std::ios::binary);
    out << "01 *? N14,csum dlpkey # GTIN\n";
    out << "99  ? X..90 # INTERNAL\n";
  }
  TEST_EXPECT_OK(enc.load_syntax_dictionary(path.string()));
  TEST_EXPECT(enc.data_str().empty());
  TEST_EXPECT_OK(enc.set_ai_data_str("(01)12312312312319(99)X"));
  TEST_EXPECT_ERR(enc.set_ai_data_str("(10)ABC"),
                  gs1::ai::make_error_code(gs1::ai::errc::unrecognised_ai));

  std::error_code rm_ec;
  std::filesystem::remove(path, rm_ec);
}

}  // namespace

int main() {
  test_defaults();
  test_hri_with_titles();
  test_bracketed_to_dl_uri();
  test_dl_uri_input();
  test_requisite_toggle();
  test_locked_validation();
  test_failed_input_keeps_previous_state();
  test_dl_uri_without_primary_key();
  test_non_ai_data();
  test_scan_data_round_trip();
  test_set_scan_data_failure_keeps_symbology();
  test_add_check_digit();
  test_unknown_ais();
  test_options_constructor();
  test_load_syntax_dictionary();
  return ::gs1::tests::run_and_report();
}
