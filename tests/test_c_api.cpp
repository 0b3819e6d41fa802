#include "gs1/c_api.h"

#include "test_main.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace {

// 取出 C 字符串并释放
std::string take_string(char *s) {
    if (!s) {
        return {};
    }
    std::string out(s);
    gs1_free(s);
    return out;
}

std::vector<std::string> take_list(char **lines, size_t n) {
    std::vector<std::string> out;
    for (size_t i = 0; i < n; ++i) {
        out.emplace_back(lines[i]);
    }
    gs1_string_list_free(lines, n);
    return out;
}

std::string error_text(gs1_error_t err) { return take_string(gs1_error_message(err)); }

bool is_c_api_error(gs1_error_t err, gs1_c_api_errc_t code) {
    return err.value == static_cast<int>(code) && err.category &&
           std::strcmp(err.category, "gs1.c_api") == 0;
}

gs1_encoder_t *make_encoder() {
    gs1_encoder_t *ctx = nullptr;
    const auto err = gs1_encoder_create(&ctx);
    TEST_EXPECT(gs1_error_is_ok(err));
    TEST_EXPECT(ctx != nullptr);
    return ctx;
}

void test_version_and_messages() {
    const char *version = gs1_version_string();
    TEST_EXPECT(version != nullptr);
    TEST_EXPECT(version && std::strlen(version) > 0);

    TEST_EXPECT_EQ(error_text(gs1_error_t{0, "gs1.c_api"}), "ok");
    TEST_EXPECT_EQ(error_text(gs1_error_t{GS1_C_API_INVALID_ARGUMENT, "gs1.c_api"}),
                   "invalid argument");
    TEST_EXPECT_EQ(error_text(gs1_error_t{4, "gs1.core"}), "this validation cannot be amended");
    TEST_EXPECT_EQ(error_text(gs1_error_t{3, "no.such"}), "unknown error category: no.such (3)");

    TEST_EXPECT(gs1_error_is_ok(gs1_log_set_level(GS1_LOG_WARN)));
    TEST_EXPECT(is_c_api_error(gs1_log_set_level(static_cast<gs1_log_level_t>(42)),
                               GS1_C_API_INVALID_ARGUMENT));
}

void test_null_arguments() {
    TEST_EXPECT(is_c_api_error(gs1_encoder_create(nullptr), GS1_C_API_INVALID_ARGUMENT));
    TEST_EXPECT(is_c_api_error(gs1_encoder_set_data_str(nullptr, "^0112312312312319"),
                               GS1_C_API_INVALID_ARGUMENT));

    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    int sym = 0;
    TEST_EXPECT(is_c_api_error(gs1_encoder_set_ai_data_str(ctx, nullptr),
                               GS1_C_API_INVALID_ARGUMENT));
    TEST_EXPECT(is_c_api_error(gs1_encoder_get_data_str(ctx, nullptr),
                               GS1_C_API_INVALID_ARGUMENT));
    TEST_EXPECT(is_c_api_error(gs1_encoder_get_symbology(nullptr, &sym),
                               GS1_C_API_INVALID_ARGUMENT));
    TEST_EXPECT_EQ(std::string(gs1_encoder_err_msg(nullptr)), "");
    TEST_EXPECT_EQ(gs1_encoder_error_kind(nullptr), static_cast<int>(GS1_ERROR_KIND_NONE));

    // 空句柄可安全销毁
    gs1_encoder_destroy(nullptr);
    gs1_encoder_destroy(ctx);
}

void test_options() {
    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    int value = -1;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_symbology(ctx, &value)));
    TEST_EXPECT_EQ(value, static_cast<int>(GS1_SYM_NONE));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_symbology(ctx, GS1_SYM_QR)));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_symbology(ctx, &value)));
    TEST_EXPECT_EQ(value, static_cast<int>(GS1_SYM_QR));

    const auto bad_sym = gs1_encoder_set_symbology(ctx, GS1_SYM_NUMSYMS);
    TEST_EXPECT(!gs1_error_is_ok(bad_sym));
    TEST_EXPECT_EQ(std::string(bad_sym.category), "gs1.core");

    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_add_check_digit(ctx, &value)));
    TEST_EXPECT_EQ(value, 0);
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_add_check_digit(ctx, 1)));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_add_check_digit(ctx, &value)));
    TEST_EXPECT_EQ(value, 1);

    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_permit_unknown_ais(ctx, 1)));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_permit_unknown_ais(ctx, &value)));
    TEST_EXPECT_EQ(value, 1);

    TEST_EXPECT(
        gs1_error_is_ok(gs1_encoder_get_validation_enabled(ctx, GS1_VALIDATION_REQUISITE_AIS,
                                                           &value)));
    TEST_EXPECT_EQ(value, 1);
    TEST_EXPECT(gs1_error_is_ok(
        gs1_encoder_set_validation_enabled(ctx, GS1_VALIDATION_REQUISITE_AIS, 0)));
    TEST_EXPECT(
        gs1_error_is_ok(gs1_encoder_get_validation_enabled(ctx, GS1_VALIDATION_REQUISITE_AIS,
                                                           &value)));
    TEST_EXPECT_EQ(value, 0);

    const auto unknown = gs1_encoder_get_validation_enabled(ctx, 17, &value);
    TEST_EXPECT_EQ(std::string(unknown.category), "gs1.core");
    TEST_EXPECT_EQ(error_text(unknown), "unknown validation");

    gs1_encoder_destroy(ctx);
}

void test_locked_validation() {
    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    const auto err = gs1_encoder_set_validation_enabled(ctx, GS1_VALIDATION_MUTEX_AIS, 0);
    TEST_EXPECT(!gs1_error_is_ok(err));
    TEST_EXPECT_EQ(std::string(err.category), "gs1.core");
    TEST_EXPECT_EQ(error_text(err), "this validation cannot be amended");
    TEST_EXPECT_EQ(gs1_encoder_error_kind(ctx), static_cast<int>(GS1_ERROR_KIND_PARAMETER));
    TEST_EXPECT(std::strlen(gs1_encoder_err_msg(ctx)) > 0);
    gs1_encoder_destroy(ctx);
}

void test_data_and_hri() {
    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_data_str(ctx, "^010952123454321310ABC123^99TEST")));

    char **lines = nullptr;
    size_t n = 0;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_hri(ctx, &lines, &n)));
    TEST_EXPECT_EQ(take_list(lines, n),
                   (std::vector<std::string>{"(01) 09521234543213", "(10) ABC123", "(99) TEST"}));

    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_include_data_titles_in_hri(ctx, 1)));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_hri(ctx, &lines, &n)));
    const auto titled = take_list(lines, n);
    TEST_EXPECT_EQ(titled.size(), static_cast<size_t>(3));
    TEST_EXPECT(!titled.empty() && titled[0] == "GTIN (01) 09521234543213");

    char *s = nullptr;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_ai_data_str(ctx, &s)));
    TEST_EXPECT_EQ(take_string(s), "(01)09521234543213(10)ABC123(99)TEST");

    // 非 AI 数据：AI 字符串为空，HRI 为空列表
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_data_str(ctx, "TESTING")));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_ai_data_str(ctx, &s)));
    TEST_EXPECT(s == nullptr);
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_data_str(ctx, &s)));
    TEST_EXPECT_EQ(take_string(s), "TESTING");
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_hri(ctx, &lines, &n)));
    TEST_EXPECT(lines == nullptr);
    TEST_EXPECT_EQ(n, static_cast<size_t>(0));

    gs1_encoder_destroy(ctx);
}

void test_dl_uri() {
    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_ai_data_str(ctx, "(01)12312312312319(99)TESTING123")));

    char *uri = nullptr;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_dl_uri(ctx, nullptr, &uri)));
    TEST_EXPECT_EQ(take_string(uri), "https://id.gs1.org/01/12312312312319?99=TESTING123");
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_dl_uri(ctx, "https://example.com", &uri)));
    TEST_EXPECT_EQ(take_string(uri), "https://example.com/01/12312312312319?99=TESTING123");

    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_data_str(
        ctx, "https://id.gs1.org/01/12312312312319?99=ABC&foo=bar")));
    char **params = nullptr;
    size_t n = 0;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_dl_ignored_query_params(ctx, &params, &n)));
    TEST_EXPECT_EQ(take_list(params, n), std::vector<std::string>{"foo=bar"});

    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_ai_data_str(ctx, "(99)ABC")));
    const auto err = gs1_encoder_get_dl_uri(ctx, nullptr, &uri);
    TEST_EXPECT(!gs1_error_is_ok(err));
    TEST_EXPECT(uri == nullptr);
    TEST_EXPECT_EQ(std::string(err.category), "gs1.dl");
    TEST_EXPECT_EQ(gs1_encoder_error_kind(ctx), static_cast<int>(GS1_ERROR_KIND_DIGITAL_LINK));

    gs1_encoder_destroy(ctx);
}

void test_error_path() {
    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_ai_data_str(ctx, "(01)12312312312319")));

    const auto err = gs1_encoder_set_ai_data_str(ctx, "(02)12312312312319");
    TEST_EXPECT(!gs1_error_is_ok(err));
    TEST_EXPECT_EQ(std::string(err.category), "gs1.ai");
    TEST_EXPECT_EQ(std::string(gs1_encoder_err_msg(ctx)),
                   "Required AIs for AI (02) are not satisfied: 37");
    TEST_EXPECT_EQ(gs1_encoder_error_kind(ctx), static_cast<int>(GS1_ERROR_KIND_PARAMETER));

    // 失败不改变已提交的数据
    char *s = nullptr;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_data_str(ctx, &s)));
    TEST_EXPECT_EQ(take_string(s), "^0112312312312319");

    const auto bad_digit = gs1_encoder_set_ai_data_str(ctx, "(01)12312312312318");
    TEST_EXPECT_EQ(std::string(bad_digit.category), "gs1.lint");
    TEST_EXPECT_EQ(std::string(gs1_encoder_err_markup(ctx)), "(01)1231231231231|8|");

    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_ai_data_str(ctx, "(01)12312312312319")));
    TEST_EXPECT_EQ(std::string(gs1_encoder_err_msg(ctx)), "");
    TEST_EXPECT_EQ(gs1_encoder_error_kind(ctx), static_cast<int>(GS1_ERROR_KIND_NONE));

    gs1_encoder_destroy(ctx);
}

void test_scan_data() {
    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    char *scan = nullptr;
    const auto no_sym = gs1_encoder_get_scan_data(ctx, &scan);
    TEST_EXPECT(!gs1_error_is_ok(no_sym));
    TEST_EXPECT(scan == nullptr);
    TEST_EXPECT_EQ(gs1_encoder_error_kind(ctx), static_cast<int>(GS1_ERROR_KIND_SCAN_DATA));

    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_symbology(ctx, GS1_SYM_GS1_128_CCA)));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_ai_data_str(ctx, "(01)12312312312319(10)ABC(99)XYZ")));
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_scan_data(ctx, &scan)));
    const auto encoded = take_string(scan);
    TEST_EXPECT_EQ(encoded, "]C1011231231231231910ABC\x1D" "99XYZ");

    gs1_encoder_t *reader = make_encoder();
    if (!reader) {
        gs1_encoder_destroy(ctx);
        return;
    }
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_set_scan_data(reader, encoded.c_str())));
    int sym = GS1_SYM_NONE;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_symbology(reader, &sym)));
    TEST_EXPECT_EQ(sym, static_cast<int>(GS1_SYM_GS1_128_CCA));
    char *ai = nullptr;
    TEST_EXPECT(gs1_error_is_ok(gs1_encoder_get_ai_data_str(reader, &ai)));
    TEST_EXPECT_EQ(take_string(ai), "(01)12312312312319(10)ABC(99)XYZ");

    const auto bad = gs1_encoder_set_scan_data(reader, "]Z1xx");
    TEST_EXPECT_EQ(std::string(bad.category), "gs1.scan");
    TEST_EXPECT_EQ(gs1_encoder_error_kind(reader), static_cast<int>(GS1_ERROR_KIND_SCAN_DATA));

    gs1_encoder_destroy(reader);
    gs1_encoder_destroy(ctx);
}

void test_load_missing_dictionary() {
    gs1_encoder_t *ctx = make_encoder();
    if (!ctx) {
        return;
    }
    const auto err =
        gs1_encoder_load_syntax_dictionary(ctx, "/nonexistent/gs1-syntax-dictionary.txt");
    TEST_EXPECT(!gs1_error_is_ok(err));
    TEST_EXPECT(std::strlen(gs1_encoder_err_msg(ctx)) > 0);
    gs1_encoder_destroy(ctx);
}

} // namespace

int main() {
    test_version_and_messages();
    test_null_arguments();
    test_options();
    test_locked_validation();
    test_data_and_hri();
    test_dl_uri();
    test_error_path();
    test_scan_data();
    test_load_missing_dictionary();
    return ::gs1::tests::run_and_report();
}
