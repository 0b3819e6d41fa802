#include "gs1/c_api.h"

#include "gs1/ai/element.hpp"
#include "gs1/core/error.hpp"
#include "gs1/core/log.hpp"
#include "gs1/dict/syntax_dictionary.hpp"
#include "gs1/dl/uri.hpp"
#include "gs1/encoder.hpp"
#include "gs1/lint/linters.hpp"
#include "gs1/scan/scan_data.hpp"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <exception>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

/*
 * C API（C ABI）实现文件。
 *
 * 本文件实现 `include/gs1/c_api.h` 中声明的 C 语言接口，把 gs1::Encoder
 * 包装为不透明句柄。
 *
 * 错误与内存约定：
 * - 错误统一用 `gs1_error_t{value, category}` 表达，对应 C++ 的 std::error_code；
 * - 跨 ABI 返回的堆内存统一使用 `gs1_malloc/gs1_free`（malloc/free），避免跨
 *   CRT/运行时导致的释放不匹配；
 * - C++ 异常禁止跨越 C 边界：内部捕获并映射到 `gs1.c_api` 错误域。
 */

// -----------------------------------------------------------------------------
// 不透明句柄的真实定义（只在 C++ 实现文件内可见）
// -----------------------------------------------------------------------------

struct gs1_encoder final {
    gs1::Encoder encoder{};
};

namespace {

constexpr const char *kCApiCategory = "gs1.c_api";

[[nodiscard]] gs1_error_t ok() noexcept {
    return gs1_error_t{0, kCApiCategory};
}

[[nodiscard]] gs1_error_t c_api_err(gs1_c_api_errc_t code) noexcept {
    return gs1_error_t{static_cast<int>(code), kCApiCategory};
}

[[nodiscard]] gs1_error_t from_error_code(const std::error_code &ec) noexcept {
    if (!ec) {
        return ok();
    }
    return gs1_error_t{ec.value(), ec.category().name()};
}

[[nodiscard]] const std::error_category *
category_from_name(const char *name) noexcept {
    if (name == nullptr) {
        return nullptr;
    }

    // 本库自定义错误域
    if (std::strcmp(name, gs1::core::error_category().name()) == 0) {
        return &gs1::core::error_category();
    }
    if (std::strcmp(name, gs1::dict::error_category().name()) == 0) {
        return &gs1::dict::error_category();
    }
    if (std::strcmp(name, gs1::lint::error_category().name()) == 0) {
        return &gs1::lint::error_category();
    }
    if (std::strcmp(name, gs1::ai::error_category().name()) == 0) {
        return &gs1::ai::error_category();
    }
    if (std::strcmp(name, gs1::dl::error_category().name()) == 0) {
        return &gs1::dl::error_category();
    }
    if (std::strcmp(name, gs1::scan::error_category().name()) == 0) {
        return &gs1::scan::error_category();
    }

    // 标准错误域
    if (std::strcmp(name, std::system_category().name()) == 0) {
        return &std::system_category();
    }
    if (std::strcmp(name, std::generic_category().name()) == 0) {
        return &std::generic_category();
    }

    return nullptr;
}

[[nodiscard]] std::string c_api_message_for(int value) {
    switch (static_cast<gs1_c_api_errc_t>(value)) {
    case GS1_C_API_OK:
        return "ok";
    case GS1_C_API_INVALID_ARGUMENT:
        return "invalid argument";
    case GS1_C_API_OUT_OF_MEMORY:
        return "out of memory";
    case GS1_C_API_EXCEPTION:
        return "exception caught inside C API";
    }
    return "unknown gs1.c_api error";
}

[[nodiscard]] char *dup_string(std::string_view s) noexcept {
    // 返回给 C 的字符串统一走 malloc/free，避免跨 CRT 问题。
    auto *out = static_cast<char *>(std::malloc(s.size() + 1));
    if (!out) {
        return nullptr;
    }
    std::memcpy(out, s.data(), s.size());
    out[s.size()] = '\0';
    return out;
}

[[nodiscard]] gs1_error_t
copy_string_out(const std::string &s, char **out) noexcept {
    *out = dup_string(s);
    if (!*out) {
        return c_api_err(GS1_C_API_OUT_OF_MEMORY);
    }
    return ok();
}

[[nodiscard]] gs1_error_t
copy_list_out(const std::vector<std::string> &items, char ***out, size_t *out_n) noexcept {
    *out = nullptr;
    *out_n = 0;
    if (items.empty()) {
        return ok();
    }

    auto **lines = static_cast<char **>(std::malloc(items.size() * sizeof(char *)));
    if (!lines) {
        return c_api_err(GS1_C_API_OUT_OF_MEMORY);
    }
    for (size_t i = 0; i < items.size(); ++i) {
        lines[i] = dup_string(items[i]);
        if (!lines[i]) {
            gs1_string_list_free(lines, i);
            return c_api_err(GS1_C_API_OUT_OF_MEMORY);
        }
    }
    *out = lines;
    *out_n = items.size();
    return ok();
}

template <class Fn>
gs1_error_t guard_error(Fn &&fn) noexcept {
    try {
        return fn();
    } catch (const std::bad_alloc &) {
        return c_api_err(GS1_C_API_OUT_OF_MEMORY);
    } catch (const std::exception &) {
        return c_api_err(GS1_C_API_EXCEPTION);
    }
}

template <class Get>
gs1_error_t get_flag(gs1_encoder_t *ctx, int *out_enabled, Get &&get) noexcept {
    if (!ctx || !out_enabled) {
        return c_api_err(GS1_C_API_INVALID_ARGUMENT);
    }
    *out_enabled = get(ctx->encoder) ? 1 : 0;
    return ok();
}

template <class Set>
gs1_error_t set_flag(gs1_encoder_t *ctx, int enabled, Set &&set) noexcept {
    if (!ctx) {
        return c_api_err(GS1_C_API_INVALID_ARGUMENT);
    }
    set(ctx->encoder, enabled != 0);
    return ok();
}

[[nodiscard]] std::optional<gs1::ai::Validation> to_validation(int validation) noexcept {
    return gs1::ai::validation_from_index(validation);
}

} // namespace

// ----------------------------- 内存/错误/版本 -----------------------------

void *gs1_malloc(size_t n) { return std::malloc(n); }

void gs1_free(void *p) { std::free(p); }

void gs1_string_list_free(char **lines, size_t n) {
    if (!lines) {
        return;
    }
    for (size_t i = 0; i < n; ++i) {
        std::free(lines[i]);
    }
    std::free(lines);
}

char *gs1_error_message(gs1_error_t err) {
    try {
        if (err.value == 0) {
            return dup_string("ok");
        }

        if (err.category && std::strcmp(err.category, kCApiCategory) == 0) {
            return dup_string(c_api_message_for(err.value));
        }

        const auto *cat = category_from_name(err.category);
        if (!cat) {
            std::string msg = "unknown error category";
            if (err.category) {
                msg += ": ";
                msg += err.category;
            }
            msg += " (";
            msg += std::to_string(err.value);
            msg += ")";
            return dup_string(msg);
        }

        return dup_string(std::error_code{err.value, *cat}.message());
    } catch (const std::exception &) {
        return nullptr;
    }
}

const char *gs1_version_string(void) {
    return gs1::Encoder::version().data();
}

gs1_error_t gs1_log_set_level(gs1_log_level_t level) {
    return guard_error([&]() -> gs1_error_t {
        using gs1::core::LogLevel;
        switch (level) {
        case GS1_LOG_TRACE:
            gs1::core::set_log_level(LogLevel::trace);
            return ok();
        case GS1_LOG_DEBUG:
            gs1::core::set_log_level(LogLevel::debug);
            return ok();
        case GS1_LOG_INFO:
            gs1::core::set_log_level(LogLevel::info);
            return ok();
        case GS1_LOG_WARN:
            gs1::core::set_log_level(LogLevel::warn);
            return ok();
        case GS1_LOG_ERROR:
            gs1::core::set_log_level(LogLevel::error);
            return ok();
        case GS1_LOG_CRITICAL:
            gs1::core::set_log_level(LogLevel::critical);
            return ok();
        case GS1_LOG_OFF:
            gs1::core::set_log_level(LogLevel::off);
            return ok();
        }
        return c_api_err(GS1_C_API_INVALID_ARGUMENT);
    });
}

// ----------------------------- 编码上下文 -----------------------------

gs1_error_t gs1_encoder_create(gs1_encoder_t **out_ctx) {
    return guard_error([&]() -> gs1_error_t {
        if (!out_ctx) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        *out_ctx = nullptr;

        auto ctx = std::make_unique<gs1_encoder>();
        if (!ctx->encoder.initialized()) {
            return from_error_code(ctx->encoder.last_error());
        }
        *out_ctx = ctx.release();
        return ok();
    });
}

void gs1_encoder_destroy(gs1_encoder_t *ctx) { delete ctx; }

gs1_error_t gs1_encoder_get_symbology(gs1_encoder_t *ctx, int *out_sym) {
    if (!ctx || !out_sym) {
        return c_api_err(GS1_C_API_INVALID_ARGUMENT);
    }
    *out_sym = static_cast<int>(ctx->encoder.symbology());
    return ok();
}

gs1_error_t gs1_encoder_set_symbology(gs1_encoder_t *ctx, int sym) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        // 越界取值同样交给 Encoder 记录错误
        return from_error_code(
            ctx->encoder.set_symbology(static_cast<gs1::scan::Symbology>(sym)));
    });
}

gs1_error_t gs1_encoder_get_add_check_digit(gs1_encoder_t *ctx, int *out_enabled) {
    return get_flag(ctx, out_enabled, [](const gs1::Encoder &e) { return e.add_check_digit(); });
}

gs1_error_t gs1_encoder_set_add_check_digit(gs1_encoder_t *ctx, int enabled) {
    return set_flag(ctx, enabled, [](gs1::Encoder &e, bool v) { e.set_add_check_digit(v); });
}

gs1_error_t gs1_encoder_get_permit_unknown_ais(gs1_encoder_t *ctx, int *out_enabled) {
    return get_flag(ctx, out_enabled,
                    [](const gs1::Encoder &e) { return e.permit_unknown_ais(); });
}

gs1_error_t gs1_encoder_set_permit_unknown_ais(gs1_encoder_t *ctx, int enabled) {
    return set_flag(ctx, enabled,
                    [](gs1::Encoder &e, bool v) { e.set_permit_unknown_ais(v); });
}

gs1_error_t gs1_encoder_get_permit_zero_suppressed_gtin_in_dl_uris(gs1_encoder_t *ctx,
                                                                   int *out_enabled) {
    return get_flag(ctx, out_enabled, [](const gs1::Encoder &e) {
        return e.permit_zero_suppressed_gtin_in_dl_uris();
    });
}

gs1_error_t gs1_encoder_set_permit_zero_suppressed_gtin_in_dl_uris(gs1_encoder_t *ctx,
                                                                   int enabled) {
    return set_flag(ctx, enabled, [](gs1::Encoder &e, bool v) {
        e.set_permit_zero_suppressed_gtin_in_dl_uris(v);
    });
}

gs1_error_t gs1_encoder_get_permit_convenience_alphas_in_dl_uris(gs1_encoder_t *ctx,
                                                                 int *out_enabled) {
    return get_flag(ctx, out_enabled, [](const gs1::Encoder &e) {
        return e.permit_convenience_alphas_in_dl_uris();
    });
}

gs1_error_t gs1_encoder_set_permit_convenience_alphas_in_dl_uris(gs1_encoder_t *ctx,
                                                                 int enabled) {
    return set_flag(ctx, enabled, [](gs1::Encoder &e, bool v) {
        e.set_permit_convenience_alphas_in_dl_uris(v);
    });
}

gs1_error_t gs1_encoder_get_include_data_titles_in_hri(gs1_encoder_t *ctx, int *out_enabled) {
    return get_flag(ctx, out_enabled,
                    [](const gs1::Encoder &e) { return e.include_data_titles_in_hri(); });
}

gs1_error_t gs1_encoder_set_include_data_titles_in_hri(gs1_encoder_t *ctx, int enabled) {
    return set_flag(ctx, enabled,
                    [](gs1::Encoder &e, bool v) { e.set_include_data_titles_in_hri(v); });
}

gs1_error_t gs1_encoder_get_validation_enabled(gs1_encoder_t *ctx,
                                               int validation,
                                               int *out_enabled) {
    if (!ctx || !out_enabled) {
        return c_api_err(GS1_C_API_INVALID_ARGUMENT);
    }
    const auto v = to_validation(validation);
    if (!v) {
        return from_error_code(gs1::core::make_error_code(gs1::core::errc::unknown_validation));
    }
    *out_enabled = ctx->encoder.validation_enabled(*v) ? 1 : 0;
    return ok();
}

gs1_error_t gs1_encoder_set_validation_enabled(gs1_encoder_t *ctx,
                                               int validation,
                                               int enabled) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        const auto v = to_validation(validation);
        if (!v) {
            return from_error_code(
                gs1::core::make_error_code(gs1::core::errc::unknown_validation));
        }
        return from_error_code(ctx->encoder.set_validation_enabled(*v, enabled != 0));
    });
}

gs1_error_t gs1_encoder_load_syntax_dictionary(gs1_encoder_t *ctx, const char *path) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !path) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        return from_error_code(ctx->encoder.load_syntax_dictionary(path));
    });
}

gs1_error_t gs1_encoder_get_data_str(gs1_encoder_t *ctx, char **out) {
    if (!ctx || !out) {
        return c_api_err(GS1_C_API_INVALID_ARGUMENT);
    }
    return copy_string_out(ctx->encoder.data_str(), out);
}

gs1_error_t gs1_encoder_set_data_str(gs1_encoder_t *ctx, const char *data) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !data) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        return from_error_code(ctx->encoder.set_data_str(data));
    });
}

gs1_error_t gs1_encoder_get_ai_data_str(gs1_encoder_t *ctx, char **out) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !out) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        *out = nullptr;
        const auto ai_data = ctx->encoder.ai_data_str();
        if (!ai_data) {
            return ok();
        }
        return copy_string_out(*ai_data, out);
    });
}

gs1_error_t gs1_encoder_set_ai_data_str(gs1_encoder_t *ctx, const char *ai_data) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !ai_data) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        return from_error_code(ctx->encoder.set_ai_data_str(ai_data));
    });
}

gs1_error_t gs1_encoder_get_scan_data(gs1_encoder_t *ctx, char **out) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !out) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        *out = nullptr;
        const auto scan_data = ctx->encoder.scan_data();
        if (!scan_data) {
            return from_error_code(ctx->encoder.last_error());
        }
        return copy_string_out(*scan_data, out);
    });
}

gs1_error_t gs1_encoder_set_scan_data(gs1_encoder_t *ctx, const char *scan_data) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !scan_data) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        return from_error_code(ctx->encoder.set_scan_data(scan_data));
    });
}

gs1_error_t gs1_encoder_get_dl_uri(gs1_encoder_t *ctx, const char *stem, char **out) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !out) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        *out = nullptr;

        std::optional<std::string_view> stem_view;
        if (stem) {
            stem_view = stem;
        }
        const auto uri = ctx->encoder.dl_uri(stem_view);
        if (!uri) {
            return from_error_code(ctx->encoder.last_error());
        }
        return copy_string_out(*uri, out);
    });
}

gs1_error_t gs1_encoder_get_hri(gs1_encoder_t *ctx, char ***out_lines, size_t *out_n) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !out_lines || !out_n) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        return copy_list_out(ctx->encoder.hri(), out_lines, out_n);
    });
}

gs1_error_t gs1_encoder_get_dl_ignored_query_params(gs1_encoder_t *ctx,
                                                    char ***out_params,
                                                    size_t *out_n) {
    return guard_error([&]() -> gs1_error_t {
        if (!ctx || !out_params || !out_n) {
            return c_api_err(GS1_C_API_INVALID_ARGUMENT);
        }
        return copy_list_out(ctx->encoder.dl_ignored_query_params(), out_params, out_n);
    });
}

const char *gs1_encoder_err_msg(const gs1_encoder_t *ctx) {
    return ctx ? ctx->encoder.err_msg().c_str() : "";
}

const char *gs1_encoder_err_markup(const gs1_encoder_t *ctx) {
    return ctx ? ctx->encoder.err_markup().c_str() : "";
}

int gs1_encoder_error_kind(const gs1_encoder_t *ctx) {
    return ctx ? static_cast<int>(ctx->encoder.error_kind()) : GS1_ERROR_KIND_NONE;
}
