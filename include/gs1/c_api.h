/*
 * gs1/c_api.h
 *
 * C 语言对外接口（C ABI）。
 *
 * 设计目标：
 * - 允许纯 C 工程及其它语言绑定通过 `#include <gs1/c_api.h>` 使用编码上下文；
 * - 所有 C++ 类型均通过不透明句柄（opaque handle）隐藏；
 * - 错误使用 `gs1_error_t` 表达（value + category），兼容 std::error_code；
 * - 任何由库分配的内存都使用 `gs1_free()` 释放；
 * - C API 内部不允许异常跨越 C 边界（若发生异常，将转为 `gs1.c_api` 错误）。
 *
 * 注意：
 * - 本库实现基于 C++20；C 工程链接时通常需要用 C++ 链接器（例如 g++/clang++）。
 * - 单个 gs1_encoder_t 不是线程安全的；不同句柄之间互不影响。
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* C API 版本（用于 ABI 变更时做兼容分支） */
#define GS1_C_API_VERSION 1

/* ----------------------------- 错误与内存 ----------------------------- */

/*
 * `gs1_error_t` 对应 C++ 的 std::error_code。
 *
 * - value==0 表示成功；
 * - category 指向一个静态字符串（生命周期贯穿整个进程），典型值：
 *   - "gs1.c_api"（本 C API 自身的错误域）
 *   - "gs1.core" / "gs1.dict" / "gs1.lint" / "gs1.ai" / "gs1.dl" / "gs1.scan"
 */
typedef struct gs1_error {
    int value;
    const char *category;
} gs1_error_t;

static inline int gs1_error_is_ok(gs1_error_t err) { return err.value == 0; }

/* 本 C API 自身的错误码（category="gs1.c_api"） */
typedef enum gs1_c_api_errc {
    GS1_C_API_OK = 0,
    GS1_C_API_INVALID_ARGUMENT = 1,
    GS1_C_API_OUT_OF_MEMORY = 2,
    GS1_C_API_EXCEPTION = 3
} gs1_c_api_errc_t;

void *gs1_malloc(size_t n);
void gs1_free(void *p);

/* 释放 gs1_encoder_get_hri 等返回的字符串数组（含每个元素）。 */
void gs1_string_list_free(char **lines, size_t n);

/* 生成可读错误信息（返回的字符串需用 gs1_free 释放）。 */
char *gs1_error_message(gs1_error_t err);

/* 版本信息（静态字符串，勿释放）。 */
const char *gs1_version_string(void);

typedef enum gs1_log_level {
    GS1_LOG_TRACE = 0,
    GS1_LOG_DEBUG = 1,
    GS1_LOG_INFO = 2,
    GS1_LOG_WARN = 3,
    GS1_LOG_ERROR = 4,
    GS1_LOG_CRITICAL = 5,
    GS1_LOG_OFF = 6
} gs1_log_level_t;

gs1_error_t gs1_log_set_level(gs1_log_level_t level);

/* ----------------------------- 枚举 ----------------------------- */

typedef enum gs1_symbology {
    GS1_SYM_NONE = -1,
    GS1_SYM_DATABAR_OMNI = 0,
    GS1_SYM_DATABAR_TRUNCATED = 1,
    GS1_SYM_DATABAR_STACKED = 2,
    GS1_SYM_DATABAR_STACKED_OMNI = 3,
    GS1_SYM_DATABAR_LIMITED = 4,
    GS1_SYM_DATABAR_EXPANDED = 5,
    GS1_SYM_UPCA = 6,
    GS1_SYM_UPCE = 7,
    GS1_SYM_EAN13 = 8,
    GS1_SYM_EAN8 = 9,
    GS1_SYM_GS1_128_CCA = 10,
    GS1_SYM_GS1_128_CCC = 11,
    GS1_SYM_QR = 12,
    GS1_SYM_DM = 13,
    GS1_SYM_DOTCODE = 14,
    GS1_SYM_NUMSYMS = 15
} gs1_symbology_t;

typedef enum gs1_validation {
    GS1_VALIDATION_MUTEX_AIS = 0,
    GS1_VALIDATION_REQUISITE_AIS = 1,
    GS1_VALIDATION_REPEATED_AIS = 2,
    GS1_VALIDATION_DIGSIG_SERIAL_KEY = 3,
    GS1_VALIDATION_UNKNOWN_AI_NOT_DL_ATTR = 4,
    GS1_VALIDATION_NUMVALIDATIONS = 5
} gs1_validation_t;

typedef enum gs1_error_kind {
    GS1_ERROR_KIND_NONE = 0,
    GS1_ERROR_KIND_INITIALIZATION = 1,
    GS1_ERROR_KIND_PARAMETER = 2,
    GS1_ERROR_KIND_DIGITAL_LINK = 3,
    GS1_ERROR_KIND_SCAN_DATA = 4
} gs1_error_kind_t;

/* ----------------------------- 编码上下文 ----------------------------- */

typedef struct gs1_encoder gs1_encoder_t;

/* 内嵌语法字典无法加载时返回其错误且 *out_ctx 为 NULL。 */
gs1_error_t gs1_encoder_create(gs1_encoder_t **out_ctx);
void gs1_encoder_destroy(gs1_encoder_t *ctx);

gs1_error_t gs1_encoder_get_symbology(gs1_encoder_t *ctx, int *out_sym);
gs1_error_t gs1_encoder_set_symbology(gs1_encoder_t *ctx, int sym);

/* 布尔选项：取值只有 0/非 0 */
gs1_error_t gs1_encoder_get_add_check_digit(gs1_encoder_t *ctx, int *out_enabled);
gs1_error_t gs1_encoder_set_add_check_digit(gs1_encoder_t *ctx, int enabled);
gs1_error_t gs1_encoder_get_permit_unknown_ais(gs1_encoder_t *ctx, int *out_enabled);
gs1_error_t gs1_encoder_set_permit_unknown_ais(gs1_encoder_t *ctx, int enabled);
gs1_error_t gs1_encoder_get_permit_zero_suppressed_gtin_in_dl_uris(gs1_encoder_t *ctx,
                                                                   int *out_enabled);
gs1_error_t gs1_encoder_set_permit_zero_suppressed_gtin_in_dl_uris(gs1_encoder_t *ctx,
                                                                   int enabled);
gs1_error_t gs1_encoder_get_permit_convenience_alphas_in_dl_uris(gs1_encoder_t *ctx,
                                                                 int *out_enabled);
gs1_error_t gs1_encoder_set_permit_convenience_alphas_in_dl_uris(gs1_encoder_t *ctx,
                                                                 int enabled);
gs1_error_t gs1_encoder_get_include_data_titles_in_hri(gs1_encoder_t *ctx, int *out_enabled);
gs1_error_t gs1_encoder_set_include_data_titles_in_hri(gs1_encoder_t *ctx, int enabled);

/* 校验规则开关；锁定规则（互斥、重复）不能关闭 */
gs1_error_t gs1_encoder_get_validation_enabled(gs1_encoder_t *ctx,
                                               int validation,
                                               int *out_enabled);
gs1_error_t gs1_encoder_set_validation_enabled(gs1_encoder_t *ctx,
                                               int validation,
                                               int enabled);

gs1_error_t gs1_encoder_load_syntax_dictionary(gs1_encoder_t *ctx, const char *path);

/*
 * 数据读写。get 系列返回的字符串需用 gs1_free 释放。
 * 非 AI 数据时 gs1_encoder_get_ai_data_str 成功返回且 *out 为 NULL。
 */
gs1_error_t gs1_encoder_get_data_str(gs1_encoder_t *ctx, char **out);
gs1_error_t gs1_encoder_set_data_str(gs1_encoder_t *ctx, const char *data);
gs1_error_t gs1_encoder_get_ai_data_str(gs1_encoder_t *ctx, char **out);
gs1_error_t gs1_encoder_set_ai_data_str(gs1_encoder_t *ctx, const char *ai_data);
gs1_error_t gs1_encoder_get_scan_data(gs1_encoder_t *ctx, char **out);
gs1_error_t gs1_encoder_set_scan_data(gs1_encoder_t *ctx, const char *scan_data);

/* stem 可为 NULL（使用 https://id.gs1.org） */
gs1_error_t gs1_encoder_get_dl_uri(gs1_encoder_t *ctx, const char *stem, char **out);

/* 字符串数组用 gs1_string_list_free 释放；空列表时 *out_lines 为 NULL */
gs1_error_t gs1_encoder_get_hri(gs1_encoder_t *ctx, char ***out_lines, size_t *out_n);
gs1_error_t gs1_encoder_get_dl_ignored_query_params(gs1_encoder_t *ctx,
                                                    char ***out_params,
                                                    size_t *out_n);

/*
 * 最近一次失败的信息；返回的指针由句柄持有，在下一次调用该句柄前有效。
 * 成功的操作会把两者清空为 ""。
 */
const char *gs1_encoder_err_msg(const gs1_encoder_t *ctx);
const char *gs1_encoder_err_markup(const gs1_encoder_t *ctx);
int gs1_encoder_error_kind(const gs1_encoder_t *ctx);

#ifdef __cplusplus
} /* extern "C" */
#endif
