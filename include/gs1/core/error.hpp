#pragma once

#include <system_error>

namespace gs1::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有会失败的接口返回 std::error_code，不抛异常；
 * - 各模块（lint/dict/ai/dl/scan）拥有各自的错误域，这里只放与输入内容无关的
 *   参数类错误（选项取值非法、校验规则被锁定、数据过长等）。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  unknown_symbology = 2,
  unknown_validation = 3,
  validation_locked = 4,
  data_too_long = 5,
  no_ai_data = 6,
  initialization_failed = 7,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace gs1::core

namespace std {
template <>
struct is_error_code_enum<gs1::core::errc> : true_type {};
}  // namespace std
