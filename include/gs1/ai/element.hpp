#pragma once

#include "gs1/dict/ai_table.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace gs1::ai {

/**
 * @brief AI 数据解析与校验的错误码（错误域 "gs1.ai"）。
 *
 * 组件 linter 的失败直接返回 gs1.lint 错误码，不在此重复定义。
 */
enum class errc : int {
  ok = 0,
  missing_fnc1 = 1,
  empty_data = 2,
  no_ai_for_prefix = 3,
  unrecognised_ai = 4,
  value_empty = 5,
  incorrect_length = 6,
  value_too_short = 7,
  value_too_long = 8,
  missing_separator = 9,
  illegal_carat = 10,
  too_many_ais = 11,
  malformed_ai_data = 12,
  mutex_ais = 13,
  requisite_not_satisfied = 14,
  repeated_ai = 15,
  serial_not_present = 16,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

enum class ElementKind : std::uint8_t {
  ai_value = 0,
  // 线性部分与 2D 复合部分之间的分隔
  composite_separator = 1,
  // DL URI 中被忽略的查询参数，value 保存原文
  dl_ignored_param = 2,
};

// 不在 DL 路径中（作为查询参数）的元素
inline constexpr int kDLPathOrderAttribute = -1;

struct Element {
  ElementKind kind{ElementKind::ai_value};
  // 指向语法表中的条目；仅 ai_value 有效
  const dict::AiEntry* entry{nullptr};
  std::string ai;
  std::string value;
  int dl_path_order{kDLPathOrderAttribute};
};

using ElementSequence = std::vector<Element>;

[[nodiscard]] Element make_ai_element(const dict::AiEntry& entry, std::string ai,
                                      std::string value);
[[nodiscard]] Element make_composite_separator();

/**
 * @brief 序列中是否存在匹配 pattern 的 AI（pattern 中的 'n' 匹配任意数字）。
 *
 * ignore_ai 非空时跳过与之相同的 AI。
 */
[[nodiscard]] const Element* find_ai(const ElementSequence& elements,
                                     std::string_view pattern,
                                     std::string_view ignore_ai = {}) noexcept;

}  // namespace gs1::ai

namespace std {
template <>
struct is_error_code_enum<gs1::ai::errc> : true_type {};
}  // namespace std
