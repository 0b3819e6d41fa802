#pragma once

#include "gs1/dict/ai_table.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace gs1::dict {

enum class errc : int {
  ok = 0,
  cannot_read_file = 1,
  invalid_ai = 2,
  invalid_ai_range = 3,
  missing_components = 4,
  invalid_component = 5,
  unknown_linter = 6,
  ambiguous_components = 7,
  invalid_attribute = 8,
  invalid_title = 9,
  prefix_length_conflict = 10,
  duplicate_ai = 11,
  empty_dictionary = 12,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief 语法字典加载结果。
 *
 * 成功时 table 非空；失败时 ec/error_message 描述原因，error_line 为出错行号
 * （从 1 开始，0 表示与具体行无关）。
 */
struct LoadResult {
  std::shared_ptr<const AiTable> table;
  std::error_code ec;
  std::size_t error_line{0};
  std::string error_message;
};

/**
 * @brief 解析 GS1 Syntax Dictionary 文本。
 *
 * 每行一个 AI 或 AI 区间：
 *   <AI>[-<AI>]  [flags]  <component>...  [attr...]  [# TITLE]
 * 空行与以 '#' 开头的行被忽略。
 */
[[nodiscard]] LoadResult parse_syntax_dictionary(std::string_view text);

/**
 * @brief 从文件加载语法字典（成功时记录一条 info 日志）。
 */
[[nodiscard]] LoadResult load_syntax_dictionary_file(const std::string& path);

/**
 * @brief 加载编译进库的内置语法字典。
 */
[[nodiscard]] LoadResult load_embedded_syntax_dictionary();

/**
 * @brief 内置语法字典文本。
 */
[[nodiscard]] std::string_view embedded_syntax_dictionary() noexcept;

}  // namespace gs1::dict

namespace std {
template <>
struct is_error_code_enum<gs1::dict::errc> : true_type {};
}  // namespace std
