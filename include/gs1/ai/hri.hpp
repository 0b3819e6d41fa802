#pragma once

#include "gs1/ai/element.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gs1::ai {

/**
 * @brief 渲染 HRI：每个 AI 元素一行 "(AI) value"。
 *
 * include_titles 为 true 且条目有标题时，前缀大写标题："GTIN (01) ..."。
 * 复合分隔符与被忽略的 DL 查询参数不输出。
 */
[[nodiscard]] std::vector<std::string> render_hri(const ElementSequence& elements,
                                                  bool include_titles);

/**
 * @brief 括号 AI 语法形式；值中的 '(' 转义为 "\("。没有元素时返回 std::nullopt。
 */
[[nodiscard]] std::optional<std::string> to_bracketed(const ElementSequence& elements);

/**
 * @brief DL URI 中被忽略的查询参数（原文，按出现顺序）。
 */
[[nodiscard]] std::vector<std::string> dl_ignored_query_params(const ElementSequence& elements);

}  // namespace gs1::ai
