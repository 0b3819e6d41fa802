#pragma once

#include "gs1/ai/element.hpp"
#include "gs1/dict/ai_table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace gs1::ai {

struct ParseOptions {
  bool permit_unknown_ais{false};
  // 定长且以 csum 结尾的 AI 值若恰好少一位，则计算并补上校验位
  bool add_check_digit{false};
};

/**
 * @brief 解析结果。
 *
 * 成功时 elements 为元素序列，data_str 为规范化的 '^' 数据串；
 * 失败时 elements/data_str 为空，ec/error_message 描述原因，
 * 值级别的错误还会给出 error_markup（"(AI)前|错|后"）。
 */
struct ParseResult {
  ElementSequence elements;
  std::string data_str;
  std::error_code ec;
  std::string error_message;
  std::string error_markup;
};

/**
 * @brief 单个 AI 值的组件校验结果；consumed 为按组件定义消耗的字符数。
 */
struct ValueCheck {
  std::size_t consumed{0};
  std::error_code ec;
  std::string error_message;
  std::string error_markup;
};

/**
 * @brief 按组件依次校验 AI 值（长度、字符集、linter）。
 *
 * value 为到下一个 FNC1 或数据末尾的全部字符；返回实际消耗的长度，
 * 调用方据此判断值之后是否还有多余数据。
 */
[[nodiscard]] ValueCheck validate_ai_value(const dict::AiEntry& entry, std::string_view ai,
                                           std::string_view value);

/**
 * @brief 组件校验之前的整体长度与内容检查（过短、过长、含 '^'）。
 */
[[nodiscard]] std::error_code check_value_length_content(const dict::AiEntry& entry,
                                                         std::string_view ai,
                                                         std::string_view value,
                                                         std::string& error_message);

/**
 * @brief 若 value 恰好缺少末尾校验位，返回补全后的值。
 *
 * 仅适用于定长且最后一个组件带 csum linter 的 AI。
 */
[[nodiscard]] std::optional<std::string> complete_check_digit(const dict::AiEntry& entry,
                                                              std::string_view value);

/**
 * @brief AI 数据解析器：'^' element string 与括号 AI 语法两种入口。
 *
 * 解析器不持有语法表，调用方保证 table 在其生命周期内有效；
 * 产出的元素指向 table 中的条目。
 */
class Parser {
 public:
  Parser(const dict::AiTable& table, ParseOptions options) noexcept;

  /**
   * @brief 解析数据串：'^' 开头的 AI 数据、含 '|' 的复合数据，或非 AI 数据。
   *
   * 非 AI 数据原样保留、不产生元素。DL URI 不在此处理。
   */
  [[nodiscard]] ParseResult parse_data_str(std::string_view data) const;

  /**
   * @brief 解析括号 AI 语法，如 "(01)12312312312319(10)ABC\(123|(99)CC"。
   */
  [[nodiscard]] ParseResult parse_ai_data_str(std::string_view ai_data) const;

  /**
   * @brief 解析单段 '^' element string（不含复合分隔符）。
   */
  [[nodiscard]] ParseResult parse_element_string(std::string_view data) const;

 private:
  bool parse_element_string_into(std::string_view data, ParseResult& out) const;
  bool parse_bracketed_into(std::string_view ai_data, ParseResult& out) const;
  bool append_element(ParseResult& out, Element element) const;

  const dict::AiTable& table_;
  ParseOptions options_;
};

}  // namespace gs1::ai
