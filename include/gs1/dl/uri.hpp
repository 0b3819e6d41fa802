#pragma once

#include "gs1/ai/element.hpp"
#include "gs1/dict/ai_table.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace gs1::dl {

enum class errc : int {
  ok = 0,
  illegal_characters = 1,
  illegal_scheme = 2,
  illegal_domain = 3,
  missing_domain_or_path = 4,
  no_key_in_path = 5,
  empty_path_value = 6,
  illegal_null = 7,
  unknown_query_ai = 8,
  empty_query_value = 9,
  invalid_key_qualifier_sequence = 10,
  duplicate_ai = 11,
  not_data_attribute = 12,
  belongs_in_path = 13,
  no_primary_key = 14,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

struct ParseOptions {
  bool permit_unknown_ais{false};
  // 路径中 8/12/13 位的 (01) 左补零到 14 位（查询参数中总是补齐）
  bool permit_zero_suppressed_gtin{false};
  // 路径中允许 "gtin"、"lot" 等便捷别名代替 AI
  bool permit_convenience_alphas{false};
  // 放行的未知 AI 不能作为查询参数
  bool unknown_ai_not_dl_attr{true};
};

struct ParseResult {
  ai::ElementSequence elements;
  std::string stem;
  std::error_code ec;
  std::string error_message;
  std::string error_markup;
};

struct BuildResult {
  std::string uri;
  std::error_code ec;
  std::string error_message;
};

/**
 * @brief 数据是否以 DL URI 的 scheme 开头（http:// / https://，全小写或全大写）。
 */
[[nodiscard]] bool is_dl_uri(std::string_view data) noexcept;

/**
 * @brief 解析 GS1 Digital Link URI。
 *
 * 路径中从后往前找到第一个主键 AI，之前的部分是 stem；主键之后的
 * "/AI/value" 对必须构成合法的主键/限定符组合。查询参数中数字键必须是
 * AI，非数字键与无值参数作为被忽略的查询参数原样保留。
 * 成功后元素值均已通过组件校验，但尚未执行跨元素校验（见 ai::validate）。
 */
[[nodiscard]] ParseResult parse_uri(const dict::AiTable& table, std::string_view uri,
                                    const ParseOptions& options);

/**
 * @brief 由元素序列生成 DL URI。
 *
 * 元素带有 DL 路径顺序（来自 DL URI）时沿用之；否则以序列中第一个主键 AI
 * 为主键，并把数据中能满足的最长限定符组合提升到路径中。其余元素按序列顺序
 * 作为查询参数，定长 AI 排在非定长 AI 之前，同一 AI 只输出一次。
 * stem 缺省为 https://id.gs1.org，末尾的 '/' 会被去掉。
 */
[[nodiscard]] BuildResult build_uri(const dict::AiTable& table,
                                    const ai::ElementSequence& elements,
                                    std::optional<std::string_view> stem,
                                    bool unknown_ai_not_dl_attr);

/**
 * @brief 百分号编码：非保留字符 A-Za-z0-9-._~ 原样输出，其余编码为 %XX；
 * 查询参数中空格编码为 '+'。
 */
[[nodiscard]] std::string uri_escape(std::string_view in, bool query_component);

/**
 * @brief 百分号解码：非法的 %XX 序列保留 '%'；查询参数中 '+' 解码为空格。
 *
 * 解码出 NUL 字符时返回 std::nullopt。
 */
[[nodiscard]] std::optional<std::string> uri_unescape(std::string_view in,
                                                      bool query_component);

}  // namespace gs1::dl

namespace std {
template <>
struct is_error_code_enum<gs1::dl::errc> : true_type {};
}  // namespace std
