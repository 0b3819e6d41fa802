#pragma once

#include "gs1/ai/element.hpp"
#include "gs1/scan/symbology.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace gs1::scan {

enum class errc : int {
  ok = 0,
  no_symbology = 1,
  incompatible_data = 2,
  primary_data_wrong_length = 3,
  primary_data_not_digits = 4,
  primary_data_check_digit_incorrect = 5,
  primary_data_too_large = 6,
  missing_symbology_identifier = 7,
  unsupported_symbology_identifier = 8,
  primary_scan_data_too_short = 9,
  primary_message_too_long = 10,
  primary_message_not_digits = 11,
  primary_message_check_digit_incorrect = 12,
  illegal_carat = 13,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

struct EncodeResult {
  std::string scan_data;
  std::error_code ec;
  std::string error_message;
};

struct DecodeResult {
  Symbology symbology{Symbology::none};
  // 还原出的数据串："^" 开头的 AI 数据、"主数据|^…" 复合数据或非 AI 数据
  std::string data_str;
  std::error_code ec;
  std::string error_message;
};

/**
 * @brief 生成扫描器输出：符号标识符（如 "]C1"、"]Q3"）加上转换后的数据。
 *
 * AI 数据去掉首个 FNC1，其余 '^' 转为 GS (0x1D)。DataBar 线性码与 EAN/UPC
 * 的主数据是去掉 (01) 前缀的 GTIN 数字；add_check_digit 为 true 时主数据可少给
 * 校验位，由此处计算补齐。elements 用于判断线性部分最后一个 AI 是否需要 GS。
 */
[[nodiscard]] EncodeResult encode_scan_data(Symbology sym, std::string_view data_str,
                                            const ai::ElementSequence& elements,
                                            bool add_check_digit);

/**
 * @brief 解析扫描器输出，得到码制与数据串（尚未做 AI 解析与校验）。
 */
[[nodiscard]] DecodeResult decode_scan_data(std::string_view scan_data);

}  // namespace gs1::scan

namespace std {
template <>
struct is_error_code_enum<gs1::scan::errc> : true_type {};
}  // namespace std
