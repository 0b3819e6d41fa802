#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace gs1::scan {

/**
 * @brief 支持的条码码制。
 *
 * 数值与 C API 中的 gs1_symbology_t 保持一致；none 表示未选择码制。
 */
enum class Symbology : int {
    none = -1,
    databar_omni = 0,
    databar_truncated = 1,
    databar_stacked = 2,
    databar_stacked_omni = 3,
    databar_limited = 4,
    databar_expanded = 5,
    upca = 6,
    upce = 7,
    ean13 = 8,
    ean8 = 9,
    gs1_128_cca = 10,
    gs1_128_ccc = 11,
    qr = 12,
    dm = 13,
    dotcode = 14,
};

inline constexpr std::size_t kNumSymbologies = 15;

/**
 * @brief 由整数取值得到码制；-1 为 none，越界返回 std::nullopt。
 */
[[nodiscard]] std::optional<Symbology> symbology_from_index(int index) noexcept;

[[nodiscard]] std::string_view symbology_name(Symbology sym) noexcept;

} // namespace gs1::scan
