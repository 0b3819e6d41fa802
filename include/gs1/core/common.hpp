#pragma once

#include <cstddef>
#include <string_view>

namespace gs1::core {

// 单次输入（数据串 / AI 串 / 扫描数据）允许的最大字符数。
inline constexpr std::size_t kMaxDataLength = 8191;

// 一个元素序列最多容纳的元素个数（含复合分隔符与被忽略的 DL 查询参数）。
inline constexpr std::size_t kMaxAIs = 64;

inline constexpr std::size_t kMaxAIValueLength = 90;
inline constexpr std::size_t kMinAILength = 2;
inline constexpr std::size_t kMaxAILength = 4;

// 文本形式的 FNC1；扫描数据中对应 GS (0x1D)。
inline constexpr char kFnc1 = '^';
inline constexpr char kGroupSeparator = '\x1D';

// 线性部分与 2D 复合部分之间的分隔符。
inline constexpr char kCompositeSeparator = '|';

// 错误标记中包围出错片段的字符。
inline constexpr char kMarkupDelimiter = '|';

inline constexpr std::string_view kCanonicalDLStem = "https://id.gs1.org";

[[nodiscard]] constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool all_digits(std::string_view s) noexcept {
    for (const char c : s) {
        if (!is_digit(c)) {
            return false;
        }
    }
    return true;
}

}  // 命名空间 gs1::core
