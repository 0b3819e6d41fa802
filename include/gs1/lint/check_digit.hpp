#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace gs1::lint {

/**
 * @brief 计算 GS1 mod-10 校验位。
 *
 * 从最右侧的载荷数字开始向左交替乘以 3、1、3、1…，求和后取 (10 - sum % 10) % 10。
 * 载荷为空或含非数字字符时返回 std::nullopt。
 */
[[nodiscard]] std::optional<char> compute_check_digit(std::string_view payload) noexcept;

/**
 * @brief 校验末位数字是否为其前面载荷的正确校验位（至少两位数字）。
 */
[[nodiscard]] bool verify_check_digit(std::string_view value) noexcept;

/**
 * @brief 将零抑制形式（8/12/13 位）的 GTIN 左侧补零扩展为 GTIN-14。
 *
 * 已是 14 位时原样返回；其它长度或含非数字字符时返回 std::nullopt。
 */
[[nodiscard]] std::optional<std::string> expand_zero_suppressed_gtin(std::string_view value);

}  // namespace gs1::lint
