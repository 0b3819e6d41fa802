#pragma once

#include <string_view>

namespace gs1::lint {

/**
 * @brief 外部代码表查询：均为大小写敏感的精确匹配。
 */

// ISO 3166-1 三位数字国家代码
[[nodiscard]] bool is_iso3166_numeric(std::string_view code) noexcept;

// ISO 3166-1 alpha-2 国家代码
[[nodiscard]] bool is_iso3166_alpha2(std::string_view code) noexcept;

// ISO 4217 三位数字货币代码
[[nodiscard]] bool is_iso4217_numeric(std::string_view code) noexcept;

// UN/ECE Rec 21 包装类型代码（GS1 PackageTypeCode）
[[nodiscard]] bool is_package_type(std::string_view code) noexcept;

} // namespace gs1::lint
