#pragma once

#include "gs1/lint/linters.hpp"

#include <string_view>

namespace gs1::lint {

/**
 * @brief 北美优惠券扩展码（AI 8110）的结构校验。
 *
 * 依次校验 GCP、Offer Code、Save Value、首个购买要求，以及可选字段 1..6 和 9；
 * 失败时 error_pos/error_length 指向出错字段。
 */
[[nodiscard]] LintResult lint_couponcode(std::string_view value) noexcept;

/**
 * @brief 北美优惠券的 POS 要约码（AI 8112）的结构校验。
 */
[[nodiscard]] LintResult lint_couponposoffer(std::string_view value) noexcept;

} // namespace gs1::lint
