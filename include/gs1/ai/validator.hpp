#pragma once

#include "gs1/ai/element.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace gs1::ai {

/**
 * @brief 解析成功后对元素序列执行的校验规则。
 *
 * mutex_ais 与 repeated_ais 始终执行、不可关闭；其余可按需开关（默认全部开启）。
 * unknown_ai_not_dl_attr 不在 validate() 中执行，而是由 DL URI 的解析与生成
 * 读取：开启时被放行的未知 AI 不能作为 DL 查询参数。
 */
enum class Validation : std::uint8_t {
  mutex_ais = 0,
  requisite_ais = 1,
  repeated_ais = 2,
  digsig_serial_key = 3,
  unknown_ai_not_dl_attr = 4,
};

inline constexpr std::size_t kNumValidations = 5;

[[nodiscard]] std::optional<Validation> validation_from_index(int index) noexcept;
[[nodiscard]] std::string_view validation_name(Validation v) noexcept;

class ValidationTable {
 public:
  ValidationTable() noexcept;

  [[nodiscard]] bool enabled(Validation v) const noexcept;
  [[nodiscard]] static bool locked(Validation v) noexcept;

  /**
   * @brief 修改规则开关。
   *
   * 对锁定规则修改为与当前不同的状态时返回 core::errc::validation_locked。
   */
  std::error_code set_enabled(Validation v, bool enabled) noexcept;

 private:
  std::array<bool, kNumValidations> enabled_{};
};

struct ValidationResult {
  std::error_code ec;
  std::string error_message;
};

/**
 * @brief 按规则顺序校验元素序列，返回第一个失败。
 */
[[nodiscard]] ValidationResult validate(const ElementSequence& elements,
                                        const ValidationTable& table);

}  // namespace gs1::ai
