#pragma once

#include <cstdint>

namespace gs1::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 输入被拒绝时以 debug 级别记录错误域与消息，从文件加载语法字典时以 info
 *   级别记录；成功路径不打日志。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace gs1::core
