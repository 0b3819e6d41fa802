#include "gs1/core/error.hpp"

#include <string>

namespace gs1::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志）
class gs1_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "gs1.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::unknown_symbology:
        return "unknown symbology";
      case errc::unknown_validation:
        return "unknown validation";
      case errc::validation_locked:
        return "this validation cannot be amended";
      case errc::data_too_long:
        return "data too long";
      case errc::no_ai_data:
        return "not AI data";
      case errc::initialization_failed:
        return "initialization failed";
      default:
        return "unknown gs1.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static gs1_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 gs1::core
