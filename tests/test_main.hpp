#pragma once

#include <cstdlib>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace gs1::tests {

inline int& failure_count() {
  static int count = 0;
  return count;
}

inline void record_failure(const char* file, int line, std::string_view message) {
  ++failure_count();
  std::cerr << file << ":" << line << ": " << message << "\n";
}

inline void expect_true(bool value, const char* expr, const char* file, int line) {
  if (value) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT failed: " << expr;
  record_failure(file, line, oss.str());
}

template <class L, class R>
inline void expect_eq(const L& lhs,
                      const R& rhs,
                      const char* lhs_expr,
                      const char* rhs_expr,
                      const char* file,
                      int line) {
  if (lhs == rhs) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_EQ failed: (" << lhs_expr << ") != (" << rhs_expr << ")";
  record_failure(file, line, oss.str());
}

inline void expect_ok(const std::error_code& ec, const char* expr, const char* file, int line) {
  if (!ec) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_OK failed: " << expr << " -> [" << ec.category().name() << "] " << ec.message();
  record_failure(file, line, oss.str());
}

// 期望得到指定错误码（同时比较错误域与取值）
inline void expect_err(const std::error_code& ec,
                       const std::error_code& expected,
                       const char* expr,
                       const char* file,
                       int line) {
  if (ec == expected) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_ERR failed: " << expr << " -> [" << ec.category().name() << "] "
      << ec.message() << ", expected [" << expected.category().name() << "] "
      << expected.message();
  record_failure(file, line, oss.str());
}

// 比较 optional<string> 与期望文本；nullopt 视为失败
inline void expect_value(const std::optional<std::string>& actual,
                         std::string_view expected,
                         const char* expr,
                         const char* file,
                         int line) {
  if (actual && *actual == expected) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_VALUE failed: " << expr << " -> "
      << (actual ? "\"" + *actual + "\"" : std::string("nullopt")) << ", expected \""
      << expected << "\"";
  record_failure(file, line, oss.str());
}

inline int run_and_report() {
  if (failure_count() == 0) {
    return 0;
  }
  std::cerr << "FAILED: " << failure_count() << " assertions\n";
  return 1;
}

}  // namespace gs1::tests

#define TEST_EXPECT(expr) \
  ::gs1::tests::expect_true(static_cast<bool>(expr), #expr, __FILE__, __LINE__)
#define TEST_EXPECT_EQ(a, b) ::gs1::tests::expect_eq((a), (b), #a, #b, __FILE__, __LINE__)
#define TEST_EXPECT_OK(ec) ::gs1::tests::expect_ok((ec), #ec, __FILE__, __LINE__)
#define TEST_EXPECT_ERR(ec, expected) \
  ::gs1::tests::expect_err((ec), (expected), #ec, __FILE__, __LINE__)
#define TEST_EXPECT_VALUE(opt, expected) \
  ::gs1::tests::expect_value((opt), (expected), #opt, __FILE__, __LINE__)
#define TEST_FAIL(msg) ::gs1::tests::record_failure(__FILE__, __LINE__, (msg))
