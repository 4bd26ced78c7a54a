#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace formation::test {

struct TestCase {
  std::string name;
  std::function<bool()> fn;
};

// 命令行参数作为名字过滤：只跑名字里包含任一参数的用例
static inline bool Selected(const std::string& name, const std::vector<std::string>& filters) {
  if (filters.empty()) return true;
  for (const auto& f : filters) {
    if (name.find(f) != std::string::npos) return true;
  }
  return false;
}

inline int RunAll(const std::vector<TestCase>& cases, int argc = 0, char** argv = nullptr) {
  std::vector<std::string> filters;
  for (int i = 1; i < argc; ++i) filters.emplace_back(argv[i]);

  int failed = 0;
  int ran = 0;
  for (const auto& tc : cases) {
    if (!Selected(tc.name, filters)) continue;
    ++ran;

    bool ok = false;
    try {
      ok = tc.fn();
    } catch (const std::exception& e) {
      std::cerr << "[EXCEPTION] " << tc.name << ": " << e.what() << "\n";
      ok = false;
    }

    if (ok) {
      std::cout << "[PASS] " << tc.name << "\n";
    } else {
      std::cout << "[FAIL] " << tc.name << "\n";
      failed++;
    }
  }

  if (ran == 0) {
    std::cout << "No test matched the filter.\n";
    return 1;
  }
  if (failed == 0) {
    std::cout << "All tests passed (" << ran << "/" << cases.size() << ").\n";
    return 0;
  }
  std::cout << failed << " test(s) failed out of " << ran << ".\n";
  return 1;
}

// ----------- expectation macros -----------

#define FORMATION_EXPECT_TRUE(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "Expectation failed: " << #expr \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

#define FORMATION_EXPECT_FALSE(expr) FORMATION_EXPECT_TRUE(!(expr))

// optional 结果：几何/求解器的“无结果”
#define FORMATION_EXPECT_NONE(opt) \
  do { \
    if ((opt).has_value()) { \
      std::cerr << "Expectation failed: " << #opt << " is empty" \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

#define FORMATION_EXPECT_EQ(a, b) \
  do { \
    auto _a = (a); \
    auto _b = (b); \
    if (!(_a == _b)) { \
      std::cerr << "Expectation failed: " << #a << " == " << #b \
                << " (got " << _a << " vs " << _b << ")" \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

#define FORMATION_EXPECT_NEAR(a, b, eps) \
  do { \
    auto _a = (a); \
    auto _b = (b); \
    auto _eps = (eps); \
    if (!((_a > _b ? _a - _b : _b - _a) <= _eps)) { \
      std::cerr << "Expectation failed: |" << #a << " - " << #b << "| <= " << #eps \
                << " (got " << _a << " vs " << _b << ")" \
                << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

} // namespace formation::test
