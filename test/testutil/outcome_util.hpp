#ifndef CALCFLOW_TESTUTIL_OUTCOME_UTIL_HPP
#define CALCFLOW_TESTUTIL_OUTCOME_UTIL_HPP

#include <gtest/gtest.h>

#include "outcome/outcome.hpp"

#define CALCFLOW_TEST_CONCAT_IMPL(a, b) a##b
#define CALCFLOW_TEST_CONCAT(a, b) CALCFLOW_TEST_CONCAT_IMPL(a, b)

#define CALCFLOW_TEST_UNIQUE_NAME(base) CALCFLOW_TEST_CONCAT(base, __LINE__)

/// evaluates @a expr, fails the test on error, binds the value to @a var
#define EXPECT_OUTCOME_TRUE(var, expr)                                     \
  auto &&CALCFLOW_TEST_UNIQUE_NAME(_r_) = (expr);                          \
  ASSERT_TRUE(CALCFLOW_TEST_UNIQUE_NAME(_r_))                              \
      << "unexpected error: "                                              \
      << CALCFLOW_TEST_UNIQUE_NAME(_r_).error().message();                 \
  auto &&var = CALCFLOW_TEST_UNIQUE_NAME(_r_).value();

/// evaluates @a expr, fails the test on error
#define EXPECT_OUTCOME_TRUE_1(expr)                                        \
  {                                                                        \
    auto &&_r = (expr);                                                    \
    ASSERT_TRUE(_r) << "unexpected error: " << _r.error().message();      \
  }

/// evaluates @a expr, fails the test unless it fails with @a code
#define EXPECT_OUTCOME_ERROR(expr, code)                                   \
  {                                                                        \
    auto &&_r = (expr);                                                    \
    ASSERT_FALSE(_r) << "expected error " << std::error_code(code).message(); \
    EXPECT_EQ(_r.error(), code) << _r.error().message();                   \
  }

#endif  // CALCFLOW_TESTUTIL_OUTCOME_UTIL_HPP
