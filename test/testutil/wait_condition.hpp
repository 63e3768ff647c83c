#ifndef CALCFLOW_GTEST_WAIT_CONDITION_HPP
#define CALCFLOW_GTEST_WAIT_CONDITION_HPP

#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

namespace calcflow::test {

  /**
   * Polls @param condition until it holds or @param timeout elapses
   * @param actualDuration optional pointer to store the actual wait duration
   * @return whether the condition held in time
   */
  template <typename Condition>
  bool waitForCondition(Condition condition,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds *actualDuration = nullptr,
                        std::chrono::milliseconds check_interval =
                            std::chrono::milliseconds(10)) {
    auto start = std::chrono::steady_clock::now();
    bool result = condition();
    while (!result && std::chrono::steady_clock::now() - start < timeout) {
      std::this_thread::sleep_for(check_interval);
      result = condition();
    }
    if (actualDuration != nullptr) {
      *actualDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
    }
    return result;
  }

  /**
   * Assert that a condition becomes true within the timeout (fatal assertion)
   * @param condition a callable that returns bool, true when condition is met
   * @param timeout maximum time to wait
   * @param description optional description of what we're waiting for
   */
  template <typename Condition>
  void assertWaitForCondition(Condition condition,
                              std::chrono::milliseconds timeout,
                              const std::string &description,
                              const char *file_name,
                              int line_number) {
    if (!waitForCondition(condition, timeout)) {
      std::string message = "Timed out waiting for condition";
      if (!description.empty()) {
        message += ": " + description;
      }
      message += " (timeout: " + std::to_string(timeout.count()) + "ms)";
      GTEST_MESSAGE_AT_(file_name,
                        line_number,
                        message.c_str(),
                        ::testing::TestPartResult::kFatalFailure);
    }
  }

#define ASSERT_WAIT_FOR_CONDITION(condition, timeout, description) \
  calcflow::test::assertWaitForCondition(                          \
      condition, timeout, description, __FILE__, __LINE__)

}  // namespace calcflow::test

#endif  // CALCFLOW_GTEST_WAIT_CONDITION_HPP
