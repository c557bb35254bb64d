// =============================================================================
// parz - Logger Tests
// =============================================================================

#include "parz/common/logger.h"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace parz::log {
namespace {

TEST(LoggerTest, InitializedByTestMain) {
    ASSERT_NE(logger(), nullptr);
    EXPECT_EQ(logger()->get_log_level(), quill::LogLevel::Warning);
}

TEST(LoggerTest, SecondInitKeepsFirstLogger) {
    quill::Logger* before = logger();
    init({.logFile = "", .level = Level::kTrace});
    EXPECT_EQ(logger(), before);
    EXPECT_EQ(logger()->get_log_level(), quill::LogLevel::Warning);
}

TEST(LoggerTest, MacrosAreUsableFromWorkerThreads) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([i] {
            PARZ_LOG_DEBUG("filtered record from thread {}", i);
            PARZ_LOG_WARNING("logger test record from thread {}", i);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_NE(logger(), nullptr);
}

}  // namespace
}  // namespace parz::log
