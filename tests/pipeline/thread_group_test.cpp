// =============================================================================
// parz - Thread Group Tests
// =============================================================================

#include "parz/pipeline/thread_group.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <new>
#include <thread>

namespace parz::pipeline {
namespace {

TEST(ThreadGroupTest, JoinsWhenCollectionThrows) {
    std::atomic<int> finished{0};

    auto collect = [&] {
        ThreadGroup group(3);
        for (int i = 0; i < 3; ++i) {
            group.spawn([&finished] {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                finished.fetch_add(1);
            });
        }
        // Same failure a growing chunk vector would raise mid-receive
        throw std::bad_alloc();
    };

    EXPECT_THROW(collect(), std::bad_alloc);
    EXPECT_EQ(finished.load(), 3);
}

TEST(ThreadGroupTest, JoinAllIsIdempotent) {
    std::atomic<int> finished{0};
    ThreadGroup group(2);
    group.spawn([&finished] { finished.fetch_add(1); });
    group.spawn([&finished] { finished.fetch_add(1); });
    EXPECT_EQ(group.size(), 2u);

    group.joinAll();
    EXPECT_EQ(finished.load(), 2);
    group.joinAll();
}

}  // namespace
}  // namespace parz::pipeline
