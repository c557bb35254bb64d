// =============================================================================
// parz - Thread Group
// =============================================================================
// Owns the worker threads of one collection run and joins all of them when
// it goes out of scope, so an exception thrown while collecting never
// destroys a joinable std::thread.
// =============================================================================

#ifndef PARZ_PIPELINE_THREAD_GROUP_H
#define PARZ_PIPELINE_THREAD_GROUP_H

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace parz::pipeline {

class ThreadGroup {
public:
    explicit ThreadGroup(std::size_t capacity) { threads_.reserve(capacity); }

    ~ThreadGroup() { joinAll(); }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    /// @brief Start a thread running @p body.
    /// @throws std::system_error if the thread cannot be created.
    template <typename F>
    void spawn(F&& body) {
        threads_.emplace_back(std::forward<F>(body));
    }

    /// @brief Join every thread that is still joinable. Safe to call twice.
    void joinAll() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

}  // namespace parz::pipeline

#endif  // PARZ_PIPELINE_THREAD_GROUP_H
