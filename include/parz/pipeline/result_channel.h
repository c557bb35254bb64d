// =============================================================================
// parz - Result Channel
// =============================================================================
// Unbounded many-producer, single-consumer channel.
//
// makeChannel<T>() returns a connected (Sender, Receiver) pair. Senders are
// copyable; the channel counts live senders so the receiver can tell an empty
// queue from a disconnected one. Once the receiver is destroyed, send() drops
// the value and returns false.
// =============================================================================

#ifndef PARZ_PIPELINE_RESULT_CHANNEL_H
#define PARZ_PIPELINE_RESULT_CHANNEL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace parz::pipeline {

namespace detail {

/// @brief State shared by the two ends of a channel.
template <typename T>
struct ChannelState {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<T> queue;
    std::size_t senders = 0;
    bool receiverAlive = true;
};

}  // namespace detail

// =============================================================================
// Sender
// =============================================================================

/// @brief Producer end of a channel.
template <typename T>
class Sender {
public:
    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {
        attach();
    }

    ~Sender() { detach(); }

    Sender(const Sender& other) : state_(other.state_) { attach(); }

    Sender& operator=(const Sender& other) {
        if (this != &other) {
            detach();
            state_ = other.state_;
            attach();
        }
        return *this;
    }

    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender&& other) noexcept {
        if (this != &other) {
            detach();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    /// @brief Queue a value for the receiver.
    /// @return false if the receiver is gone (the value is dropped).
    bool send(T value) {
        if (!state_) {
            return false;
        }
        {
            std::lock_guard lock(state_->mutex);
            if (!state_->receiverAlive) {
                return false;
            }
            state_->queue.push_back(std::move(value));
        }
        state_->cv.notify_one();
        return true;
    }

    /// @brief Disconnect early (equivalent to destruction).
    void close() noexcept {
        detach();
        state_.reset();
    }

private:
    void attach() {
        if (state_) {
            std::lock_guard lock(state_->mutex);
            ++state_->senders;
        }
    }

    void detach() noexcept {
        if (!state_) {
            return;
        }
        bool last = false;
        {
            std::lock_guard lock(state_->mutex);
            last = --state_->senders == 0;
        }
        if (last) {
            state_->cv.notify_all();
        }
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// =============================================================================
// Receiver
// =============================================================================

/// @brief Consumer end of a channel.
template <typename T>
class Receiver {
public:
    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) {}

    ~Receiver() {
        if (state_) {
            std::lock_guard lock(state_->mutex);
            state_->receiverAlive = false;
            state_->queue.clear();
        }
    }

    // Non-copyable, movable
    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;
    Receiver(Receiver&&) noexcept = default;
    Receiver& operator=(Receiver&&) noexcept = default;

    /// @brief Block until a value arrives.
    /// @return The value, or nullopt once every sender is gone and the queue
    ///         is drained.
    [[nodiscard]] std::optional<T> receive() {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait(lock, [this] { return !state_->queue.empty() || state_->senders == 0; });
        return popLocked();
    }

    /// @brief Take a value if one is queued, without blocking.
    [[nodiscard]] std::optional<T> tryReceive() {
        std::lock_guard lock(state_->mutex);
        return popLocked();
    }

    /// @brief Number of queued values.
    [[nodiscard]] std::size_t pending() const {
        std::lock_guard lock(state_->mutex);
        return state_->queue.size();
    }

    /// @brief Check whether every sender is gone.
    [[nodiscard]] bool disconnected() const {
        std::lock_guard lock(state_->mutex);
        return state_->senders == 0;
    }

private:
    std::optional<T> popLocked() {
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        return value;
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// =============================================================================
// Factory
// =============================================================================

/// @brief Create a connected channel.
template <typename T>
[[nodiscard]] std::pair<Sender<T>, Receiver<T>> makeChannel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

}  // namespace parz::pipeline

#endif  // PARZ_PIPELINE_RESULT_CHANNEL_H
