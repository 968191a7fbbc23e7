#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "sync/CancellationToken.hpp"

namespace lnt::sync {

enum class EndReason {
    UserCancelled,
    Error,
};

// Sentinel pushed into every subscriber queue when the upstream stream ends.
struct StreamEnded {
    EndReason reason{EndReason::Error};
    std::string message;
};

template <typename T>
using StreamEvent = std::variant<T, StreamEnded>;

template <typename T>
class SubscriberQueue {
public:
    void push(StreamEvent<T> event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    // Waits up to `timeout` for an event. Returns std::nullopt on timeout or
    // once the token is set.
    std::optional<StreamEvent<T>> pop_for(std::chrono::milliseconds timeout, const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&] { return token.is_set() || !events_.empty(); });
        if (token.is_set() || events_.empty()) {
            return std::nullopt;
        }
        StreamEvent<T> event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    // Wakes waiters so they re-check the token.
    void wake() {
        { std::lock_guard<std::mutex> lock(mutex_); }
        cv_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamEvent<T>> events_;
};

}  // namespace lnt::sync
