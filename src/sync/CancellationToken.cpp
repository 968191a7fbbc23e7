#include "sync/CancellationToken.hpp"

#include <utility>

namespace lnt::sync {

CancellationToken::Registration::Registration(CancellationToken& token, Callback callback)
    : token_(&token), id_(token.add_callback(std::move(callback))) {}

CancellationToken::Registration::~Registration() {
    if (token_ != nullptr && id_ != 0U) {
        token_->remove_callback(id_);
    }
}

void CancellationToken::set() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (set_.exchange(true)) {
            return;
        }
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> lock(callbackMutex_);
    for (auto& [id, callback] : callbacks_) {
        callback();
    }
    callbacks_.clear();
}

bool CancellationToken::is_set() const noexcept { return set_.load(std::memory_order_acquire); }

bool CancellationToken::wait(std::chrono::milliseconds timeout) const {
    if (timeout <= std::chrono::milliseconds::zero()) {
        return is_set();
    }
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return set_.load(std::memory_order_acquire); });
}

std::size_t CancellationToken::add_callback(Callback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    if (is_set()) {
        callback();
        return 0U;
    }
    const auto id = nextCallbackId_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void CancellationToken::remove_callback(std::size_t id) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callbacks_.erase(id);
}

}  // namespace lnt::sync
