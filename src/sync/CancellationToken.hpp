#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>

namespace lnt::sync {

// Cooperative stop signal shared by every blocking wait of an engine instance.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    // Unregisters its callback on destruction. Once the destructor returns the
    // callback is guaranteed not to be running.
    class Registration {
    public:
        Registration() = default;
        Registration(CancellationToken& token, Callback callback);
        ~Registration();

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        CancellationToken* token_{nullptr};
        std::size_t id_{0};
    };

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void set();
    bool is_set() const noexcept;

    // Sleeps up to `timeout`; returns true as soon as the token is set.
    bool wait(std::chrono::milliseconds timeout) const;

    // The callback runs once, on the thread calling set(), or immediately when the
    // token is already set. Callbacks must not throw nor call back into the token.
    std::size_t add_callback(Callback callback);
    void remove_callback(std::size_t id);

private:
    std::atomic<bool> set_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;

    std::mutex callbackMutex_;
    std::map<std::size_t, Callback> callbacks_;
    std::size_t nextCallbackId_{1};
};

}  // namespace lnt::sync
