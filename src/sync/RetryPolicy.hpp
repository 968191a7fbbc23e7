#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "sync/CancellationToken.hpp"
#include "sync/ErrorClassifier.hpp"

namespace lnt::sync {

template <typename R>
struct RetryOutcome {
    using type = std::optional<R>;
};

template <>
struct RetryOutcome<void> {
    using type = bool;
};

// Retries transient failures with a fixed delay. The budget is refilled when the
// failing attempt had been running longer than the tolerance window.
// Cancellation during the delay yields an empty outcome (nullopt / false).
class RetryPolicy {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Options {
        std::size_t maxRetries = 5;
        std::chrono::milliseconds delay{300000};
        std::optional<std::chrono::milliseconds> toleranceWindow{std::chrono::milliseconds{900000}};
    };

    RetryPolicy(const CancellationToken& token,
                const ErrorClassifier& classifier,
                Options options,
                Clock clock = {});

    template <typename Fn>
    auto run(const std::string& name, Fn&& fn) const
        -> typename RetryOutcome<std::invoke_result_t<Fn&>>::type {
        using Result = std::invoke_result_t<Fn&>;

        std::size_t retriesLeft = options_.maxRetries;
        for (;;) {
            const auto attemptStart = now_();
            try {
                if constexpr (std::is_void_v<Result>) {
                    fn();
                    return true;
                } else {
                    return std::optional<Result>(fn());
                }
            } catch (const std::exception& ex) {
                switch (on_failure_(name, ex, attemptStart, retriesLeft)) {
                case Decision::Rethrow:
                    throw;
                case Decision::Cancelled:
                    return {};
                case Decision::Retry:
                    break;
                }
            }
        }
    }

    // Decorator form: the returned callable runs `fn` under this policy.
    template <typename Fn>
    auto wrap(std::string name, Fn fn) const {
        return [this, name = std::move(name), fn = std::move(fn)]() mutable { return run(name, fn); };
    }

    const Options& options() const noexcept { return options_; }

private:
    enum class Decision {
        Retry,
        Rethrow,
        Cancelled,
    };

    Decision on_failure_(const std::string& name,
                         const std::exception& error,
                         std::chrono::steady_clock::time_point attemptStart,
                         std::size_t& retriesLeft) const;
    std::chrono::steady_clock::time_point now_() const;

    const CancellationToken& token_;
    const ErrorClassifier& classifier_;
    Options options_;
    Clock clock_;
};

}  // namespace lnt::sync
