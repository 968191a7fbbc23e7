#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "sync/CancellationToken.hpp"
#include "sync/ErrorClassifier.hpp"
#include "sync/Errors.hpp"
#include "sync/ItemSource.hpp"
#include "sync/RetryPolicy.hpp"
#include "sync/SubscriberQueue.hpp"
#include "sync/UpstreamStream.hpp"

namespace lnt::sync {

// Type independent control surface, used by the service that owns the threads.
class DispatcherBase {
public:
    enum class State {
        NotSubscribed,
        SubscribedWaiting,
        Receiving,
        Stopped,
    };

    virtual ~DispatcherBase() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual State state() const = 0;
    virtual const std::string& name() const = 0;
};

inline const char* toString(DispatcherBase::State state) noexcept {
    switch (state) {
    case DispatcherBase::State::NotSubscribed:
        return "not_subscribed";
    case DispatcherBase::State::SubscribedWaiting:
        return "subscribed_waiting";
    case DispatcherBase::State::Receiving:
        return "receiving";
    case DispatcherBase::State::Stopped:
        return "stopped";
    }
    return "stopped";
}

struct DispatcherOptions {
    std::chrono::milliseconds gracePeriod{2000};
    std::chrono::milliseconds queuePollTimeout{15000};
};

// Owns one upstream subscription and fans every item out to append-only
// subscriber queues.
//
// start() runs on its own thread and is retried: each attempt waits for a
// subscriber, opens a fresh upstream stream, confirms liveness with the first
// item and then forwards items until the stream fails. A clean close counts as
// a failure. The outcome is pushed to every queue as a StreamEnded event.
//
// Each subscriber iterates its own source on the consumer thread:
// wait until receiving, grace period, drain the reconciliation source, then the
// live queue. A non cancellation StreamEnded restarts that cycle.
template <typename T>
class StreamDispatcher : public DispatcherBase {
public:
    using Options = DispatcherOptions;

    template <typename V>
    using Convert = std::function<std::vector<V>(const T&, bool inRecon)>;

    template <typename V>
    using ReconFactory = std::function<ItemSourcePtr<V>()>;

    // Zero-argument factory handed out by subscribe(). Every call yields a new
    // source for the same queue, starting with a new reconciliation cycle.
    // Callers that stop consuming for good must unsubscribe(id).
    template <typename V>
    struct Subscription {
        std::size_t id{0};
        std::function<ItemSourcePtr<V>()> open;

        ItemSourcePtr<V> operator()() const { return open(); }
    };

    StreamDispatcher(std::string name,
                     CancellationToken& token,
                     OpenStream<T> openStream,
                     const ErrorClassifier& classifier,
                     RetryPolicy::Options retryOptions,
                     Options options,
                     RetryPolicy::Clock clock = {})
        : name_(std::move(name)),
          token_(token),
          openStream_(std::move(openStream)),
          classifier_(classifier),
          retry_(token, classifier, retryOptions, std::move(clock)),
          options_(options),
          registration_(token, [this] { on_cancelled_(); }) {}

    ~StreamDispatcher() override { release_stream_(); }

    StreamDispatcher(const StreamDispatcher&) = delete;
    StreamDispatcher& operator=(const StreamDispatcher&) = delete;

    template <typename V>
    Subscription<V> subscribe(Convert<V> convert, ReconFactory<V> reconSource) {
        auto entry = std::make_shared<Entry>();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entry->id = nextId_++;
            entries_.push_back(entry);
        }
        cv_.notify_all();
        LOG_INFO(name_ << ": subscription " << entry->id << " registered");

        Subscription<V> subscription;
        subscription.id = entry->id;
        subscription.open = [this, entry, convert = std::move(convert), reconSource = std::move(reconSource)]() {
            return ItemSourcePtr<V>(std::make_unique<Source<V>>(*this, entry, convert, reconSource));
        };
        return subscription;
    }

    void start() override {
        bool expected = false;
        if (!started_.compare_exchange_strong(expected, true)) {
            LOG_DEBUG(name_ << ": start() ignored, dispatcher already started");
            return;
        }

        try {
            if (!retry_.run(name_, [this] { run_once_(); })) {
                set_state_(State::Stopped);
                broadcast_(StreamEnded{EndReason::UserCancelled, "cancelled"});
            }
        } catch (const std::exception& ex) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fatal_ = true;
            }
            set_state_(State::Stopped);
            broadcast_(StreamEnded{EndReason::Error, ex.what()});
            LOG_ERR(name_ << ": dispatcher stopped permanently: " << ex.what());
            throw;
        }
        LOG_INFO(name_ << ": dispatcher finished");
    }

    void stop() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_ = true;
            if (!started_.load()) {
                state_ = State::Stopped;
            }
        }
        cv_.notify_all();
        wake_queues_();
        release_stream_();
        LOG_INFO(name_ << ": stop requested");
    }

    // Pushes an error into one subscriber queue so that subscriber alone
    // reconciles again. Returns false for an unknown id.
    bool request_resync(std::size_t subscriptionId, const std::string& reason) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& candidate : entries_) {
                if (candidate->id == subscriptionId) {
                    entry = candidate;
                    break;
                }
            }
        }
        if (!entry) {
            return false;
        }
        entry->queue.push(StreamEvent<T>(std::in_place_index<1>, StreamEnded{EndReason::Error, reason}));
        return true;
    }

    // Detaches a subscriber: fan-out skips it from now on, its queue is dropped
    // and a source still reading it ends. Returns false for an unknown id.
    bool unsubscribe(std::size_t subscriptionId) {
        std::shared_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto it = entries_.begin(); it != entries_.end(); ++it) {
                if ((*it)->id == subscriptionId) {
                    entry = *it;
                    entries_.erase(it);
                    break;
                }
            }
        }
        if (!entry) {
            return false;
        }
        entry->queue.clear();
        entry->queue.push(
            StreamEvent<T>(std::in_place_index<1>, StreamEnded{EndReason::UserCancelled, "unsubscribed"}));
        LOG_INFO(name_ << ": subscription " << subscriptionId << " removed");
        return true;
    }

    State state() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    const std::string& name() const override { return name_; }

    std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    // Events waiting in subscriber queues.
    std::size_t queued_events() const {
        std::size_t total = 0;
        for (const auto& entry : entries_snapshot_()) {
            total += entry->queue.size();
        }
        return total;
    }

    // Number of upstream subscriptions opened so far.
    std::size_t open_count() const noexcept { return openCount_.load(); }

private:
    struct Entry {
        std::size_t id{0};
        SubscriberQueue<T> queue;
        std::atomic<bool> inRecon{false};
    };

    template <typename V>
    class Source : public ItemSource<V> {
    public:
        Source(StreamDispatcher& owner, std::shared_ptr<Entry> entry, Convert<V> convert, ReconFactory<V> recon)
            : owner_(owner), entry_(std::move(entry)), convert_(std::move(convert)), reconFactory_(std::move(recon)) {}

        std::optional<V> next() override {
            for (;;) {
                if (!pending_.empty()) {
                    V value = std::move(pending_.front());
                    pending_.pop_front();
                    return value;
                }

                switch (phase_) {
                case Phase::Done:
                    return std::nullopt;
                case Phase::WaitReceiving:
                    begin_cycle_();
                    break;
                case Phase::Recon:
                    if (auto value = drain_recon_()) {
                        return value;
                    }
                    break;
                case Phase::Live:
                    poll_live_();
                    break;
                }
            }
        }

        void close() override {
            phase_ = Phase::Done;
            pending_.clear();
            close_recon_();
        }

    private:
        enum class Phase {
            WaitReceiving,
            Recon,
            Live,
            Done,
        };

        void begin_cycle_() {
            if (!owner_.wait_receiving_()) {
                phase_ = Phase::Done;
                return;
            }
            entry_->inRecon.store(true);
            if (owner_.token_.wait(owner_.options_.gracePeriod)) {
                phase_ = Phase::Done;
                return;
            }

            lnt::common::metrics::Registry::instance().incrementCounter("recon_cycles_total");
            if (reconFactory_) {
                recon_ = reconFactory_();
            }
            if (recon_) {
                LOG_DEBUG(owner_.name_ << ": subscription " << entry_->id << " reconciling");
                phase_ = Phase::Recon;
            } else {
                LOG_INFO(owner_.name_ << ": subscription " << entry_->id
                                      << " has no reconciliation source, going live");
                phase_ = Phase::Live;
            }
        }

        std::optional<V> drain_recon_() {
            if (owner_.token_.is_set()) {
                close_recon_();
                phase_ = Phase::Done;
                return std::nullopt;
            }
            auto value = recon_->next();
            if (!value) {
                close_recon_();
                LOG_DEBUG(owner_.name_ << ": subscription " << entry_->id << " reconciliation finished");
                phase_ = Phase::Live;
            }
            return value;
        }

        void poll_live_() {
            if (entry_->inRecon.load() && entry_->queue.empty()) {
                entry_->inRecon.store(false);
                LOG_DEBUG(owner_.name_ << ": subscription " << entry_->id << " caught up");
            }

            auto event = entry_->queue.pop_for(owner_.options_.queuePollTimeout, owner_.token_);
            if (!event) {
                if (owner_.token_.is_set()) {
                    phase_ = Phase::Done;
                }
                return;
            }

            if (const auto* ended = std::get_if<StreamEnded>(&*event)) {
                if (ended->reason == EndReason::UserCancelled) {
                    LOG_DEBUG(owner_.name_ << ": subscription " << entry_->id << " ended by cancellation");
                    phase_ = Phase::Done;
                    return;
                }
                LOG_WARN(owner_.name_ << ": subscription " << entry_->id
                                      << " lost the stream, reconciling again: " << ended->message);
                phase_ = Phase::WaitReceiving;
                return;
            }

            try {
                auto converted = convert_(std::get<T>(*event), entry_->inRecon.load());
                for (auto& value : converted) {
                    pending_.push_back(std::move(value));
                }
            } catch (const std::exception& ex) {
                lnt::common::metrics::Registry::instance().incrementCounter("conversion_errors_total");
                LOG_WARN(owner_.name_ << ": skipping item that failed to convert: " << ex.what());
            }
        }

        void close_recon_() {
            if (recon_) {
                recon_->close();
                recon_.reset();
            }
        }

        StreamDispatcher& owner_;
        std::shared_ptr<Entry> entry_;
        Convert<V> convert_;
        ReconFactory<V> reconFactory_;
        ItemSourcePtr<V> recon_;
        std::deque<V> pending_;
        Phase phase_{Phase::WaitReceiving};
    };

    void run_once_() {
        if (!wait_for_subscribers_()) {
            set_state_(State::Stopped);
            broadcast_(StreamEnded{EndReason::UserCancelled, "cancelled"});
            return;
        }

        std::shared_ptr<UpstreamStream<T>> stream;
        bool receiving = false;
        try {
            stream = std::shared_ptr<UpstreamStream<T>>(openStream_());
            if (openCount_.fetch_add(1) > 0U) {
                lnt::common::metrics::Registry::instance().incrementCounter("dispatcher_reconnects_total");
            }
            bool cancelNow = false;
            {
                std::lock_guard<std::mutex> lock(streamMutex_);
                activeStream_ = stream;
                cancelNow = token_.is_set() || stop_requested_();
            }
            if (cancelNow) {
                stream->cancel();
            }
            set_state_(State::SubscribedWaiting);
            LOG_INFO(name_ << ": upstream subscription opened");

            auto item = stream->read();
            if (!item) {
                throw StreamClosedError();
            }
            set_state_(State::Receiving);
            receiving = true;
            LOG_INFO(name_ << ": receiving items");

            while (item) {
                fan_out_(*item);
                item = stream->read();
            }
            throw StreamClosedError();
        } catch (const std::exception& ex) {
            release_stream_();
            const bool cancelled = token_.is_set() || stop_requested_();
            const auto kind = cancelled ? ErrorKind::UserCancelled : classifier_.classify(ex);
            if (kind == ErrorKind::UserCancelled) {
                set_state_(State::Stopped);
                broadcast_(StreamEnded{EndReason::UserCancelled, ex.what()});
                LOG_INFO(name_ << ": upstream subscription cancelled");
                return;
            }

            set_state_(State::NotSubscribed);
            // Subscribers only go live on a receiving stream, so an attempt that
            // never got there has nobody to notify.
            if (receiving) {
                broadcast_(StreamEnded{EndReason::Error, ex.what()});
            }
            LOG_WARN(name_ << ": upstream subscription ended: " << ex.what());
            throw;
        }
    }

    bool wait_for_subscribers_() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (entries_.empty()) {
            LOG_INFO(name_ << ": waiting for the first subscriber");
        }
        cv_.wait(lock, [this] { return !entries_.empty() || token_.is_set() || stopRequested_; });
        return !(token_.is_set() || stopRequested_);
    }

    // Subscriber side. Returns false when the subscriber should end quietly.
    bool wait_receiving_() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] {
            return state_ == State::Receiving || state_ == State::Stopped || token_.is_set();
        });
        if (token_.is_set()) {
            return false;
        }
        if (state_ == State::Stopped && fatal_) {
            throw DispatcherStoppedError(name_);
        }
        return state_ == State::Receiving;
    }

    bool stop_requested_() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopRequested_;
    }

    std::vector<std::shared_ptr<Entry>> entries_snapshot_() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    void fan_out_(const T& item) {
        for (const auto& entry : entries_snapshot_()) {
            entry->queue.push(StreamEvent<T>(std::in_place_index<0>, item));
        }
        lnt::common::metrics::Registry::instance().incrementCounter("dispatcher_items_total");
    }

    void broadcast_(const StreamEnded& ended) {
        for (const auto& entry : entries_snapshot_()) {
            entry->queue.push(StreamEvent<T>(std::in_place_index<1>, ended));
        }
    }

    void set_state_(State state) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = state;
        }
        cv_.notify_all();
        lnt::common::metrics::Registry::instance().setGauge("dispatcher_state." + name_,
                                                            static_cast<double>(state));
    }

    void release_stream_() {
        std::shared_ptr<UpstreamStream<T>> stream;
        {
            std::lock_guard<std::mutex> lock(streamMutex_);
            stream = std::move(activeStream_);
            activeStream_.reset();
        }
        if (stream) {
            stream->cancel();
        }
    }

    void wake_queues_() {
        for (const auto& entry : entries_snapshot_()) {
            entry->queue.wake();
        }
    }

    void on_cancelled_() {
        { std::lock_guard<std::mutex> lock(mutex_); }
        cv_.notify_all();
        wake_queues_();
        release_stream_();
    }

    std::string name_;
    CancellationToken& token_;
    OpenStream<T> openStream_;
    const ErrorClassifier& classifier_;
    RetryPolicy retry_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_{State::NotSubscribed};
    bool fatal_{false};
    bool stopRequested_{false};
    std::vector<std::shared_ptr<Entry>> entries_;
    std::size_t nextId_{1};

    std::atomic<bool> started_{false};
    std::atomic<std::size_t> openCount_{0};

    std::mutex streamMutex_;
    std::shared_ptr<UpstreamStream<T>> activeStream_;

    CancellationToken::Registration registration_;
};

}  // namespace lnt::sync
