#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "app/TrackerOptions.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Ports.hpp"
#include "sync/CancellationToken.hpp"
#include "sync/ErrorClassifier.hpp"
#include "sync/ItemSource.hpp"
#include "sync/RetryPolicy.hpp"
#include "sync/StreamDispatcher.hpp"

namespace app {

// Control surface of one event category, driven by TrackerService.
class ITracker {
public:
    virtual ~ITracker() = default;

    virtual const std::string& name() const = 0;

    // Copies everything the node produced since the stored checkpoint. Returns
    // once the history is exhausted, pre_sync_stop() was called or the token
    // was set.
    virtual void pre_sync_start() = 0;
    virtual void pre_sync_stop() = 0;

    // Persists live items as they arrive until the token is set.
    virtual void start() = 0;
};

// Shared ingestion loop. Subclasses provide the sources, this class owns the
// retry handling and the writes to the sink.
template <typename Row>
class Tracker : public ITracker {
public:
    using StreamFactory = std::function<lnt::sync::ItemSourcePtr<Row>()>;

    Tracker(std::string name,
            std::string nodeId,
            lnt::sync::CancellationToken& token,
            domain::IEventSink<Row>& sink,
            const lnt::sync::ErrorClassifier& classifier,
            TrackerOptions options,
            lnt::sync::RetryPolicy::Clock clock = {})
        : name_(std::move(name)),
          nodeId_(std::move(nodeId)),
          token_(token),
          sink_(sink),
          classifier_(classifier),
          options_(std::move(options)),
          retry_(token, classifier, options_.retry, std::move(clock)) {}

    const std::string& name() const override { return name_; }

    void pre_sync_start() override {
        preSyncStopRequested_.store(false);
        LOG_INFO(name_ << ": pre-sync for node " << nodeId_ << " started");
        try {
            if (!retry_.run(name_ + ".pre_sync", [this] { pre_sync_once_(); })) {
                LOG_INFO(name_ << ": pre-sync cancelled");
                return;
            }
        } catch (const std::exception& ex) {
            if (cancelled_("pre_sync_start", ex)) {
                return;
            }
            fail_("pre_sync_start", ex);
            throw;
        }
        LOG_INFO(name_ << ": pre-sync for node " << nodeId_ << " finished");
    }

    void pre_sync_stop() override {
        preSyncStopRequested_.store(true);
        LOG_DEBUG(name_ << ": pre-sync stop requested");
    }

    void start() override {
        if (token_.is_set()) {
            return;
        }
        if (!streamFactory_) {
            streamFactory_ = new_stream_factory();
        }
        try {
            if (!retry_.run(name_ + ".stream", [this] { stream_once_(); })) {
                LOG_INFO(name_ << ": live stream cancelled");
                return;
            }
        } catch (const std::exception& ex) {
            if (cancelled_("start", ex)) {
                return;
            }
            fail_("start", ex);
            release_stream_();
            throw;
        }
        LOG_INFO(name_ << ": live stream finished");
    }

protected:
    // Source of the pre-sync, nullptr when the category has none.
    virtual lnt::sync::ItemSourcePtr<Row> pre_sync_source() = 0;

    // Called once per start(); the factory is invoked again on every retry.
    virtual StreamFactory new_stream_factory() = 0;

    virtual void delete_orphaned_data() {}

    // Subscribes to `dispatcher` and returns the factory for
    // new_stream_factory(). The subscription is dropped when start() fails for
    // good, so the dispatcher stops queueing items nobody reads.
    template <typename T>
    StreamFactory subscribe_to(lnt::sync::StreamDispatcher<T>& dispatcher,
                               typename lnt::sync::StreamDispatcher<T>::template Convert<Row> convert,
                               typename lnt::sync::StreamDispatcher<T>::template ReconFactory<Row> recon) {
        auto subscription = dispatcher.template subscribe<Row>(std::move(convert), std::move(recon));
        const auto id = subscription.id;
        releaseStream_ = [&dispatcher, id] { dispatcher.unsubscribe(id); };
        return [subscription] { return subscription(); };
    }

    // Drops in-memory progress after a fatal error.
    virtual void reset_state() {}

    const std::string& node_id() const noexcept { return nodeId_; }
    lnt::sync::CancellationToken& token() noexcept { return token_; }
    domain::IEventSink<Row>& sink() noexcept { return sink_; }
    const TrackerOptions& options() const noexcept { return options_; }

private:
    void pre_sync_once_() {
        if (token_.is_set()) {
            return;
        }
        delete_orphaned_data();

        auto inner = pre_sync_source();
        if (!inner) {
            LOG_INFO(name_ << ": no pre-sync source");
            return;
        }
        lnt::sync::StreamLogger<Row> source(std::move(inner), name_ + ".pre_sync");

        std::vector<Row> batch;
        batch.reserve(options_.batchSize);
        while (auto row = source.next()) {
            batch.push_back(std::move(*row));
            if (batch.size() < options_.batchSize) {
                continue;
            }
            flush_(batch);
            if (preSyncStopRequested_.load() || token_.is_set()) {
                source.close();
                LOG_INFO(name_ << ": pre-sync interrupted after " << source.count() << " items");
                return;
            }
        }
        flush_(batch);
    }

    void stream_once_() {
        lnt::sync::StreamLogger<Row> source(streamFactory_(), name_ + ".stream");
        auto& registry = lnt::common::metrics::Registry::instance();
        while (auto row = source.next()) {
            sink_.add_one(*row);
            registry.incrementCounter("tracker_items_total." + name_);
            if (token_.is_set()) {
                break;
            }
        }
        source.close();
    }

    void flush_(std::vector<Row>& batch) {
        if (batch.empty()) {
            return;
        }
        {
            lnt::common::metrics::Registry::ScopedTimer timer("presync_batch." + name_);
            sink_.add_batch(batch);
        }
        lnt::common::metrics::Registry::instance().incrementCounter("tracker_items_total." + name_,
                                                                    batch.size());
        LOG_DEBUG(name_ << ": stored batch of " << batch.size() << " items");
        batch.clear();
    }

    void release_stream_() {
        if (releaseStream_) {
            releaseStream_();
            releaseStream_ = nullptr;
        }
        streamFactory_ = nullptr;
    }

    bool cancelled_(const char* operation, const std::exception& ex) const {
        if (classifier_.classify(ex) != lnt::sync::ErrorKind::UserCancelled) {
            return false;
        }
        LOG_DEBUG(name_ << ": " << operation << " cancelled: " << ex.what());
        return true;
    }

    void fail_(const char* operation, const std::exception& ex) {
        LOG_ERR(name_ << ": " << operation << " failed for node " << nodeId_ << " (batch " << options_.batchSize
                      << ", max retries " << options_.retry.maxRetries << "): " << ex.what());
        reset_state();
    }

    std::string name_;
    std::string nodeId_;
    lnt::sync::CancellationToken& token_;
    domain::IEventSink<Row>& sink_;
    const lnt::sync::ErrorClassifier& classifier_;
    TrackerOptions options_;
    lnt::sync::RetryPolicy retry_;
    StreamFactory streamFactory_;
    std::function<void()> releaseStream_;
    std::atomic<bool> preSyncStopRequested_{false};
};

}  // namespace app
