#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "app/EventStreamTracker.hpp"
#include "app/ForwardTracker.hpp"
#include "app/InvoiceTracker.hpp"
#include "app/PaymentTracker.hpp"
#include "app/TrackerOptions.hpp"
#include "app/TrackerService.hpp"
#include "support/Fakes.hpp"
#include "sync/CancellationToken.hpp"
#include "sync/ErrorClassifier.hpp"
#include "sync/StreamDispatcher.hpp"

using domain::PaymentStatus;
using lnt::sync::CancellationToken;
using lnt::sync::DefaultErrorClassifier;
using lnt::sync::StreamDispatcher;
using lnt::testing::FakeHistory;
using lnt::testing::FakeStreamFactory;
using lnt::testing::MemorySink;
using lnt::testing::StreamEnd;
using lnt::testing::StreamScript;
using lnt::testing::makePayment;
using lnt::testing::waitForCondition;

namespace {
using namespace std::chrono_literals;

constexpr const char* kNodeId = "02node";

app::TrackerOptions fastOptions() {
    app::TrackerOptions options;
    options.pageSize = 2;
    options.batchSize = 2;
    options.gracePeriod = 0ms;
    options.queuePollTimeout = 50ms;
    options.tailPollInterval = 20ms;
    options.retry.maxRetries = 2;
    options.retry.delay = 0ms;
    options.retry.toleranceWindow.reset();
    return options;
}

MemorySink<domain::Payment> paymentSink() {
    return MemorySink<domain::Payment>([](const domain::Payment& row) { return row.paymentIndex; });
}

// Joins the thread running a tracker's live stream and keeps its failure.
class LiveThread {
public:
    explicit LiveThread(app::ITracker& tracker)
        : thread_([this, &tracker] {
              try {
                  tracker.start();
              } catch (const std::exception& ex) {
                  failed_ = true;
                  std::cerr << "live stream failed: " << ex.what() << "\n";
              }
          }) {}

    ~LiveThread() { join(); }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool failed() const { return failed_; }

private:
    bool failed_{false};
    std::thread thread_;
};

}  // namespace

int main() {
    const DefaultErrorClassifier classifier;

    {
        // Pre-sync keeps only resolved payments and writes them in batches.
        CancellationToken token;
        FakeHistory history;
        for (std::uint64_t i = 1; i <= 5; ++i) {
            history.payments.push_back(makePayment(i, i == 3 ? PaymentStatus::InFlight : PaymentStatus::Succeeded));
        }
        auto sink = paymentSink();
        FakeStreamFactory<domain::Payment> streams;
        StreamDispatcher<domain::Payment> dispatcher("track_payments", token, streams.opener(), classifier,
                                                     fastOptions().retry, fastOptions().dispatcherOptions());
        app::PaymentTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history, dispatcher);

        tracker.pre_sync_start();
        if (sink.keys() != std::vector<std::uint64_t>({1, 2, 4, 5})) {
            std::cerr << "Pre-sync stored the wrong payments\n";
            return 1;
        }
        if (sink.batches() != 2 || sink.delete_calls() != 1) {
            std::cerr << "Expected 2 batches and one orphan cleanup, got " << sink.batches() << "\n";
            return 1;
        }
        if (sink.find(4)->nodeId != kNodeId) {
            std::cerr << "Stored payment is missing the node id\n";
            return 1;
        }
    }

    {
        // Pre-sync resumes after the stored checkpoint.
        CancellationToken token;
        FakeHistory history;
        for (std::uint64_t i = 1; i <= 4; ++i) {
            history.payments.push_back(makePayment(i, PaymentStatus::Failed));
        }
        auto sink = paymentSink();
        sink.add_batch({makePayment(1, PaymentStatus::Failed), makePayment(2, PaymentStatus::Failed)});
        FakeStreamFactory<domain::Payment> streams;
        StreamDispatcher<domain::Payment> dispatcher("track_payments", token, streams.opener(), classifier,
                                                     fastOptions().retry, fastOptions().dispatcherOptions());
        app::PaymentTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history, dispatcher);

        tracker.pre_sync_start();
        if (history.paymentQueries.empty() || history.paymentQueries.front().index_offset != 2 ||
            !history.paymentQueries.front().include_incomplete) {
            std::cerr << "Pre-sync did not start from the checkpoint\n";
            return 1;
        }
        if (sink.size() != 4) {
            std::cerr << "Expected 4 stored payments, got " << sink.size() << "\n";
            return 1;
        }
    }

    {
        // pre_sync_stop() ends the pre-sync after the current batch.
        CancellationToken token;
        FakeHistory history;
        for (std::uint64_t i = 1; i <= 6; ++i) {
            history.payments.push_back(makePayment(i, PaymentStatus::Succeeded));
        }
        auto sink = paymentSink();
        FakeStreamFactory<domain::Payment> streams;
        StreamDispatcher<domain::Payment> dispatcher("track_payments", token, streams.opener(), classifier,
                                                     fastOptions().retry, fastOptions().dispatcherOptions());
        app::PaymentTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history, dispatcher);

        sink.on_batch([&tracker] { tracker.pre_sync_stop(); });
        tracker.pre_sync_start();
        if (sink.size() != 2) {
            std::cerr << "Stopped pre-sync should store exactly one batch, stored " << sink.size() << "\n";
            return 1;
        }

        // A new pre-sync is not affected by the earlier stop.
        sink.on_batch(nullptr);
        tracker.pre_sync_start();
        if (sink.size() != 6) {
            std::cerr << "Restarted pre-sync should store everything, stored " << sink.size() << "\n";
            return 1;
        }
    }

    {
        // A cancellation reported by the backend ends the pre-sync quietly.
        CancellationToken token;
        FakeHistory history;
        for (std::uint64_t i = 1; i <= 4; ++i) {
            history.payments.push_back(makePayment(i, PaymentStatus::Succeeded));
        }
        auto sink = paymentSink();
        sink.fail_next_batches(1, std::make_exception_ptr(lnt::sync::UserCancelledError("node shutting down")));
        FakeStreamFactory<domain::Payment> streams;
        StreamDispatcher<domain::Payment> dispatcher("track_payments", token, streams.opener(), classifier,
                                                     fastOptions().retry, fastOptions().dispatcherOptions());
        app::PaymentTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history, dispatcher);

        try {
            tracker.pre_sync_start();
        } catch (const std::exception& ex) {
            std::cerr << "Cancelled pre-sync should not fail: " << ex.what() << "\n";
            return 1;
        }
        if (sink.batches() != 1 || sink.size() != 0) {
            std::cerr << "Cancelled pre-sync should not be retried, batches " << sink.batches() << "\n";
            return 1;
        }
    }

    {
        // A failed write is retried from the checkpoint.
        CancellationToken token;
        FakeHistory history;
        for (std::uint64_t i = 1; i <= 3; ++i) {
            history.payments.push_back(makePayment(i, PaymentStatus::Succeeded));
        }
        auto sink = paymentSink();
        sink.fail_next_batches(1);
        FakeStreamFactory<domain::Payment> streams;
        StreamDispatcher<domain::Payment> dispatcher("track_payments", token, streams.opener(), classifier,
                                                     fastOptions().retry, fastOptions().dispatcherOptions());
        app::PaymentTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history, dispatcher);

        tracker.pre_sync_start();
        if (sink.size() != 3) {
            std::cerr << "Pre-sync did not recover from a failed write\n";
            return 1;
        }
    }

    {
        // Live payments plus reconciliation; the recon index stops before the
        // first unresolved payment.
        CancellationToken token;
        FakeHistory history;
        history.payments.push_back(makePayment(1, PaymentStatus::Succeeded));
        history.payments.push_back(makePayment(2, PaymentStatus::Failed));
        history.payments.push_back(makePayment(3, PaymentStatus::InFlight));
        history.payments.push_back(makePayment(4, PaymentStatus::Succeeded));
        auto sink = paymentSink();

        FakeStreamFactory<domain::Payment> streams;
        streams.add(StreamScript<domain::Payment>{{makePayment(6, PaymentStatus::Succeeded)}, StreamEnd::Block});
        StreamDispatcher<domain::Payment> dispatcher("track_payments", token, streams.opener(), classifier,
                                                     fastOptions().retry, fastOptions().dispatcherOptions());
        app::PaymentTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history, dispatcher);

        std::thread dispatcherThread([&dispatcher] { dispatcher.start(); });
        LiveThread live(tracker);
        const bool stored = waitForCondition([&] { return sink.size() == 4; }, 2000ms);
        token.set();
        live.join();
        dispatcherThread.join();

        if (!stored || sink.keys() != std::vector<std::uint64_t>({1, 2, 4, 6})) {
            std::cerr << "Live payments and reconciliation did not produce the expected rows\n";
            return 1;
        }
        if (tracker.next_recon_index() != 2) {
            std::cerr << "Expected recon index 2, got " << tracker.next_recon_index() << "\n";
            return 1;
        }
        if (live.failed()) {
            return 1;
        }
    }

    {
        // Only settled invoices are kept.
        CancellationToken token;
        FakeHistory history;
        for (std::uint64_t i = 1; i <= 3; ++i) {
            domain::Invoice invoice;
            invoice.addIndex = i;
            invoice.state = i == 2 ? domain::InvoiceState::Open : domain::InvoiceState::Settled;
            history.invoices.push_back(invoice);
        }
        MemorySink<domain::Invoice> sink([](const domain::Invoice& row) { return row.addIndex; });
        FakeStreamFactory<domain::Invoice> streams;
        StreamDispatcher<domain::Invoice> dispatcher("subscribe_invoices", token, streams.opener(), classifier,
                                                     fastOptions().retry, fastOptions().dispatcherOptions());
        app::InvoiceTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history, dispatcher);

        tracker.pre_sync_start();
        if (sink.keys() != std::vector<std::uint64_t>({1, 3})) {
            std::cerr << "Invoice pre-sync stored unsettled invoices\n";
            return 1;
        }
    }

    {
        // Forwards are tailed from the checkpoint after the pre-sync.
        CancellationToken token;
        FakeHistory history;
        for (std::uint64_t i = 1; i <= 3; ++i) {
            history.add_forward(i);
        }
        MemorySink<domain::ForwardingEvent> sink(
            [](const domain::ForwardingEvent& row) { return row.offsetIndex; });
        app::ForwardTracker tracker(kNodeId, token, sink, classifier, fastOptions(), history);

        tracker.pre_sync_start();
        if (sink.size() != 3) {
            std::cerr << "Forward pre-sync stored " << sink.size() << " events\n";
            return 1;
        }

        LiveThread live(tracker);
        std::this_thread::sleep_for(30ms);
        history.add_forward(4);
        history.add_forward(5);
        const bool tailed = waitForCondition([&] { return sink.size() == 5; }, 2000ms);
        token.set();
        live.join();
        if (!tailed || sink.find(5)->nodeId != kNodeId || live.failed()) {
            std::cerr << "Forward tail did not pick up new events\n";
            return 1;
        }
    }

    {
        // Stream-only categories apply their filter and have no pre-sync.
        CancellationToken token;
        domain::HtlcEvent subscribed;
        subscribed.kind = "subscribed_event";
        domain::HtlcEvent forward;
        forward.kind = "forward_event";
        forward.incomingHtlcId = 7;

        FakeStreamFactory<domain::HtlcEvent> streams;
        streams.add(StreamScript<domain::HtlcEvent>{{subscribed, forward}, StreamEnd::Block});
        StreamDispatcher<domain::HtlcEvent> dispatcher("subscribe_htlc_events", token, streams.opener(),
                                                       classifier, fastOptions().retry,
                                                       fastOptions().dispatcherOptions());
        MemorySink<domain::HtlcEvent> sink([](const domain::HtlcEvent& row) { return row.incomingHtlcId; });
        app::EventStreamTracker<domain::HtlcEvent> tracker(
            kNodeId, token, sink, classifier, fastOptions(), dispatcher,
            [](const domain::HtlcEvent& event) { return event.kind != "subscribed_event"; });

        tracker.pre_sync_start();
        if (sink.size() != 0 || sink.batches() != 0) {
            std::cerr << "Stream-only tracker should not pre-sync\n";
            return 1;
        }

        std::thread dispatcherThread([&dispatcher] { dispatcher.start(); });
        LiveThread live(tracker);
        const bool stored = waitForCondition([&] { return sink.size() == 1; }, 2000ms);
        std::this_thread::sleep_for(20ms);
        token.set();
        live.join();
        dispatcherThread.join();
        if (!stored || sink.size() != 1 || !sink.find(7) || sink.find(7)->nodeId != kNodeId) {
            std::cerr << "HTLC filter was not applied\n";
            return 1;
        }
    }

    {
        // On-chain transactions are only written when storing is switched on.
        CancellationToken token;
        domain::OnchainTransaction unconfirmed;
        unconfirmed.txHash = "ff00";
        domain::OnchainTransaction confirmed = unconfirmed;
        confirmed.blockHeight = 800001;

        FakeStreamFactory<domain::OnchainTransaction> streams;
        streams.add(StreamScript<domain::OnchainTransaction>{{unconfirmed, confirmed}, StreamEnd::Block});
        StreamDispatcher<domain::OnchainTransaction> dispatcher("subscribe_transactions", token, streams.opener(),
                                                                classifier, fastOptions().retry,
                                                                fastOptions().dispatcherOptions());
        const auto byHeight = [](const domain::OnchainTransaction& row) {
            return static_cast<std::uint64_t>(row.blockHeight);
        };
        MemorySink<domain::OnchainTransaction> stored(byHeight);
        MemorySink<domain::OnchainTransaction> discarded(byHeight);
        app::EventStreamTracker<domain::OnchainTransaction> storing(
            kNodeId, token, stored, classifier, fastOptions(), dispatcher,
            [](const domain::OnchainTransaction&) { return true; });
        app::EventStreamTracker<domain::OnchainTransaction> receiveOnly(
            kNodeId, token, discarded, classifier, fastOptions(), dispatcher,
            [](const domain::OnchainTransaction&) { return false; });

        LiveThread liveStoring(storing);
        LiveThread liveReceiveOnly(receiveOnly);
        const bool subscribed = waitForCondition([&] { return dispatcher.subscriber_count() == 2; }, 2000ms);
        std::thread dispatcherThread([&dispatcher] { dispatcher.start(); });
        const bool delivered = waitForCondition([&] { return stored.size() == 2; }, 2000ms);
        std::this_thread::sleep_for(50ms);
        token.set();
        liveStoring.join();
        liveReceiveOnly.join();
        dispatcherThread.join();
        if (!subscribed || !delivered || !stored.find(800001) || !stored.find(0) || stored.find(0)->nodeId != kNodeId ||
            discarded.size() != 0 ||
            liveReceiveOnly.failed()) {
            std::cerr << "Transaction store switch was not honoured\n";
            return 1;
        }
    }

    {
        // A live stream cancelled by the backend returns without an error.
        CancellationToken token;
        domain::HtlcEvent event;
        event.kind = "settle_event";
        event.incomingHtlcId = 3;
        FakeStreamFactory<domain::HtlcEvent> streams;
        streams.add(StreamScript<domain::HtlcEvent>{{event}, StreamEnd::Block});
        StreamDispatcher<domain::HtlcEvent> dispatcher("subscribe_htlc_events", token, streams.opener(),
                                                       classifier, fastOptions().retry,
                                                       fastOptions().dispatcherOptions());
        MemorySink<domain::HtlcEvent> sink([](const domain::HtlcEvent& row) { return row.incomingHtlcId; });
        sink.fail_next_rows(1, std::make_exception_ptr(lnt::sync::UserCancelledError("stream cancelled")));
        app::EventStreamTracker<domain::HtlcEvent> tracker(kNodeId, token, sink, classifier, fastOptions(),
                                                           dispatcher);

        std::thread dispatcherThread([&dispatcher] { dispatcher.start(); });
        LiveThread live(tracker);
        live.join();
        const bool stillSubscribed = dispatcher.subscriber_count() == 1;
        token.set();
        dispatcherThread.join();
        if (live.failed() || !stillSubscribed) {
            std::cerr << "Cancelled live stream should end quietly and keep its subscription\n";
            return 1;
        }
    }

    {
        // A tracker that fails for good leaves the dispatcher, so nothing
        // piles up in a queue nobody reads.
        CancellationToken token;
        std::vector<domain::HtlcEvent> events(50);
        for (std::size_t i = 0; i < events.size(); ++i) {
            events[i].kind = "forward_event";
            events[i].incomingHtlcId = i + 1;
        }
        FakeStreamFactory<domain::HtlcEvent> streams;
        streams.add(StreamScript<domain::HtlcEvent>{events, StreamEnd::Block});
        StreamDispatcher<domain::HtlcEvent> dispatcher("subscribe_htlc_events", token, streams.opener(),
                                                       classifier, fastOptions().retry,
                                                       fastOptions().dispatcherOptions());
        MemorySink<domain::HtlcEvent> sink([](const domain::HtlcEvent& row) { return row.incomingHtlcId; });
        sink.fail_next_rows(1, std::make_exception_ptr(lnt::sync::FatalError("disk is read-only")));
        app::EventStreamTracker<domain::HtlcEvent> tracker(kNodeId, token, sink, classifier, fastOptions(),
                                                           dispatcher);

        std::thread dispatcherThread([&dispatcher] { dispatcher.start(); });
        LiveThread live(tracker);
        live.join();
        const bool failed = live.failed();
        const auto subscribers = dispatcher.subscriber_count();
        const auto queued = dispatcher.queued_events();
        token.set();
        dispatcherThread.join();
        if (!failed || subscribers != 0 || queued != 0) {
            std::cerr << "Failed tracker left " << subscribers << " subscribers and " << queued
                      << " queued events\n";
            return 1;
        }
    }

    {
        // The service runs pre-sync then live for each tracker, and a failing
        // dispatcher only takes its own tracker down.
        CancellationToken token;
        FakeHistory history;
        history.add_forward(1);
        MemorySink<domain::ForwardingEvent> forwards(
            [](const domain::ForwardingEvent& row) { return row.offsetIndex; });
        FakeStreamFactory<domain::ChannelEvent> channelStreams;
        for (int i = 0; i < 3; ++i) {
            channelStreams.add(StreamScript<domain::ChannelEvent>{{}, StreamEnd::FailOpen});
        }
        MemorySink<domain::ChannelEvent> channels(
            [](const domain::ChannelEvent& row) { return static_cast<std::uint64_t>(row.receivedAtMs); });

        app::TrackerService service(token);
        service.add_tracker(
            std::make_unique<app::ForwardTracker>(kNodeId, token, forwards, classifier, fastOptions(), history));
        auto& dispatcher = service.add_dispatcher(std::make_unique<StreamDispatcher<domain::ChannelEvent>>(
            "subscribe_channel_events", token, channelStreams.opener(), classifier, fastOptions().retry,
            fastOptions().dispatcherOptions()));
        service.add_tracker(std::make_unique<app::EventStreamTracker<domain::ChannelEvent>>(
            kNodeId, token, channels, classifier, fastOptions(), dispatcher));

        service.start();
        const bool channelTrackerStopped = waitForCondition([&] { return service.running_trackers() == 1; }, 2000ms);
        history.add_forward(2);
        const bool forwardsTailed = waitForCondition([&] { return forwards.size() == 2; }, 2000ms);
        service.stop();
        service.stop();

        if (!channelTrackerStopped || !forwardsTailed) {
            std::cerr << "Service did not isolate the failing tracker\n";
            return 1;
        }
        if (service.running_trackers() != 0 || !token.is_set()) {
            std::cerr << "Service stop() left trackers running\n";
            return 1;
        }
    }

    return 0;
}
