#include <atomic>
#include <cstdlib>
#include <csignal>
#include <cstdio>
#include <chrono>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "adapters/duckdb/DuckEventRepo.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/lnd/LndErrorClassifier.hpp"
#include "adapters/lnd/LndRestClient.hpp"
#include "app/EventStreamTracker.hpp"
#include "app/ForwardTracker.hpp"
#include "app/InvoiceTracker.hpp"
#include "app/PaymentTracker.hpp"
#include "app/TrackerOptions.hpp"
#include "app/TrackerService.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "sync/CancellationToken.hpp"
#include "sync/RetryPolicy.hpp"
#include "sync/StreamDispatcher.hpp"

namespace {

constexpr const char* kVersion = "lntrack 0.1.0";
constexpr auto kPollInterval = std::chrono::milliseconds(200);

volatile std::sig_atomic_t gSignalStatus = 0;

void handleSignal(int signal) {
    gSignalStatus = signal;
}

// Turns a received signal into a token cancellation; signal handlers cannot
// touch the token themselves.
class SignalWatcher {
public:
    explicit SignalWatcher(lnt::sync::CancellationToken& token)
        : token_(token), thread_([this] { run_(); }) {}

    ~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run_() {
        while (!done_.load()) {
            if (gSignalStatus != 0) {
                LOG_INFO("Signal " << gSignalStatus << " received, stopping trackers...");
                token_.set();
                return;
            }
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    lnt::sync::CancellationToken& token_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], flag) == 0) {
            return true;
        }
    }
    return false;
}

void printUsage() {
    std::cout << kVersion << "\n"
              << "Usage: lntrack [--config FILE] [--lnd-host HOST] [--lnd-rest-port PORT] [--tls-cert FILE]\n"
              << "               [--macaroon FILE] [--duckdb FILE] [--trackers LIST] [--log-level LEVEL]\n"
              << "               [--log-file FILE] [--store-transactions BOOL] [--version]\n"
              << "Every option may also be set as LNT_* environment variable or in the config file.\n";
}

void logCounters() {
    const auto snapshot = lnt::common::metrics::Registry::instance().snapshot();
    for (const auto& [key, counter] : snapshot.counters) {
        LOG_INFO("  " << key << " = " << counter.value);
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    if (hasFlag(argc, argv, "--version")) {
        std::cout << kVersion << std::endl;
        return EXIT_SUCCESS;
    }
    if (hasFlag(argc, argv, "--help")) {
        printUsage();
        return EXIT_SUCCESS;
    }

    try {
        const auto config = lnt::common::Config::fromArgs(argc, argv);
        lnt::log::setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            lnt::log::setLogFile(config.logFile);
        }

        LOG_INFO("Configuration loaded");
        LOG_INFO("  LND: " << config.lndHost << ":" << config.lndRestPort);
        LOG_INFO("  DuckDB: " << config.duckdbPath);
        LOG_INFO("  Trackers: " << joinList(config.trackers));
        LOG_INFO("  Log level: " << lnt::log::levelToString(config.logLevel));
        LOG_INFO("  Retry: max " << config.retryMaxRetries << ", delay " << config.retryDelayMs
                                 << " ms, tolerance " << config.retryToleranceWindowMs << " ms");

        std::signal(SIGINT, handleSignal);
        std::signal(SIGTERM, handleSignal);

        lnt::sync::CancellationToken token;
        SignalWatcher watcher(token);

        adapters::duckdb::DuckStore store(config.duckdbPath);
        store.migrate();
        adapters::duckdb::DuckEventRepo repo(store);

        const adapters::lnd::LndErrorClassifier classifier;
        const auto options = app::TrackerOptions::fromConfig(config);
        adapters::lnd::LndRestClient lnd(adapters::lnd::LndConnection::fromConfig(config), classifier);

        const lnt::sync::RetryPolicy startupRetry(token, classifier, options.retry);
        const auto info = startupRetry.run("get_info", [&lnd] { return lnd.get_info(); });
        if (!info) {
            LOG_INFO("Cancelled before the node answered, exiting");
            return EXIT_SUCCESS;
        }
        LOG_INFO("Connected to node " << info->alias << " (" << info->pubkey << ") at height "
                                      << info->blockHeight);

        app::TrackerService service(token);
        const auto dispatcherOptions = options.dispatcherOptions();

        if (config.trackerEnabled(domain::Payment::kCategory)) {
            auto& dispatcher = service.add_dispatcher(std::make_unique<lnt::sync::StreamDispatcher<domain::Payment>>(
                "track_payments", token, [&lnd] { return lnd.track_payments(); }, classifier, options.retry,
                dispatcherOptions));
            service.add_tracker(
                std::make_unique<app::PaymentTracker>(info->pubkey, token, repo, classifier, options, lnd, dispatcher));
        }
        if (config.trackerEnabled(domain::Invoice::kCategory)) {
            auto& dispatcher = service.add_dispatcher(std::make_unique<lnt::sync::StreamDispatcher<domain::Invoice>>(
                "subscribe_invoices", token, [&lnd] { return lnd.subscribe_invoices(); }, classifier, options.retry,
                dispatcherOptions));
            service.add_tracker(
                std::make_unique<app::InvoiceTracker>(info->pubkey, token, repo, classifier, options, lnd, dispatcher));
        }
        if (config.trackerEnabled(domain::ForwardingEvent::kCategory)) {
            service.add_tracker(
                std::make_unique<app::ForwardTracker>(info->pubkey, token, repo, classifier, options, lnd));
        }
        if (config.trackerEnabled(domain::HtlcEvent::kCategory)) {
            auto& dispatcher = service.add_dispatcher(std::make_unique<lnt::sync::StreamDispatcher<domain::HtlcEvent>>(
                "subscribe_htlc_events", token, [&lnd] { return lnd.subscribe_htlc_events(); }, classifier,
                options.retry, dispatcherOptions));
            service.add_tracker(std::make_unique<app::EventStreamTracker<domain::HtlcEvent>>(
                info->pubkey, token, repo, classifier, options, dispatcher,
                [](const domain::HtlcEvent& event) { return event.kind != "subscribed_event"; }));
        }
        if (config.trackerEnabled(domain::ChannelEvent::kCategory)) {
            auto& dispatcher =
                service.add_dispatcher(std::make_unique<lnt::sync::StreamDispatcher<domain::ChannelEvent>>(
                    "subscribe_channel_events", token, [&lnd] { return lnd.subscribe_channel_events(); },
                    classifier, options.retry, dispatcherOptions));
            service.add_tracker(std::make_unique<app::EventStreamTracker<domain::ChannelEvent>>(
                info->pubkey, token, repo, classifier, options, dispatcher));
        }
        if (config.trackerEnabled(domain::PeerEvent::kCategory)) {
            auto& dispatcher = service.add_dispatcher(std::make_unique<lnt::sync::StreamDispatcher<domain::PeerEvent>>(
                "subscribe_peer_events", token, [&lnd] { return lnd.subscribe_peer_events(); }, classifier,
                options.retry, dispatcherOptions));
            service.add_tracker(std::make_unique<app::EventStreamTracker<domain::PeerEvent>>(
                info->pubkey, token, repo, classifier, options, dispatcher));
        }
        if (config.trackerEnabled(domain::OnchainTransaction::kCategory)) {
            if (!config.storeTransactions) {
                LOG_INFO("transactions: tracker.store_transactions is off, events are received but not stored");
            }
            auto& dispatcher =
                service.add_dispatcher(std::make_unique<lnt::sync::StreamDispatcher<domain::OnchainTransaction>>(
                    "subscribe_transactions", token, [&lnd] { return lnd.subscribe_transactions(); }, classifier,
                    options.retry, dispatcherOptions));
            service.add_tracker(std::make_unique<app::EventStreamTracker<domain::OnchainTransaction>>(
                info->pubkey, token, repo, classifier, options, dispatcher,
                [store = config.storeTransactions](const domain::OnchainTransaction&) { return store; }));
        }
        if (config.trackerEnabled(domain::GraphUpdate::kCategory)) {
            auto& dispatcher = service.add_dispatcher(std::make_unique<lnt::sync::StreamDispatcher<domain::GraphUpdate>>(
                "subscribe_channel_graph", token, [&lnd] { return lnd.subscribe_channel_graph(); }, classifier,
                options.retry, dispatcherOptions));
            service.add_tracker(std::make_unique<app::EventStreamTracker<domain::GraphUpdate>>(
                info->pubkey, token, repo, classifier, options, dispatcher));
        }

        service.start();
        LOG_INFO("Tracking " << service.tracker_count() << " categories. Waiting for events...");

        while (!token.wait(kPollInterval)) {
            if (service.running_trackers() == 0U) {
                LOG_WARN("Every tracker stopped, shutting down");
                break;
            }
        }

        LOG_INFO("Starting graceful shutdown");
        service.stop();
        logCounters();
        LOG_INFO("Shutdown complete");
        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }
}
