#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace lnt::common {

struct Config {
    std::string configFile;

    // [lnd]
    std::string lndHost = "127.0.0.1";
    std::uint16_t lndRestPort = 8080;
    std::string tlsCertPath;
    std::string macaroonPath;
    std::uint32_t httpTimeoutSec = 30;

    // [logging]
    lnt::log::Level logLevel = lnt::log::Level::Info;
    std::string logFile;

    // [duckdb]
    std::string duckdbPath = "data/lntrack.duckdb";

    // [tracker]
    std::vector<std::string> trackers{"payments", "invoices", "forwards", "htlc_events", "channel_events"};
    std::size_t pageSize = 1000;
    std::size_t batchSize = 1000;
    std::uint64_t reconWindowSec = 30ULL * 24ULL * 3600ULL;
    std::uint64_t gracePeriodMs = 2000;
    std::uint64_t queuePollTimeoutMs = 15000;
    std::uint64_t tailPollIntervalMs = 60000;
    // On-chain transaction events are received but only persisted when set.
    bool storeTransactions = false;

    // [retry]
    std::size_t retryMaxRetries = 5;
    std::uint64_t retryDelayMs = 300000;
    std::uint64_t retryToleranceWindowMs = 900000;  // 0 disables the budget refill

    bool trackerEnabled(const std::string& name) const;

    // Defaults, then the config file (--config or LNT_CONFIG), then LNT_* environment
    // variables, then command line flags. Throws std::runtime_error on invalid values.
    static Config fromArgs(int argc, char** argv);

    static const std::vector<std::string>& knownTrackers();
};

}  // namespace lnt::common
