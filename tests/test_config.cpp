#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/TrackerOptions.hpp"
#include "common/Config.hpp"

namespace {

const std::vector<std::string> kGuardedVariables{
    "LNT_CONFIG",          "LNT_LND_HOST",           "LNT_LND_REST_PORT",         "LNT_DUCKDB_PATH",
    "LNT_TRACKERS",        "LNT_PAGE_SIZE",          "LNT_LOG_LEVEL",             "LNT_RETRY_MAX_RETRIES",
    "LNT_RETRY_DELAY_MS",  "LNT_GRACE_PERIOD_MS",    "LNT_RETRY_TOLERANCE_WINDOW_MS", "LNT_STORE_TRANSACTIONS",
};

// Restores the LNT_* variables the test touches.
struct EnvGuard {
    EnvGuard() {
        for (const auto& name : kGuardedVariables) {
            if (const char* current = std::getenv(name.c_str())) {
                originals[name] = current;
            }
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        for (const auto& name : kGuardedVariables) {
            auto it = originals.find(name);
            if (it != originals.end()) {
                ::setenv(name.c_str(), it->second.c_str(), 1);
            } else {
                ::unsetenv(name.c_str());
            }
        }
    }

    void set(const std::string& name, const std::string& value) { ::setenv(name.c_str(), value.c_str(), 1); }
    void clear(const std::string& name) { ::unsetenv(name.c_str()); }

    std::map<std::string, std::string> originals;
};

lnt::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return lnt::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

std::optional<std::string> configError(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error& ex) {
        return std::string{ex.what()};
    }
    return std::nullopt;
}

}  // namespace

int main() {
    namespace fs = std::filesystem;

    EnvGuard env;
    const fs::path root = fs::temp_directory_path() / "lntrack-config-test";
    fs::remove_all(root);
    const std::string dbFlag = "--duckdb=" + (root / "db" / "events.duckdb").string();

    {
        const auto config = runConfig({"lntrack", dbFlag});
        if (config.lndHost != "127.0.0.1" || config.lndRestPort != 8080 || config.trackers.size() != 5 ||
            config.retryMaxRetries != 5 || config.retryDelayMs != 300000 || config.pageSize != 1000) {
            std::cerr << "Unexpected defaults\n";
            return 1;
        }
        if (config.storeTransactions || config.trackerEnabled("peer_events") || config.trackerEnabled("transactions") ||
            config.trackerEnabled("graph_updates")) {
            std::cerr << "Peer, transaction and graph trackers should be opt-in\n";
            return 1;
        }
        if (!fs::exists(root / "db")) {
            std::cerr << "Expected the DuckDB parent directory to be created\n";
            return 1;
        }
    }

    const fs::path configPath = root / "lntrack.conf";
    {
        std::ofstream out(configPath);
        out << "# node connection\n"
            << "[lnd]\n"
            << "host = node.local\n"
            << "rest_port = 10009\n"
            << "macaroon_filepath = \"/secrets/readonly.macaroon\"\n"
            << "\n"
            << "[tracker]\n"
            << "enabled = [payments, Forwards]\n"
            << "page_size = 250\n"
            << "grace_period_ms = 0\n"
            << "\n"
            << "[retry]\n"
            << "max_retries = 0\n"
            << "tolerance_window_ms = 0\n"
            << "\n"
            << "[extras]\n"
            << "colour = blue\n";
    }

    {
        const auto config = runConfig({"lntrack", "--config", configPath.string(), dbFlag});
        if (config.lndHost != "node.local" || config.lndRestPort != 10009 ||
            config.macaroonPath != "/secrets/readonly.macaroon") {
            std::cerr << "Config file [lnd] section was not applied\n";
            return 1;
        }
        if (config.trackers != std::vector<std::string>({"payments", "forwards"}) || !config.trackerEnabled("forwards") ||
            config.trackerEnabled("invoices")) {
            std::cerr << "Tracker list was not parsed\n";
            return 1;
        }
        if (config.pageSize != 250 || config.gracePeriodMs != 0 || config.retryMaxRetries != 0) {
            std::cerr << "Numeric config values were not applied\n";
            return 1;
        }

        const auto options = app::TrackerOptions::fromConfig(config);
        if (options.pageSize != 250 || options.retry.maxRetries != 0 || options.retry.toleranceWindow.has_value() ||
            options.dispatcherOptions().gracePeriod.count() != 0) {
            std::cerr << "Tracker options do not mirror the config\n";
            return 1;
        }
    }

    {
        // Environment overrides the file, flags override the environment.
        env.set("LNT_CONFIG", configPath.string());
        env.set("LNT_LND_HOST", "env.local");
        env.set("LNT_PAGE_SIZE", "50");
        const auto config = runConfig({"lntrack", "--page-size", "75", dbFlag});
        if (config.lndHost != "env.local" || config.pageSize != 75 || config.lndRestPort != 10009) {
            std::cerr << "Precedence file < env < flag violated (host=" << config.lndHost
                      << ", page size=" << config.pageSize << ")\n";
            return 1;
        }
        env.clear("LNT_CONFIG");
        env.clear("LNT_LND_HOST");
        env.clear("LNT_PAGE_SIZE");
    }

    {
        const auto config = runConfig({"lntrack", "--log-level", "debug", "--retry-delay-ms=0", dbFlag});
        if (config.logLevel != lnt::log::Level::Debug || config.retryDelayMs != 0) {
            std::cerr << "Flag values were not applied\n";
            return 1;
        }
    }

    {
        const fs::path streamsPath = root / "streams.conf";
        std::ofstream(streamsPath) << "[tracker]\n"
                                   << "enabled = [peer_events, transactions, graph_updates]\n"
                                   << "store_transactions = Yes\n";
        const auto config = runConfig({"lntrack", "--config", streamsPath.string(), dbFlag});
        if (config.trackers != std::vector<std::string>({"peer_events", "transactions", "graph_updates"}) ||
            !config.storeTransactions) {
            std::cerr << "Stream-only trackers or store_transactions were not applied from the file\n";
            return 1;
        }

        env.set("LNT_STORE_TRANSACTIONS", "on");
        const auto overridden =
            runConfig({"lntrack", "--config", streamsPath.string(), "--store-transactions", "false", dbFlag});
        env.clear("LNT_STORE_TRANSACTIONS");
        if (overridden.storeTransactions) {
            std::cerr << "--store-transactions false should override the file and the environment\n";
            return 1;
        }
    }

    if (!configError({"lntrack", "--store-transactions", "maybe", dbFlag})) {
        std::cerr << "Non-boolean store_transactions should be rejected\n";
        return 1;
    }
    if (!configError({"lntrack", "--trackers", "payments,peers", dbFlag})) {
        std::cerr << "Unknown tracker should be rejected\n";
        return 1;
    }
    if (!configError({"lntrack", "--page-size", "0", dbFlag})) {
        std::cerr << "Zero page size should be rejected\n";
        return 1;
    }
    if (!configError({"lntrack", "--lnd-rest-port", "70000", dbFlag})) {
        std::cerr << "Out of range port should be rejected\n";
        return 1;
    }
    if (!configError({"lntrack", "--config", (root / "missing.conf").string(), dbFlag})) {
        std::cerr << "Missing config file should be rejected\n";
        return 1;
    }

    {
        const fs::path broken = root / "broken.conf";
        std::ofstream(broken) << "[lnd]\nhost node.local\n";
        const auto error = configError({"lntrack", "--config", broken.string(), dbFlag});
        if (!error || error->find("Malformed line 2") == std::string::npos) {
            std::cerr << "Malformed config line should be reported with its line number\n";
            return 1;
        }
    }

    fs::remove_all(root);
    return 0;
}
