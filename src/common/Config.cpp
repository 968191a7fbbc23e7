#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace lnt::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::string unquote(std::string value) {
    if (value.size() >= 2U) {
        const char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2U);
        }
    }
    return value;
}

std::uint16_t parsePort(const std::string& value, const std::string& label) {
    try {
        const auto portValue = std::stoul(value);
        if (portValue == 0U || portValue > 65535U) {
            throw std::out_of_range("port out of range");
        }
        return static_cast<std::uint16_t>(portValue);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port for " + label + ": " + value);
    }
}

std::uint64_t parseUnsigned(const std::string& value, const std::string& label, bool allowZero) {
    try {
        if (value.empty() || value.front() == '-') {
            throw std::invalid_argument("negative value");
        }
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (!allowZero && parsed == 0U) {
            throw std::out_of_range("value must be positive");
        }
        return static_cast<std::uint64_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::uint32_t parseSeconds(const std::string& value, const std::string& label) {
    const auto parsed = parseUnsigned(value, label, false);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto lowered = toLower(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw std::runtime_error("Invalid boolean for " + label + ": " + value);
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = toLower(trim(unquote(trim(item))));
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::vector<std::string> parseTrackerList(std::string value, const std::string& label) {
    value = trim(value);
    if (!value.empty() && value.front() == '[' && value.back() == ']') {
        value = value.substr(1, value.size() - 2U);
    }
    auto list = parseCsvList(value);
    for (const auto& name : list) {
        const auto& known = Config::knownTrackers();
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            throw std::runtime_error("Unknown tracker in " + label + ": " + name);
        }
    }
    return list;
}

using ApplyFn = void (*)(Config&, const std::string&, const std::string&);

struct OptionSpec {
    const char* key;
    const char* env;
    const char* flag;
    ApplyFn apply;
};

const OptionSpec kOptions[] = {
    {"lnd.host", "LNT_LND_HOST", "--lnd-host",
     [](Config& c, const std::string& v, const std::string&) { c.lndHost = v; }},
    {"lnd.rest_port", "LNT_LND_REST_PORT", "--lnd-rest-port",
     [](Config& c, const std::string& v, const std::string& l) { c.lndRestPort = parsePort(v, l); }},
    {"lnd.cert_filepath", "LNT_TLS_CERT", "--tls-cert",
     [](Config& c, const std::string& v, const std::string&) { c.tlsCertPath = v; }},
    {"lnd.macaroon_filepath", "LNT_MACAROON", "--macaroon",
     [](Config& c, const std::string& v, const std::string&) { c.macaroonPath = v; }},
    {"lnd.timeout_sec", "LNT_HTTP_TIMEOUT_SEC", "--http-timeout-sec",
     [](Config& c, const std::string& v, const std::string& l) { c.httpTimeoutSec = parseSeconds(v, l); }},
    {"logging.level", "LNT_LOG_LEVEL", "--log-level",
     [](Config& c, const std::string& v, const std::string&) { c.logLevel = lnt::log::levelFromString(v); }},
    {"logging.logfile", "LNT_LOG_FILE", "--log-file",
     [](Config& c, const std::string& v, const std::string&) { c.logFile = v; }},
    {"duckdb.path", "LNT_DUCKDB_PATH", "--duckdb",
     [](Config& c, const std::string& v, const std::string&) { c.duckdbPath = v; }},
    {"tracker.enabled", "LNT_TRACKERS", "--trackers",
     [](Config& c, const std::string& v, const std::string& l) { c.trackers = parseTrackerList(v, l); }},
    {"tracker.page_size", "LNT_PAGE_SIZE", "--page-size",
     [](Config& c, const std::string& v, const std::string& l) {
         c.pageSize = static_cast<std::size_t>(parseUnsigned(v, l, false));
     }},
    {"tracker.batch_size", "LNT_BATCH_SIZE", "--batch-size",
     [](Config& c, const std::string& v, const std::string& l) {
         c.batchSize = static_cast<std::size_t>(parseUnsigned(v, l, false));
     }},
    {"tracker.recon_window_sec", "LNT_RECON_WINDOW_SEC", "--recon-window-sec",
     [](Config& c, const std::string& v, const std::string& l) { c.reconWindowSec = parseUnsigned(v, l, false); }},
    {"tracker.grace_period_ms", "LNT_GRACE_PERIOD_MS", "--grace-period-ms",
     [](Config& c, const std::string& v, const std::string& l) { c.gracePeriodMs = parseUnsigned(v, l, true); }},
    {"tracker.queue_poll_timeout_ms", "LNT_QUEUE_POLL_TIMEOUT_MS", "--queue-poll-timeout-ms",
     [](Config& c, const std::string& v, const std::string& l) {
         c.queuePollTimeoutMs = parseUnsigned(v, l, false);
     }},
    {"tracker.tail_poll_interval_ms", "LNT_TAIL_POLL_INTERVAL_MS", "--tail-poll-interval-ms",
     [](Config& c, const std::string& v, const std::string& l) {
         c.tailPollIntervalMs = parseUnsigned(v, l, false);
     }},
    {"tracker.store_transactions", "LNT_STORE_TRANSACTIONS", "--store-transactions",
     [](Config& c, const std::string& v, const std::string& l) { c.storeTransactions = parseBool(v, l); }},
    {"retry.max_retries", "LNT_RETRY_MAX_RETRIES", "--retry-max-retries",
     [](Config& c, const std::string& v, const std::string& l) {
         c.retryMaxRetries = static_cast<std::size_t>(parseUnsigned(v, l, true));
     }},
    {"retry.delay_ms", "LNT_RETRY_DELAY_MS", "--retry-delay-ms",
     [](Config& c, const std::string& v, const std::string& l) { c.retryDelayMs = parseUnsigned(v, l, true); }},
    {"retry.tolerance_window_ms", "LNT_RETRY_TOLERANCE_WINDOW_MS", "--retry-tolerance-window-ms",
     [](Config& c, const std::string& v, const std::string& l) {
         c.retryToleranceWindowMs = parseUnsigned(v, l, true);
     }},
};

const OptionSpec* findOption(const std::string& key) {
    for (const auto& option : kOptions) {
        if (key == option.key) {
            return &option;
        }
    }
    return nullptr;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

void parseFile(Config& config, const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Unable to open config file: " + path);
    }

    std::string section;
    std::string line;
    std::size_t lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (const auto hashPos = line.find('#'); hashPos != std::string::npos) {
            line.erase(hashPos);
        }
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        if (line.front() == '[' && line.back() == ']') {
            section = toLower(trim(line.substr(1, line.size() - 2U)));
            continue;
        }
        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            throw std::runtime_error("Malformed line " + std::to_string(lineNumber) + " in " + path);
        }

        const std::string key = toLower(trim(line.substr(0, pos)));
        const std::string value = unquote(trim(line.substr(pos + 1)));
        const std::string fullKey = section.empty() ? key : section + '.' + key;
        const auto* option = findOption(fullKey);
        if (option == nullptr) {
            LOG_WARN("Ignoring unknown config key '" << fullKey << "' in " << path);
            continue;
        }
        option->apply(config, value, fullKey);
    }
}

}  // namespace

const std::vector<std::string>& Config::knownTrackers() {
    static const std::vector<std::string> kKnown{
        "payments", "invoices", "forwards", "htlc_events",
        "channel_events", "peer_events", "transactions", "graph_updates"};
    return kKnown;
}

bool Config::trackerEnabled(const std::string& name) const {
    return std::find(trackers.begin(), trackers.end(), name) != trackers.end();
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto configArg = valueFromArgs(argc, argv, "--config"); !configArg.empty()) {
        config.configFile = trim(configArg);
    } else if (const char* envConfig = std::getenv("LNT_CONFIG")) {
        config.configFile = trim(envConfig);
    }
    if (!config.configFile.empty()) {
        parseFile(config, config.configFile);
    }

    for (const auto& option : kOptions) {
        if (const char* envValue = std::getenv(option.env)) {
            const auto value = trim(envValue);
            if (!value.empty()) {
                option.apply(config, value, option.env);
            }
        }
    }

    for (const auto& option : kOptions) {
        if (auto argValue = valueFromArgs(argc, argv, option.flag); !argValue.empty()) {
            option.apply(config, trim(argValue), option.flag);
        }
    }

    if (config.lndHost.empty()) {
        throw std::runtime_error("LND host must not be empty");
    }
    if (config.trackers.empty()) {
        throw std::runtime_error("At least one tracker must be enabled");
    }
    if (config.duckdbPath.empty()) {
        throw std::runtime_error("DuckDB path must not be empty");
    }

    const std::filesystem::path duckPath{config.duckdbPath};
    const auto parentDir = duckPath.parent_path();
    if (!parentDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parentDir, ec);
        if (ec) {
            throw std::runtime_error("Unable to create directory for DuckDB (" + parentDir.string() + "): " +
                                     ec.message());
        }
    }

    LOG_DEBUG("DuckDB path: " << duckPath.string());

    return config;
}

}  // namespace lnt::common
