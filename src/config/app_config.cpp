#include "config/app_config.hpp"

#include "audit/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace tickback::config {

namespace {

bool parse_i64(const std::string& s, int64_t& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = static_cast<int64_t>(value);
    return true;
}

bool parse_u64(const std::string& s, uint64_t& out) {
    if (s.empty() || s[0] == '-') return false;
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = static_cast<uint64_t>(value);
    return true;
}

// INSTRUMENT=PATH
bool parse_source(const std::string& s, market::DataSource& out) {
    const auto eq = s.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == s.size()) return false;
    out.instrument = s.substr(0, eq);
    out.path = s.substr(eq + 1);
    return true;
}

} // namespace

core::Expected<AppConfig> parse_args(int argc, const char* const* argv) {
    auto& log = audit::Logger::instance();
    AppConfig cfg;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            cfg.show_help = true;
            return cfg;
        }
        if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
            continue;
        }

        if (i + 1 >= argc) {
            log.error("Option " + arg + " expects a value");
            return core::ErrorCode::Invalid;
        }
        const std::string value = argv[++i];

        if (arg == "--bbo" || arg == "--trades") {
            market::DataSource source;
            if (!parse_source(value, source)) {
                log.error("Expected INSTRUMENT=PATH after " + arg + ", got '" + value + "'");
                return core::ErrorCode::Parse;
            }
            (arg == "--bbo" ? cfg.bbo_sources : cfg.trade_sources).push_back(std::move(source));
        } else if (arg == "--strategy") {
            cfg.strategy = value;
        } else if (arg == "--action-duration-ms") {
            if (!parse_i64(value, cfg.action_duration_ms) || cfg.action_duration_ms <= 0) {
                log.error("--action-duration-ms must be a positive integer");
                return core::ErrorCode::Parse;
            }
            if (cfg.action_duration_ms > kMaxActionDurationMs) {
                log.error("--action-duration-ms must not exceed " + std::to_string(kMaxActionDurationMs));
                return core::ErrorCode::Range;
            }
        } else if (arg == "--candle-ms") {
            if (!parse_i64(value, cfg.candle_ms) || cfg.candle_ms <= 0) {
                log.error("--candle-ms must be a positive integer");
                return core::ErrorCode::Parse;
            }
        } else if (arg == "--actions") {
            uint64_t n = 0;
            if (!parse_u64(value, n) || n == 0) {
                log.error("--actions must be a positive integer");
                return core::ErrorCode::Parse;
            }
            cfg.actions = static_cast<size_t>(n);
        } else if (arg == "--seed") {
            if (!parse_u64(value, cfg.seed)) {
                log.error("--seed must be a non-negative integer");
                return core::ErrorCode::Parse;
            }
        } else if (arg == "--history-csv") {
            cfg.history_csv = value;
        } else if (arg == "--pg") {
            cfg.pg_conninfo = value;
        } else if (arg == "--cache-dir") {
            cfg.cache_dir = value;
        } else if (arg == "--log-file") {
            cfg.log_file = value;
        } else {
            log.error("Unknown option " + arg);
            return core::ErrorCode::Invalid;
        }
    }

    if (cfg.strategy == "cheating") cfg.strategy = "lookahead";
    if (cfg.strategy != "random" && cfg.strategy != "lookahead") {
        log.error("Unknown strategy '" + cfg.strategy + "' (expected random or lookahead)");
        return core::ErrorCode::Invalid;
    }
    if (cfg.bbo_sources.empty()) {
        log.error("At least one --bbo INSTRUMENT=PATH is required");
        return core::ErrorCode::Invalid;
    }
    if (cfg.strategy == "lookahead" && cfg.trade_sources.empty()) {
        log.error("The lookahead strategy needs --trades INSTRUMENT=PATH for its candles");
        return core::ErrorCode::Invalid;
    }
    if (cfg.action_duration_ms == 0) {
        cfg.action_duration_ms = (cfg.strategy == "lookahead")
            ? kLookaheadActionDurationMs
            : kRandomActionDurationMs;
    }
    return cfg;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " --bbo INSTR=PATH [--bbo INSTR=PATH ...] [options]\n"
        << "\n"
        << "  --bbo INSTR=PATH          BBO quotes CSV for an instrument (repeatable)\n"
        << "  --trades INSTR=PATH       trades CSV for an instrument (lookahead strategy)\n"
        << "  --strategy NAME           random | lookahead (default random)\n"
        << "  --action-duration-ms N    fill window per intent (default 1000, lookahead 10000)\n"
        << "  --candle-ms N             candle width for lookahead (default 3600000)\n"
        << "  --actions N               random strategy intent count (default 100)\n"
        << "  --seed N                  random strategy seed (default 42)\n"
        << "  --history-csv PATH        fill history output (default data/fill_history.csv)\n"
        << "  --pg CONNINFO             also store the history in PostgreSQL\n"
        << "  --cache-dir DIR           binary quote cache directory\n"
        << "  --log-file PATH           append log lines to PATH\n"
        << "  --verbose                 log every executed intent\n";
    return out.str();
}

} // namespace tickback::config
