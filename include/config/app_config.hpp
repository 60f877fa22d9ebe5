#pragma once

#include "core/error.hpp"
#include "core/types.h"
#include "market/csv_loader.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace tickback::config {

/**
 * @brief Everything a backtest run needs, resolved from the command line.
 * No setting is read from the environment.
 */
struct AppConfig {
    std::vector<market::DataSource> bbo_sources;
    std::vector<market::DataSource> trade_sources;
    std::string strategy = "random";
    int64_t action_duration_ms = 0;     // 0 = strategy default
    int64_t candle_ms = 60LL * 60 * 1000;
    size_t actions = 100;
    uint64_t seed = 42;
    std::string history_csv = "data/fill_history.csv";
    std::string pg_conninfo;
    std::string cache_dir;
    std::string log_file;
    bool verbose = false;
    bool show_help = false;
};

// Action windows used when --action-duration-ms is not given.
constexpr int64_t kRandomActionDurationMs = 1000;
constexpr int64_t kLookaheadActionDurationMs = 10000;
// Largest window whose microsecond budget fits in int64_t.
constexpr int64_t kMaxActionDurationMs = std::numeric_limits<int64_t>::max() / TICKBACK_US_PER_MS;

/**
 * @brief Parses and validates command-line arguments.
 * @return ErrorCode::Parse for malformed values, ErrorCode::Range for an
 * oversized action window, ErrorCode::Invalid for unknown options or
 * inconsistent settings.
 */
core::Expected<AppConfig> parse_args(int argc, const char* const* argv);

std::string usage(const std::string& program);

} // namespace tickback::config
