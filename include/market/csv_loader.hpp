#pragma once

#include "core/error.hpp"
#include "core/types.h"
#include "market/snapshot_series.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tickback::market {

struct LoadStats {
    size_t rows = 0;
    size_t skipped = 0;
};

struct DataSource {
    std::string instrument;
    std::string path;
};

/**
 * @brief Reads a BBO CSV file.
 * Columns are located by header name: local_timestamp, ask_amount, ask_price,
 * bid_price, bid_amount. Unparseable rows are skipped and counted. The series
 * is stable-sorted by timestamp before it is returned.
 */
core::Expected<SnapshotSeries> load_bbo_csv(const std::string& path, LoadStats* stats = nullptr);

/**
 * @brief Reads a trades CSV file (local_timestamp, price, amount, side).
 */
core::Expected<std::vector<TradePrint>> load_trades_csv(const std::string& path, LoadStats* stats = nullptr);

/**
 * @brief Loads one BBO series per source. Fails on the first source that cannot be read.
 */
core::Expected<MarketData> load_market_data(const std::vector<DataSource>& sources);

std::vector<std::string_view> split_csv_line(std::string_view line, char delim = ',');

} // namespace tickback::market
