#pragma once

#include "core/types.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tickback::market {

/**
 * @brief OHLC summary of the trades that fell into one time bucket.
 * Side statistics are absent when the bucket had no trade on that side.
 */
struct Candle {
    int64_t time_start = 0;   // first trade in the bucket
    int64_t time_end = 0;     // last trade in the bucket
    double open = 0.0;
    double close = 0.0;
    double high = 0.0;
    double low = 0.0;
    std::optional<double> buy_volume;       // mean buy trade size
    std::optional<double> sell_volume;      // mean sell trade size
    std::optional<double> buy_mean_price;
    std::optional<double> sell_mean_price;
};

using CandleMap = std::map<std::string, std::vector<Candle>>;

/**
 * @brief Buckets trades into candles of candle_duration_ms.
 * Buckets are aligned to multiples of the duration; empty buckets produce no candle.
 * Trades must be sorted by timestamp. A non-positive duration yields no candles.
 */
std::vector<Candle> make_candles(const std::vector<TradePrint>& trades, int64_t candle_duration_ms);

std::string to_string(const Candle& candle);

} // namespace tickback::market
