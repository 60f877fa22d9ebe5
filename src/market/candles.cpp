#include "market/candles.hpp"

#include <algorithm>
#include <sstream>

namespace tickback::market {

namespace {

struct SideAccumulator {
    double amount_sum = 0.0;
    double price_sum = 0.0;
    size_t count = 0;

    void add(const TradePrint& t) {
        amount_sum += t.amount;
        price_sum += t.price;
        ++count;
    }
    std::optional<double> mean_amount() const {
        if (count == 0) return std::nullopt;
        return amount_sum / static_cast<double>(count);
    }
    std::optional<double> mean_price() const {
        if (count == 0) return std::nullopt;
        return price_sum / static_cast<double>(count);
    }
};

int64_t bucket_of(int64_t ts_us, int64_t width_us) {
    int64_t q = ts_us / width_us;
    if (ts_us % width_us != 0 && ts_us < 0) --q;
    return q * width_us;
}

} // namespace

std::vector<Candle> make_candles(const std::vector<TradePrint>& trades, int64_t candle_duration_ms) {
    std::vector<Candle> candles;
    if (candle_duration_ms <= 0 || trades.empty()) return candles;

    const int64_t width_us = candle_duration_ms * TICKBACK_US_PER_MS;

    Candle current{};
    SideAccumulator buys;
    SideAccumulator sells;
    int64_t current_bucket = 0;
    bool open = false;

    auto close_candle = [&]() {
        current.buy_volume = buys.mean_amount();
        current.sell_volume = sells.mean_amount();
        current.buy_mean_price = buys.mean_price();
        current.sell_mean_price = sells.mean_price();
        candles.push_back(current);
    };

    for (const TradePrint& trade : trades) {
        const int64_t bucket = bucket_of(trade.timestamp_us, width_us);
        if (!open || bucket != current_bucket) {
            if (open) close_candle();
            current = Candle{};
            current.time_start = trade.timestamp_us;
            current.time_end = trade.timestamp_us;
            current.open = trade.price;
            current.high = trade.price;
            current.low = trade.price;
            buys = SideAccumulator{};
            sells = SideAccumulator{};
            current_bucket = bucket;
            open = true;
        }

        current.time_start = std::min(current.time_start, trade.timestamp_us);
        current.time_end = std::max(current.time_end, trade.timestamp_us);
        current.close = trade.price;
        current.high = std::max(current.high, trade.price);
        current.low = std::min(current.low, trade.price);
        if (trade.side == SIDE_BUY) buys.add(trade);
        else sells.add(trade);
    }
    if (open) close_candle();
    return candles;
}

std::string to_string(const Candle& candle) {
    std::ostringstream out;
    out << "Candle(" << candle.time_start << " - " << candle.time_end << "): "
        << "Open=" << candle.open << ", Close=" << candle.close
        << ", High=" << candle.high << ", Low=" << candle.low;
    if (candle.buy_volume) out << ", Buy Volume=" << *candle.buy_volume;
    if (candle.sell_volume) out << ", Sell Volume=" << *candle.sell_volume;
    return out.str();
}

} // namespace tickback::market
