#include "backtest/liquidity_walker.hpp"

#include <limits>

namespace tickback::backtest {

namespace {

int64_t saturating_add(int64_t a, int64_t b) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    if (b > 0 && a > kMax - b) return kMax;
    if (b < 0 && a < kMin - b) return kMin;
    return a + b;
}

} // namespace

size_t locate(const market::SnapshotSeries& series, int64_t target_time_us) {
    size_t left = 0;
    size_t right = series.size();
    while (left < right) {
        const size_t mid = left + (right - left) / 2;
        if (series[mid].timestamp_us > target_time_us) {
            right = mid;
        } else {
            left = mid + 1;
        }
    }
    return left;
}

size_t clamp_index(const market::SnapshotSeries& series, size_t index) {
    if (series.empty()) return 0;
    return index < series.size() ? index : series.size() - 1;
}

LiquidityWalker::LiquidityWalker(const market::SnapshotSeries& series,
                                 int64_t start_time_us,
                                 int64_t time_budget_us)
    : series_(series),
      index_(clamp_index(series, locate(series, start_time_us))),
      deadline_us_(saturating_add(start_time_us, time_budget_us)) {}

bool LiquidityWalker::exhausted() const {
    if (index_ >= series_.size()) return true;
    return series_[index_].timestamp_us >= deadline_us_;
}

LiquidityLevel LiquidityWalker::available(Side side) const {
    const BboSnapshot& snap = series_[index_];
    if (side == SIDE_BUY) {
        return LiquidityLevel{snap.timestamp_us, snap.ask_price, snap.ask_size};
    }
    return LiquidityLevel{snap.timestamp_us, snap.bid_price, snap.bid_size};
}

const BboSnapshot& LiquidityWalker::current() const {
    return series_[index_];
}

void LiquidityWalker::advance() {
    if (index_ < series_.size()) ++index_;
}

} // namespace tickback::backtest
