#pragma once

#include "core/types.h"
#include "market/snapshot_series.hpp"

#include <cstddef>
#include <cstdint>

namespace tickback::backtest {

/**
 * @brief Index of the first snapshot whose timestamp is strictly greater than target_time_us.
 * Binary search over an ascending series. Returns series.size() when no such
 * snapshot exists, so the result must be clamped before indexing.
 */
size_t locate(const market::SnapshotSeries& series, int64_t target_time_us);

/**
 * @brief Resolves an index past the end of a non-empty series to its last index.
 * An empty series yields 0, which callers must not dereference.
 */
size_t clamp_index(const market::SnapshotSeries& series, size_t index);

// Liquidity offered by one snapshot to one side of the market.
struct LiquidityLevel {
    int64_t timestamp_us = 0;
    double price = 0.0;
    double size = 0.0;
};

/**
 * @class LiquidityWalker
 * @brief Forward cursor over the quotes that may serve one fill.
 *
 * Starts at the clamped result of locate(start) and stops at the first
 * snapshot stamped at or after start + time_budget, or at the end of the
 * series. start + time_budget saturates at the int64_t range. The series
 * must outlive the walker.
 */
class LiquidityWalker {
public:
    LiquidityWalker(const market::SnapshotSeries& series, int64_t start_time_us, int64_t time_budget_us);

    [[nodiscard]] bool exhausted() const;

    // Buying lifts the ask, selling hits the bid. Requires !exhausted().
    [[nodiscard]] LiquidityLevel available(Side side) const;
    [[nodiscard]] const BboSnapshot& current() const;

    void advance();

    [[nodiscard]] size_t index() const { return index_; }
    [[nodiscard]] int64_t deadline_us() const { return deadline_us_; }

private:
    const market::SnapshotSeries& series_;
    size_t index_ = 0;
    int64_t deadline_us_ = 0;
};

} // namespace tickback::backtest
