#pragma once

#include "backtest/intent.hpp"
#include "market/snapshot_series.hpp"

#include <cstddef>
#include <cstdint>

namespace tickback::backtest {

/**
 * @brief Outcome of executing one base intent.
 * pnl_delta is the cash flow: negative when buying, positive when selling.
 * remaining_quantity is the signed part of the request left unfilled; it is
 * dropped, never carried into a later intent.
 */
struct FillResult {
    double instrument_delta = 0.0;
    double pnl_delta = 0.0;
    double remaining_quantity = 0.0;
    size_t snapshots_consumed = 0;
};

/**
 * @brief Executes a signed quantity against the quotes following start_time_us.
 *
 * Walks snapshots from the first one strictly after start_time_us (or the
 * last snapshot when none is later) while the snapshot is stamped before
 * start_time_us + time_budget_us and quantity remains. Each snapshot offers
 * its ask size to buys and its bid size to sells. Every partial fill is
 * priced at the snapshot's ask price, sells included.
 *
 * Never fails: a liquidity shortfall caps the fill and an empty series yields
 * a zero fill. The intent itself is not modified.
 */
FillResult fill(int64_t start_time_us,
                const BaseIntent& intent,
                const market::SnapshotSeries& series,
                int64_t time_budget_us);

} // namespace tickback::backtest
