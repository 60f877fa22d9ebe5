#include "backtest/fill_engine.hpp"

#include "backtest/liquidity_walker.hpp"

#include <algorithm>

namespace tickback::backtest {

FillResult fill(int64_t start_time_us,
                const BaseIntent& intent,
                const market::SnapshotSeries& series,
                int64_t time_budget_us) {
    FillResult result{};
    double remaining = intent.quantity;

    LiquidityWalker walker(series, start_time_us, time_budget_us);
    while (remaining != 0.0 && !walker.exhausted()) {
        const Side side = remaining > 0.0 ? SIDE_BUY : SIDE_SELL;
        const double available = std::max(0.0, walker.available(side).size);

        double quantity = 0.0;
        if (side == SIDE_BUY) {
            quantity = std::min(available, remaining);
        } else {
            quantity = std::max(-available, remaining);
        }

        remaining -= quantity;
        result.instrument_delta += quantity;
        result.pnl_delta -= walker.current().ask_price * quantity;
        ++result.snapshots_consumed;

        walker.advance();
    }

    result.remaining_quantity = remaining;
    return result;
}

} // namespace tickback::backtest
