#include "backtest/fill_engine.hpp"

#include <cassert>
#include <cmath>
#include <vector>

using tickback::backtest::BaseIntent;
using tickback::backtest::FillResult;
using tickback::backtest::fill;

namespace {
bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}
}

int main() {
    // Request fits in the first quote.
    {
        const tickback::market::SnapshotSeries series{{0, 9.0, 5.0, 10.0, 5.0}};
        const BaseIntent buy{"DOGE", 3.0};
        FillResult r = fill(0, buy, series, 1000);
        assert(r.instrument_delta == 3.0);
        assert(r.pnl_delta == -30.0);
        assert(r.remaining_quantity == 0.0);
        assert(r.snapshots_consumed == 1);
        assert(buy.quantity == 3.0);
    }

    // Liquidity caps the fill; the remainder is reported and dropped.
    {
        const tickback::market::SnapshotSeries series{{0, 9.0, 2.0, 10.0, 2.0}};
        FillResult r = fill(0, BaseIntent{"DOGE", 5.0}, series, 1000);
        assert(r.instrument_delta == 2.0);
        assert(r.pnl_delta == -20.0);
        assert(r.remaining_quantity == 3.0);
    }

    // Empty series.
    {
        const tickback::market::SnapshotSeries series;
        FillResult r = fill(0, BaseIntent{"DOGE", 5.0}, series, 1000);
        assert(r.instrument_delta == 0.0);
        assert(r.pnl_delta == 0.0);
        assert(r.remaining_quantity == 5.0);
        assert(r.snapshots_consumed == 0);
    }

    const tickback::market::SnapshotSeries book{
        {0, 9.0, 1.0, 10.0, 1.0},
        {100, 9.0, 2.0, 11.0, 2.0},
        {200, 9.0, 5.0, 12.0, 5.0},
        {2000, 9.0, 100.0, 13.0, 100.0},
    };

    // Zero request never trades.
    {
        FillResult r = fill(-1, BaseIntent{"DOGE", 0.0}, book, 1000);
        assert(r.instrument_delta == 0.0);
        assert(r.pnl_delta == 0.0);
        assert(r.snapshots_consumed == 0);
    }

    // Walks successive quotes: 1@10 + 2@11 + 1@12.
    {
        FillResult r = fill(-1, BaseIntent{"DOGE", 4.0}, book, 1000);
        assert(r.instrument_delta == 4.0);
        assert(r.pnl_delta == -44.0);
        assert(r.snapshots_consumed == 3);
    }

    // The quote at t=2000 lies beyond start + budget and must not contribute.
    {
        FillResult r = fill(-1, BaseIntent{"DOGE", 100.0}, book, 1000);
        assert(r.instrument_delta == 8.0);
        assert(r.pnl_delta == -92.0);
        assert(r.remaining_quantity == 92.0);
    }

    // Sells take bid size but are priced at the ask.
    {
        FillResult r = fill(-1, BaseIntent{"DOGE", -3.0}, book, 1000);
        assert(r.instrument_delta == -3.0);
        assert(r.pnl_delta == 32.0);
        assert(r.remaining_quantity == 0.0);
    }

    // A quote stamped exactly at the intent time is skipped.
    {
        const tickback::market::SnapshotSeries series{
            {0, 9.0, 5.0, 10.0, 5.0},
            {500, 19.0, 5.0, 20.0, 5.0},
        };
        FillResult r = fill(0, BaseIntent{"DOGE", 1.0}, series, 1000);
        assert(r.pnl_delta == -20.0);
    }

    // Intent after the last quote fills against the final snapshot.
    {
        const tickback::market::SnapshotSeries series{{0, 9.0, 5.0, 10.0, 5.0}};
        FillResult r = fill(500, BaseIntent{"DOGE", 2.0}, series, 1000);
        assert(r.instrument_delta == 2.0);
        assert(r.pnl_delta == -20.0);
    }

    // Zero budget: nothing qualifies.
    {
        FillResult r = fill(-1, BaseIntent{"DOGE", 2.0}, book, 0);
        assert(r.instrument_delta == 0.0);
    }

    // |realized| never exceeds |requested|.
    const std::vector<double> requests{-250.0, -7.5, -1.0, 0.5, 3.0, 8.0, 1e6};
    for (double q : requests) {
        for (int64_t start : {-1, 50, 150, 5000}) {
            FillResult r = fill(start, BaseIntent{"DOGE", q}, book, 2500);
            assert(std::abs(r.instrument_delta) <= std::abs(q));
            assert(almost_equal(r.instrument_delta + r.remaining_quantity, q));
        }
    }

    return 0;
}
