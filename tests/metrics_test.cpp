#include "analysis/metrics.hpp"

#include "core/types.h"

#include <cassert>
#include <cmath>

using tickback::analysis::TradingMetrics;
using tickback::backtest::FillHistory;

namespace {

constexpr int64_t kDay = TICKBACK_US_PER_DAY;

bool almost_equal(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

void test_empty_history() {
    FillHistory history;
    TradingMetrics metrics(history);
    assert(metrics.total_pnl() == 0.0);
    assert(metrics.max_drawdown() == 0.0);
    assert(metrics.sharpe().empty());
    assert(metrics.flips().empty());
    assert(metrics.instruments().empty());
}

void test_mixed_history() {
    FillHistory history;
    history.record(0, "A", -10.0, 1.0);
    history.record(1000, "A", 15.0, -1.0);
    history.record(kDay, "A", -3.0, 2.0);
    history.record(kDay + 5, "B", 4.0, -1.0);
    history.record(2 * kDay, "A", 7.0, -3.0);

    TradingMetrics metrics(history);
    assert(metrics.instruments().size() == 2);
    assert(metrics.total_pnl() == 13.0);

    // Cumulative: -10, 5, 2, 6, 13. Peak 5 -> trough 2.
    assert(metrics.max_drawdown() == 3.0);

    const auto daily = metrics.daily_pnl("A");
    assert(daily.size() == 3);
    assert(daily.at(0) == 5.0);
    assert(daily.at(1) == -3.0);
    assert(daily.at(2) == 7.0);
    assert(metrics.daily_pnl("C").empty());

    const auto sharpe = metrics.sharpe();
    assert(sharpe.at("A").has_value());
    assert(almost_equal(*sharpe.at("A"), 3.0 / std::sqrt(56.0 / 3.0)));
    assert(!sharpe.at("B").has_value());
    assert(almost_equal(*metrics.sharpe(1.0).at("A"), 2.0 / std::sqrt(56.0 / 3.0)));

    // A single losing day has no spread; B never lost.
    const auto sortino = metrics.sortino();
    assert(!sortino.at("A").has_value());
    assert(!sortino.at("B").has_value());

    const auto volume = metrics.traded_volume();
    assert(volume.at("A") == 7.0);
    assert(volume.at("B") == 1.0);

    const auto pnl = metrics.pnl_by_instrument();
    assert(pnl.at("A") == 9.0);
    assert(pnl.at("B") == 4.0);

    // A: 0 -> 1 -> 0 -> 2 -> -1. Only the last step crosses zero.
    const auto flips = metrics.flips();
    assert(flips.at("A") == 1);
    assert(flips.at("B") == 0);

    // A held [0, 1000] and [kDay, 2*kDay]; the short opened at 2*kDay is still open.
    const auto holding = metrics.average_holding_time_us();
    assert(holding.at("A").has_value());
    assert(almost_equal(*holding.at("A"), (1000.0 + static_cast<double>(kDay)) / 2.0));
    assert(!holding.at("B").has_value());
}

void test_sortino_with_downside_spread() {
    FillHistory history;
    history.record(0, "A", -2.0, 1.0);
    history.record(kDay, "A", -4.0, 1.0);
    history.record(2 * kDay, "A", 12.0, -2.0);

    TradingMetrics metrics(history);
    const auto sortino = metrics.sortino();
    assert(sortino.at("A").has_value());
    assert(almost_equal(*sortino.at("A"), 2.0));
}

void test_negative_timestamps_bucket_by_floor_day() {
    FillHistory history;
    history.record(-1, "A", 1.0, 1.0);
    history.record(0, "A", 2.0, 1.0);
    TradingMetrics metrics(history);
    const auto daily = metrics.daily_pnl("A");
    assert(daily.size() == 2);
    assert(daily.at(-1) == 1.0);
    assert(daily.at(0) == 2.0);
}

void test_drawdown_starts_from_first_delta() {
    FillHistory history;
    history.record(0, "A", -5.0, 1.0);
    history.record(1, "A", -5.0, 1.0);
    TradingMetrics metrics(history);
    // Peak seeded at -5; cumulative falls to -10.
    assert(metrics.max_drawdown() == 5.0);
}

} // namespace

int main() {
    test_empty_history();
    test_mixed_history();
    test_sortino_with_downside_spread();
    test_negative_timestamps_bucket_by_floor_day();
    test_drawdown_starts_from_first_delta();
    return 0;
}
