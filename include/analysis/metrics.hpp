#pragma once

#include "backtest/fill_history.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace tickback::analysis {

template <typename T>
using PerInstrument = std::map<std::string, T>;

/**
 * @class TradingMetrics
 * @brief Performance statistics over a fill history.
 * Per-instrument results cover every instrument that appears in the history.
 * Ratios are absent (std::nullopt) when they are undefined for the sample.
 */
class TradingMetrics {
public:
    explicit TradingMetrics(const backtest::FillHistory& history);

    [[nodiscard]] double total_pnl() const;

    /**
     * @brief Largest peak-to-trough decline of the cumulative PnL, in history order.
     */
    [[nodiscard]] double max_drawdown() const;

    /**
     * @brief PnL summed by UTC calendar day (key = days since epoch).
     */
    [[nodiscard]] std::map<int64_t, double> daily_pnl(const std::string& instrument) const;

    [[nodiscard]] PerInstrument<std::optional<double>> sharpe(double risk_free_rate = 0.0) const;
    [[nodiscard]] PerInstrument<std::optional<double>> sortino(double risk_free_rate = 0.0) const;
    [[nodiscard]] PerInstrument<double> traded_volume() const;
    [[nodiscard]] PerInstrument<double> pnl_by_instrument() const;
    [[nodiscard]] PerInstrument<int> flips() const;

    // Mean time between a position leaving zero and returning to (or crossing) zero, in microseconds.
    [[nodiscard]] PerInstrument<std::optional<double>> average_holding_time_us() const;

    [[nodiscard]] const std::set<std::string>& instruments() const { return instruments_; }

private:
    const backtest::FillHistory& history_;
    std::set<std::string> instruments_;
};

} // namespace tickback::analysis
