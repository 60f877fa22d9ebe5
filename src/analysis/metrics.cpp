#include "analysis/metrics.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <vector>

namespace tickback::analysis {

namespace {

double mean(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

// Population standard deviation, as a return series is the whole sample here.
double stdev(const std::vector<double>& values) {
    const double m = mean(values);
    double sq_sum = 0.0;
    for (double v : values) sq_sum += (v - m) * (v - m);
    return std::sqrt(sq_sum / static_cast<double>(values.size()));
}

std::vector<double> values_of(const std::map<int64_t, double>& by_day) {
    std::vector<double> out;
    out.reserve(by_day.size());
    for (const auto& [day, pnl] : by_day) out.push_back(pnl);
    return out;
}

int sign_of(double v) {
    return (v > 0.0) - (v < 0.0);
}

} // namespace

TradingMetrics::TradingMetrics(const backtest::FillHistory& history) : history_(history) {
    for (const auto& entry : history_) instruments_.insert(entry.instrument);
}

double TradingMetrics::total_pnl() const {
    double total = 0.0;
    for (const auto& entry : history_) total += entry.pnl_delta;
    return total;
}

double TradingMetrics::max_drawdown() const {
    if (history_.empty()) return 0.0;

    double current = 0.0;
    double peak = history_.entries().front().pnl_delta;
    double max_dd = 0.0;
    for (const auto& entry : history_) {
        current += entry.pnl_delta;
        peak = std::max(peak, current);
        max_dd = std::max(max_dd, peak - current);
    }
    return max_dd;
}

std::map<int64_t, double> TradingMetrics::daily_pnl(const std::string& instrument) const {
    std::map<int64_t, double> by_day;
    for (const auto& entry : history_) {
        if (entry.instrument != instrument) continue;
        by_day[core::utc_day(entry.timestamp_us)] += entry.pnl_delta;
    }
    return by_day;
}

PerInstrument<std::optional<double>> TradingMetrics::sharpe(double risk_free_rate) const {
    PerInstrument<std::optional<double>> out;
    for (const auto& instrument : instruments_) {
        const auto returns = values_of(daily_pnl(instrument));
        if (returns.empty()) {
            out[instrument] = std::nullopt;
            continue;
        }
        const double sd = stdev(returns);
        out[instrument] = (sd != 0.0)
            ? std::optional<double>((mean(returns) - risk_free_rate) / sd)
            : std::nullopt;
    }
    return out;
}

PerInstrument<std::optional<double>> TradingMetrics::sortino(double risk_free_rate) const {
    PerInstrument<std::optional<double>> out;
    for (const auto& instrument : instruments_) {
        const auto returns = values_of(daily_pnl(instrument));
        std::vector<double> negative;
        std::copy_if(returns.begin(), returns.end(), std::back_inserter(negative),
                     [](double r) { return r < 0.0; });
        if (negative.empty()) {
            out[instrument] = std::nullopt;
            continue;
        }
        const double downside = stdev(negative);
        out[instrument] = (downside != 0.0)
            ? std::optional<double>((mean(returns) - risk_free_rate) / downside)
            : std::nullopt;
    }
    return out;
}

PerInstrument<double> TradingMetrics::traded_volume() const {
    PerInstrument<double> out;
    for (const auto& instrument : instruments_) out[instrument] = 0.0;
    for (const auto& entry : history_) out[entry.instrument] += std::abs(entry.instrument_delta);
    return out;
}

PerInstrument<double> TradingMetrics::pnl_by_instrument() const {
    PerInstrument<double> out;
    for (const auto& instrument : instruments_) out[instrument] = 0.0;
    for (const auto& entry : history_) out[entry.instrument] += entry.pnl_delta;
    return out;
}

PerInstrument<int> TradingMetrics::flips() const {
    PerInstrument<int> out;
    PerInstrument<double> position;
    for (const auto& instrument : instruments_) {
        out[instrument] = 0;
        position[instrument] = 0.0;
    }
    for (const auto& entry : history_) {
        double& pos = position[entry.instrument];
        const double next = pos + entry.instrument_delta;
        if (sign_of(pos) * sign_of(next) < 0) ++out[entry.instrument];
        pos = next;
    }
    return out;
}

PerInstrument<std::optional<double>> TradingMetrics::average_holding_time_us() const {
    struct Holding {
        double position = 0.0;
        std::optional<int64_t> opened_at;
        std::vector<double> periods;
    };
    PerInstrument<Holding> state;

    for (const auto& entry : history_) {
        Holding& h = state[entry.instrument];
        const double next = h.position + entry.instrument_delta;
        const int before = sign_of(h.position);
        const int after = sign_of(next);

        if (before != 0 && after != before && h.opened_at) {
            h.periods.push_back(static_cast<double>(entry.timestamp_us - *h.opened_at));
            h.opened_at.reset();
        }
        if (after != 0 && after != before) {
            h.opened_at = entry.timestamp_us;
        }
        h.position = next;
    }

    PerInstrument<std::optional<double>> out;
    for (const auto& instrument : instruments_) {
        const auto& periods = state[instrument].periods;
        out[instrument] = periods.empty() ? std::nullopt : std::optional<double>(mean(periods));
    }
    return out;
}

} // namespace tickback::analysis
