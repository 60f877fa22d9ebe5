#include "backtest/backtest_engine.hpp"

#include "audit/logger.hpp"
#include "core/types.h"

#include <algorithm>
#include <limits>
#include <sstream>

namespace tickback::backtest {

namespace {

// Milliseconds to microseconds, saturating at the int64_t range.
int64_t budget_from_ms(int64_t duration_ms) {
    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
    if (duration_ms > kMax / TICKBACK_US_PER_MS) return kMax;
    if (duration_ms < kMin / TICKBACK_US_PER_MS) return kMin;
    return duration_ms * TICKBACK_US_PER_MS;
}

} // namespace

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(config),
      time_budget_us_(budget_from_ms(config.action_duration_ms)),
      market_data_(std::make_shared<market::MarketData>()) {}

void BacktestEngine::set_market_data(std::shared_ptr<const market::MarketData> data) {
    market_data_ = data ? std::move(data) : std::make_shared<market::MarketData>();
}

BacktestResult BacktestEngine::run(const std::vector<Intent>& intents) const {
    auto& log = audit::Logger::instance();
    BacktestResult result{};

    for (const auto& [instrument, series] : *market_data_) {
        result.positions.emplace(instrument, 0.0);
        if (!market::is_time_ordered(series)) {
            log.warn("Quotes for " + instrument + " are not sorted by timestamp; fills are unspecified.");
        }
    }

    std::vector<const Intent*> ordered;
    ordered.reserve(intents.size());
    for (const auto& intent : intents) ordered.push_back(&intent);
    std::stable_sort(ordered.begin(), ordered.end(), [](const Intent* a, const Intent* b) {
        return a->timestamp_us < b->timestamp_us;
    });

    const market::SnapshotSeries empty_series;

    for (const Intent* intent : ordered) {
        for (const BaseIntent& base : intent->base_intents) {
            const market::SnapshotSeries* series = market::find_series(*market_data_, base.instrument);
            if (!series) {
                ++result.unknown_instrument_count;
                log.warn("No market data for instrument " + base.instrument + "; intent at " +
                         std::to_string(intent->timestamp_us) + " left unfilled.");
                series = &empty_series;
            }

            const FillResult filled = fill(intent->timestamp_us, base, *series, time_budget_us_);

            result.cumulative_pnl += filled.pnl_delta;
            auto pos = result.positions.find(base.instrument);
            if (pos != result.positions.end()) {
                pos->second += filled.instrument_delta;
            }

            if (!result.history.record(intent->timestamp_us, base.instrument,
                                       filled.pnl_delta, filled.instrument_delta)) {
                log.warn("Fill history entry for " + base.instrument + " at " +
                         std::to_string(intent->timestamp_us) + " overwritten by a later intent.");
            }
            ++result.base_intents_processed;

            if (config_.verbose) {
                std::ostringstream line;
                line << "Performed action: " << filled.instrument_delta << " " << base.instrument
                     << " (requested " << base.quantity << ", pnl " << filled.pnl_delta << ")";
                log.info(line.str());
            }
        }
    }

    std::ostringstream summary;
    summary << "Backtest done. intents=" << intents.size()
            << " base_intents=" << result.base_intents_processed
            << " history=" << result.history.size()
            << " pnl=" << result.cumulative_pnl;
    log.info(summary.str());
    return result;
}

BacktestResult run_backtest(const std::vector<Intent>& intents,
                            int64_t action_duration_ms,
                            const market::MarketData& market_data) {
    BacktestConfig config;
    config.action_duration_ms = action_duration_ms;
    BacktestEngine engine(config);
    engine.set_market_data(std::make_shared<const market::MarketData>(market_data));
    return engine.run(intents);
}

} // namespace tickback::backtest
