#pragma once

#include "backtest/fill_engine.hpp"
#include "backtest/fill_history.hpp"
#include "backtest/intent.hpp"
#include "market/snapshot_series.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tickback::backtest {

struct BacktestConfig {
    // Window after an intent's timestamp during which it may fill, in milliseconds.
    int64_t action_duration_ms = 1000;
    // Log every executed base intent.
    bool verbose = false;
};

struct BacktestResult {
    double cumulative_pnl = 0.0;
    std::map<std::string, double> positions;
    FillHistory history;
    size_t base_intents_processed = 0;
    size_t unknown_instrument_count = 0;
};

/**
 * @class BacktestEngine
 * @brief Replays strategy intents against historical quotes.
 *
 * Intents run in timestamp order (stable for equal timestamps). Each base
 * intent is filled with a fixed time budget of action_duration_ms * 1000
 * microseconds; its cash flow is added to the cumulative PnL and its filled
 * quantity to the instrument's position.
 */
class BacktestEngine {
public:
    explicit BacktestEngine(BacktestConfig config = {});

    void set_market_data(std::shared_ptr<const market::MarketData> data);
    [[nodiscard]] const market::MarketData* market_data() const { return market_data_.get(); }

    /**
     * @brief Runs a full backtest. The caller's intents are left untouched.
     */
    BacktestResult run(const std::vector<Intent>& intents) const;

    [[nodiscard]] int64_t time_budget_us() const { return time_budget_us_; }
    [[nodiscard]] const BacktestConfig& config() const { return config_; }

private:
    BacktestConfig config_;
    int64_t time_budget_us_ = 0;
    std::shared_ptr<const market::MarketData> market_data_;
};

/**
 * @brief One-shot helper over BacktestEngine.
 */
BacktestResult run_backtest(const std::vector<Intent>& intents,
                            int64_t action_duration_ms,
                            const market::MarketData& market_data);

} // namespace tickback::backtest
