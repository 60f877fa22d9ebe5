#pragma once

#include "backtest/intent.hpp"
#include "market/candles.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace tickback::analysis {

// Market facts a strategy may look at when planning its intents.
struct StrategyContext {
    int64_t time_start_us = 0;
    int64_t time_end_us = 0;
    std::vector<std::string> instruments;
    const market::CandleMap* candles = nullptr;
};

/**
 * @brief Base interface for intent generators.
 * Strategies plan the whole run up front; the backtest engine only executes.
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::vector<backtest::Intent> generate(const StrategyContext& context) = 0;

    [[nodiscard]] virtual std::string get_name() const = 0;
};

struct RandomStrategyConfig {
    size_t actions = 100;
    int64_t max_amount = 1000;
    // Closing intents are placed this long before the end of the data.
    int64_t close_margin_us = 60LL * 1000 * 1000;
    uint64_t seed = 42;
};

/**
 * @class RandomStrategy
 * @brief Evenly spaced random buys and sells, flattened before the data ends.
 */
class RandomStrategy final : public Strategy {
public:
    explicit RandomStrategy(RandomStrategyConfig config = {});

    std::vector<backtest::Intent> generate(const StrategyContext& context) override;
    [[nodiscard]] std::string get_name() const override { return "random"; }

private:
    RandomStrategyConfig config_;
};

struct LookaheadStrategyConfig {
    double amount = 1000.0;
    // Candles closer than this to either end of the data are ignored.
    int64_t edge_margin_us = 60LL * 1000 * 1000;
};

/**
 * @class LookaheadStrategy
 * @brief Trades each candle in the direction it is known to close.
 * Buys (or sells) at the candle's first trade and unwinds at its last trade.
 * It uses future information and serves as an upper bound for the simulator.
 */
class LookaheadStrategy final : public Strategy {
public:
    explicit LookaheadStrategy(LookaheadStrategyConfig config = {});

    std::vector<backtest::Intent> generate(const StrategyContext& context) override;
    [[nodiscard]] std::string get_name() const override { return "lookahead"; }

private:
    LookaheadStrategyConfig config_;
};

/**
 * @brief Builds a strategy by name ("random" or "lookahead").
 * @return nullptr for an unknown name.
 */
std::unique_ptr<Strategy> create_strategy(const std::string& name,
                                          const RandomStrategyConfig& random_config = {},
                                          const LookaheadStrategyConfig& lookahead_config = {});

} // namespace tickback::analysis
