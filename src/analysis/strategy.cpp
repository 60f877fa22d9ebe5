#include "analysis/strategy.hpp"

#include "audit/logger.hpp"

#include <map>
#include <random>

namespace tickback::analysis {

RandomStrategy::RandomStrategy(RandomStrategyConfig config) : config_(config) {}

std::vector<backtest::Intent> RandomStrategy::generate(const StrategyContext& context) {
    std::vector<backtest::Intent> intents;
    if (context.instruments.empty() || config_.actions == 0) return intents;

    const int64_t time_stop = context.time_end_us - config_.close_margin_us;
    if (time_stop <= context.time_start_us) {
        audit::Logger::instance().warn("Data span too short for the random strategy; no intents generated.");
        return intents;
    }

    const double dt = static_cast<double>(time_stop - context.time_start_us) /
                      static_cast<double>(config_.actions);

    std::mt19937_64 rng(config_.seed);
    std::uniform_int_distribution<int64_t> amount_dist(-config_.max_amount, config_.max_amount);
    std::uniform_int_distribution<size_t> instrument_dist(0, context.instruments.size() - 1);

    std::map<std::string, double> totals;
    for (const auto& instrument : context.instruments) totals[instrument] = 0.0;

    intents.reserve(config_.actions + context.instruments.size());
    for (size_t i = 0; i < config_.actions; ++i) {
        const double amount = static_cast<double>(amount_dist(rng));
        const std::string& instrument = context.instruments[instrument_dist(rng)];

        backtest::Intent intent;
        intent.timestamp_us = context.time_start_us + static_cast<int64_t>(static_cast<double>(i) * dt);
        intent.base_intents.push_back(backtest::BaseIntent{instrument, amount});
        intents.push_back(std::move(intent));

        totals[instrument] += amount;
    }

    for (const auto& instrument : context.instruments) {
        backtest::Intent close;
        close.timestamp_us = time_stop;
        close.base_intents.push_back(backtest::BaseIntent{instrument, -totals[instrument]});
        intents.push_back(std::move(close));
    }
    return intents;
}

LookaheadStrategy::LookaheadStrategy(LookaheadStrategyConfig config) : config_(config) {}

std::vector<backtest::Intent> LookaheadStrategy::generate(const StrategyContext& context) {
    std::vector<backtest::Intent> intents;
    if (!context.candles) {
        audit::Logger::instance().warn("Lookahead strategy needs candles; no intents generated.");
        return intents;
    }

    const int64_t earliest = context.time_start_us + config_.edge_margin_us;
    const int64_t latest = context.time_end_us - config_.edge_margin_us;

    for (const auto& [instrument, candles] : *context.candles) {
        for (const auto& candle : candles) {
            if (candle.time_end >= latest || candle.time_start <= earliest) continue;

            const double sign = (candle.open > candle.close) ? -1.0 : 1.0;

            backtest::Intent enter;
            enter.timestamp_us = candle.time_start;
            enter.base_intents.push_back(backtest::BaseIntent{instrument, config_.amount * sign});
            intents.push_back(std::move(enter));

            backtest::Intent exit;
            exit.timestamp_us = candle.time_end;
            exit.base_intents.push_back(backtest::BaseIntent{instrument, -config_.amount * sign});
            intents.push_back(std::move(exit));
        }
    }
    return intents;
}

std::unique_ptr<Strategy> create_strategy(const std::string& name,
                                          const RandomStrategyConfig& random_config,
                                          const LookaheadStrategyConfig& lookahead_config) {
    if (name == "random") return std::make_unique<RandomStrategy>(random_config);
    if (name == "lookahead" || name == "cheating") return std::make_unique<LookaheadStrategy>(lookahead_config);
    return nullptr;
}

} // namespace tickback::analysis
