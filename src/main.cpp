#include <algorithm>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "analysis/metrics.hpp"
#include "analysis/strategy.hpp"
#include "audit/logger.hpp"
#include "backtest/backtest_engine.hpp"
#include "config/app_config.hpp"
#include "core/time_utils.hpp"
#include "market/candles.hpp"
#include "market/csv_loader.hpp"
#include "persist/history_writer.hpp"
#ifdef TICKBACK_USE_FLATBUFFERS
#include "codec/quote_cache.hpp"
#endif

namespace {

using tickback::audit::Logger;

std::optional<tickback::market::MarketData> load_quotes(const tickback::config::AppConfig& cfg) {
    auto& log = Logger::instance();
    if (cfg.cache_dir.empty()) {
        auto data = tickback::market::load_market_data(cfg.bbo_sources);
        if (!data) return std::nullopt;
        return std::move(data.value());
    }

#ifdef TICKBACK_USE_FLATBUFFERS
    tickback::market::MarketData data;
    for (const auto& source : cfg.bbo_sources) {
        if (data.count(source.instrument) != 0) {
            log.error("Instrument " + source.instrument + " listed twice");
            return std::nullopt;
        }
        auto series = tickback::codec::load_series_cached(cfg.cache_dir, source);
        if (!series) return std::nullopt;
        data.emplace(source.instrument, std::move(series.value()));
    }
    return data;
#else
    log.warn("Built without FlatBuffers; --cache-dir ignored.");
    auto data = tickback::market::load_market_data(cfg.bbo_sources);
    if (!data) return std::nullopt;
    return std::move(data.value());
#endif
}

std::optional<tickback::market::CandleMap> load_candles(const tickback::config::AppConfig& cfg) {
    tickback::market::CandleMap candles;
    for (const auto& source : cfg.trade_sources) {
        auto trades = tickback::market::load_trades_csv(source.path);
        if (!trades) return std::nullopt;
        candles[source.instrument] = tickback::market::make_candles(trades.value(), cfg.candle_ms);
        Logger::instance().info("Built " + std::to_string(candles[source.instrument].size()) +
                                " candles for " + source.instrument);
    }
    return candles;
}

template <typename T>
void print_per_instrument(const std::string& title, const tickback::analysis::PerInstrument<T>& values) {
    std::cout << title << ":";
    for (const auto& [instrument, value] : values) {
        std::cout << " " << instrument << "=" << value;
    }
    std::cout << "\n";
}

void print_per_instrument(const std::string& title,
                          const tickback::analysis::PerInstrument<std::optional<double>>& values) {
    std::cout << title << ":";
    for (const auto& [instrument, value] : values) {
        std::cout << " " << instrument << "=";
        if (value) std::cout << *value;
        else std::cout << "nan";
    }
    std::cout << "\n";
}

void show_trading_metrics(const tickback::backtest::BacktestResult& result) {
    tickback::analysis::TradingMetrics metrics(result.history);
    print_per_instrument("Sharpe Ratio", metrics.sharpe());
    print_per_instrument("Sortino Ratio", metrics.sortino());
    print_per_instrument("Average Holding Time (us)", metrics.average_holding_time_us());
    print_per_instrument("Traded Volume", metrics.traded_volume());
    print_per_instrument("Position Flips", metrics.flips());
    std::cout << "Total PnL: " << metrics.total_pnl() << "\n";
    std::cout << "Max PnL Drawdown: " << metrics.max_drawdown() << "\n";
    print_per_instrument("Open Positions", result.positions);
    std::cout << "Daily PnL:\n";
    for (const auto& instrument : metrics.instruments()) {
        for (const auto& [day, pnl] : metrics.daily_pnl(instrument)) {
            std::cout << "  " << instrument << " " << tickback::core::format_day(day) << " " << pnl << "\n";
        }
    }
    if (result.history.overwritten_count() > 0) {
        std::cout << "History entries overwritten: " << result.history.overwritten_count() << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    auto& log = Logger::instance();
    const std::string program = (argc > 0 && argv[0]) ? argv[0] : "tickback";

    auto parsed = tickback::config::parse_args(argc, argv);
    if (!parsed) {
        log.flush();
        std::cerr << tickback::config::usage(program);
        return 2;
    }
    const tickback::config::AppConfig& cfg = parsed.value();
    if (cfg.show_help) {
        std::cout << tickback::config::usage(program);
        return 0;
    }

    if (!cfg.log_file.empty() && !log.set_file(cfg.log_file)) {
        log.warn("Cannot open log file " + cfg.log_file);
    }
    log.log(tickback::audit::LogLevel::AUDIT, "Backtest starting, strategy=" + cfg.strategy);

    auto quotes = load_quotes(cfg);
    if (!quotes) {
        log.flush();
        return 1;
    }
    auto market_data = std::make_shared<const tickback::market::MarketData>(std::move(*quotes));

    tickback::analysis::StrategyContext context;
    context.time_start_us = std::numeric_limits<int64_t>::max();
    context.time_end_us = std::numeric_limits<int64_t>::min();
    for (const auto& [instrument, series] : *market_data) {
        context.instruments.push_back(instrument);
        if (series.empty()) continue;
        context.time_start_us = std::min(context.time_start_us, series.front().timestamp_us);
        context.time_end_us = std::max(context.time_end_us, series.back().timestamp_us);
    }
    if (context.time_start_us > context.time_end_us) {
        log.error("No quotes loaded; nothing to backtest.");
        log.flush();
        return 1;
    }
    log.info("Quotes span " + tickback::core::to_utc_us(context.time_start_us) + " .. " +
             tickback::core::to_utc_us(context.time_end_us));

    std::optional<tickback::market::CandleMap> candles;
    if (!cfg.trade_sources.empty()) {
        candles = load_candles(cfg);
        if (!candles) {
            log.flush();
            return 1;
        }
        context.candles = &*candles;
    }

    tickback::analysis::RandomStrategyConfig random_cfg;
    random_cfg.actions = cfg.actions;
    random_cfg.seed = cfg.seed;
    auto strategy = tickback::analysis::create_strategy(cfg.strategy, random_cfg);
    if (!strategy) {
        log.error("Unknown strategy " + cfg.strategy);
        log.flush();
        return 2;
    }
    const auto intents = strategy->generate(context);
    log.info("Strategy " + strategy->get_name() + " produced " + std::to_string(intents.size()) + " intents");

    tickback::backtest::BacktestConfig bt_cfg;
    bt_cfg.action_duration_ms = cfg.action_duration_ms;
    bt_cfg.verbose = cfg.verbose;
    tickback::backtest::BacktestEngine engine(bt_cfg);
    engine.set_market_data(market_data);
    const uint64_t run_start_ns = tickback::core::now_ns();
    const auto result = engine.run(intents);
    log.info("Backtest took " + std::to_string((tickback::core::now_ns() - run_start_ns) / 1000000) + " ms");

    log.flush();
    std::cout << "\nTESTING " << strategy->get_name() << " STRATEGY:\n\n";
    show_trading_metrics(result);
    std::cout.flush();

    tickback::persist::HistoryWriter writer(cfg.pg_conninfo);
    writer.set_csv_path(cfg.history_csv);
    writer.set_run_id(strategy->get_name() + "-" + std::to_string(cfg.seed));
    const TickbackStatus status = writer.write(result.history);
    if (status != TICKBACK_OK) {
        log.error("Failed to persist fill history (status " + std::to_string(static_cast<int>(status)) + ")");
        log.flush();
        return 1;
    }
    const bool in_database = !cfg.pg_conninfo.empty() && writer.failed_flush_count() == 0;
    log.info("Fill history written to " + (in_database ? std::string("PostgreSQL") : cfg.history_csv));
    log.flush();
    return 0;
}
