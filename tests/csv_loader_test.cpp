#include "market/csv_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace {

fs::path scratch_dir() {
    fs::path dir = fs::temp_directory_path() / "tickback_csv_loader_test";
    fs::create_directories(dir);
    return dir;
}

std::string write_file(const fs::path& path, const std::string& body) {
    std::ofstream out(path, std::ios::trunc);
    out << body;
    return path.string();
}

void test_split() {
    const auto fields = tickback::market::split_csv_line("a,,b,");
    assert(fields.size() == 4);
    assert(fields[0] == "a");
    assert(fields[1].empty());
    assert(fields[2] == "b");
    assert(fields[3].empty());
    assert(tickback::market::split_csv_line("").size() == 1);
}

void test_bbo() {
    const fs::path dir = scratch_dir();
    const std::string path = write_file(dir / "doge_bbo.csv",
        "exchange,symbol,timestamp,local_timestamp,ask_amount,ask_price,bid_price,bid_amount\r\n"
        "binance,DOGEUSDT,1,3000,50,0.101,0.1,40\r\n"
        "binance,DOGEUSDT,1,1000,10,0.103,0.102,20\r\n"
        "binance,DOGEUSDT,1,oops,10,0.1,0.1,20\r\n"
        "binance,DOGEUSDT,1,2000.0,30,0.105,0.104\r\n"
        "\r\n"
        "binance,DOGEUSDT,1,2000,30,0.105,0.104,35\r\n");

    tickback::market::LoadStats stats;
    auto loaded = tickback::market::load_bbo_csv(path, &stats);
    assert(loaded);
    const auto& series = loaded.value();
    assert(stats.rows == 5);
    assert(stats.skipped == 2);
    assert(series.size() == 3);
    assert(series[0].timestamp_us == 1000);
    assert(series[1].timestamp_us == 2000);
    assert(series[2].timestamp_us == 3000);
    assert(series[0].ask_size == 10.0);
    assert(series[0].ask_price == 0.103);
    assert(series[0].bid_price == 0.102);
    assert(series[0].bid_size == 20.0);
    assert(tickback::market::is_time_ordered(series));

    auto missing = tickback::market::load_bbo_csv((dir / "absent.csv").string());
    assert(!missing);
    assert(missing.error() == tickback::core::ErrorCode::Io);

    const std::string bad_header = write_file(dir / "bad_header.csv",
        "local_timestamp,ask_price,bid_price,bid_amount\n1,2,3,4\n");
    auto no_column = tickback::market::load_bbo_csv(bad_header);
    assert(!no_column);
    assert(no_column.error() == tickback::core::ErrorCode::Parse);
}

void test_trades() {
    const fs::path dir = scratch_dir();
    const std::string path = write_file(dir / "doge_trades.csv",
        "exchange,symbol,timestamp,local_timestamp,id,side,price,amount\n"
        "binance,DOGEUSDT,1,200,7,sell,0.1,500\n"
        "binance,DOGEUSDT,1,100,6,buy,0.2,250\n"
        "binance,DOGEUSDT,1,150,8,unknown,0.2,250\n");

    tickback::market::LoadStats stats;
    auto loaded = tickback::market::load_trades_csv(path, &stats);
    assert(loaded);
    const auto& trades = loaded.value();
    assert(stats.skipped == 1);
    assert(trades.size() == 2);
    assert(trades[0].timestamp_us == 100);
    assert(trades[0].side == SIDE_BUY);
    assert(trades[0].amount == 250.0);
    assert(trades[1].side == SIDE_SELL);
    assert(trades[1].price == 0.1);
}

void test_market_data() {
    const fs::path dir = scratch_dir();
    const std::string header =
        "local_timestamp,ask_amount,ask_price,bid_price,bid_amount\n";
    const std::string doge = write_file(dir / "md_doge.csv", header + "10,1,2,1,1\n");
    const std::string pepe = write_file(dir / "md_pepe.csv", header + "20,1,3,2,1\n30,1,3,2,1\n");

    auto data = tickback::market::load_market_data({{"DOGE", doge}, {"PEPE", pepe}});
    assert(data);
    assert(data.value().size() == 2);
    assert(data.value().at("PEPE").size() == 2);
    assert(tickback::market::find_series(data.value(), "DOGE") != nullptr);
    assert(tickback::market::find_series(data.value(), "BTC") == nullptr);

    auto duplicate = tickback::market::load_market_data({{"DOGE", doge}, {"DOGE", pepe}});
    assert(!duplicate);
    assert(duplicate.error() == tickback::core::ErrorCode::Invalid);

    auto broken = tickback::market::load_market_data({{"DOGE", doge}, {"PEPE", (dir / "nope.csv").string()}});
    assert(!broken);
    assert(broken.error() == tickback::core::ErrorCode::Io);
}

} // namespace

int main() {
    test_split();
    test_bbo();
    test_trades();
    test_market_data();
    return 0;
}
