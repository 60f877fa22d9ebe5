#include "market/csv_loader.hpp"

#include "audit/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <string>

namespace tickback::market {

namespace {

size_t trim_line(std::string& line) {
    while (!line.empty()) {
        char c = line.back();
        if (c == '\n' || c == '\r' || c == ' ') {
            line.pop_back();
            continue;
        }
        break;
    }
    return line.size();
}

bool parse_double(std::string_view s, double& out) {
    if (s.empty()) return false;
    std::string buf(s);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(buf.c_str(), &end);
    if (errno != 0 || end != buf.c_str() + buf.size() || !std::isfinite(value)) return false;
    out = value;
    return true;
}

// Timestamps are integral microseconds; some exports write them as floats.
bool parse_timestamp(std::string_view s, int64_t& out) {
    if (s.empty()) return false;
    std::string buf(s);
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(buf.c_str(), &end, 10);
    if (errno == 0 && end == buf.c_str() + buf.size()) {
        out = static_cast<int64_t>(value);
        return true;
    }
    double as_double = 0.0;
    if (!parse_double(s, as_double)) return false;
    out = static_cast<int64_t>(std::llround(as_double));
    return true;
}

bool parse_side(std::string_view s, uint8_t& out) {
    if (s == "buy" || s == "Buy" || s == "BUY" || s == "B") { out = SIDE_BUY; return true; }
    if (s == "sell" || s == "Sell" || s == "SELL" || s == "S") { out = SIDE_SELL; return true; }
    return false;
}

class CsvTable {
public:
    explicit CsvTable(const std::string& path) : file_(path) {}

    bool is_open() const { return file_.is_open(); }

    // Reads the header and resolves every required column; false if one is missing.
    bool read_header(const std::vector<std::string>& required) {
        std::string header;
        if (!next_line(header)) return false;
        const auto names = split_csv_line(header);
        columns_.clear();
        for (const auto& name : required) {
            auto it = std::find(names.begin(), names.end(), std::string_view(name));
            if (it == names.end()) {
                missing_ = name;
                return false;
            }
            columns_.push_back(static_cast<size_t>(it - names.begin()));
        }
        width_ = names.size();
        return true;
    }

    bool next_line(std::string& line) {
        while (std::getline(file_, line)) {
            if (trim_line(line) == 0) continue;
            return true;
        }
        return false;
    }

    size_t column(size_t i) const { return columns_[i]; }
    size_t width() const { return width_; }
    const std::string& missing() const { return missing_; }

private:
    std::ifstream file_;
    std::vector<size_t> columns_;
    size_t width_ = 0;
    std::string missing_;
};

} // namespace

std::vector<std::string_view> split_csv_line(std::string_view line, char delim) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (start <= line.size()) {
        auto pos = line.find(delim, start);
        if (pos == std::string_view::npos) pos = line.size();
        out.emplace_back(line.substr(start, pos - start));
        start = pos + 1;
        if (pos == line.size()) break;
    }
    return out;
}

core::Expected<SnapshotSeries> load_bbo_csv(const std::string& path, LoadStats* stats) {
    auto& log = audit::Logger::instance();
    CsvTable table(path);
    if (!table.is_open()) {
        log.error("Cannot open BBO file " + path);
        return core::ErrorCode::Io;
    }
    if (!table.read_header({"local_timestamp", "ask_amount", "ask_price", "bid_price", "bid_amount"})) {
        log.error("BBO file " + path + " lacks column '" + table.missing() + "'");
        return core::ErrorCode::Parse;
    }

    LoadStats local{};
    SnapshotSeries series;
    std::string line;
    while (table.next_line(line)) {
        ++local.rows;
        const auto fields = split_csv_line(line);
        if (fields.size() < table.width()) {
            ++local.skipped;
            continue;
        }

        BboSnapshot snap{};
        if (!parse_timestamp(fields[table.column(0)], snap.timestamp_us) ||
            !parse_double(fields[table.column(1)], snap.ask_size) ||
            !parse_double(fields[table.column(2)], snap.ask_price) ||
            !parse_double(fields[table.column(3)], snap.bid_price) ||
            !parse_double(fields[table.column(4)], snap.bid_size)) {
            ++local.skipped;
            continue;
        }
        series.push_back(snap);
    }

    sort_by_time(series);
    if (local.skipped > 0) {
        log.warn("Skipped " + std::to_string(local.skipped) + " malformed rows in " + path);
    }
    if (stats) *stats = local;
    return series;
}

core::Expected<std::vector<TradePrint>> load_trades_csv(const std::string& path, LoadStats* stats) {
    auto& log = audit::Logger::instance();
    CsvTable table(path);
    if (!table.is_open()) {
        log.error("Cannot open trades file " + path);
        return core::ErrorCode::Io;
    }
    if (!table.read_header({"local_timestamp", "price", "amount", "side"})) {
        log.error("Trades file " + path + " lacks column '" + table.missing() + "'");
        return core::ErrorCode::Parse;
    }

    LoadStats local{};
    std::vector<TradePrint> trades;
    std::string line;
    while (table.next_line(line)) {
        ++local.rows;
        const auto fields = split_csv_line(line);
        if (fields.size() < table.width()) {
            ++local.skipped;
            continue;
        }

        TradePrint trade{};
        if (!parse_timestamp(fields[table.column(0)], trade.timestamp_us) ||
            !parse_double(fields[table.column(1)], trade.price) ||
            !parse_double(fields[table.column(2)], trade.amount) ||
            !parse_side(fields[table.column(3)], trade.side)) {
            ++local.skipped;
            continue;
        }
        trades.push_back(trade);
    }

    std::stable_sort(trades.begin(), trades.end(), [](const TradePrint& a, const TradePrint& b) {
        return a.timestamp_us < b.timestamp_us;
    });
    if (local.skipped > 0) {
        log.warn("Skipped " + std::to_string(local.skipped) + " malformed rows in " + path);
    }
    if (stats) *stats = local;
    return trades;
}

core::Expected<MarketData> load_market_data(const std::vector<DataSource>& sources) {
    auto& log = audit::Logger::instance();
    MarketData data;
    for (const auto& source : sources) {
        if (data.count(source.instrument) != 0) {
            log.error("Instrument " + source.instrument + " listed twice");
            return core::ErrorCode::Invalid;
        }
        auto series = load_bbo_csv(source.path);
        if (!series) return series.error();
        log.info("Loaded " + std::to_string(series.value().size()) + " quotes for " + source.instrument);
        data.emplace(source.instrument, std::move(series.value()));
    }
    return data;
}

} // namespace tickback::market
