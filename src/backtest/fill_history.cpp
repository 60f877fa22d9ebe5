#include "backtest/fill_history.hpp"

namespace tickback::backtest {

bool FillHistory::record(int64_t timestamp_us,
                         const std::string& instrument,
                         double pnl_delta,
                         double instrument_delta) {
    auto [it, inserted] = index_.emplace(Key{timestamp_us, instrument}, entries_.size());
    if (!inserted) {
        FillHistoryEntry& existing = entries_[it->second];
        existing.pnl_delta = pnl_delta;
        existing.instrument_delta = instrument_delta;
        ++overwritten_;
        return false;
    }
    entries_.push_back(FillHistoryEntry{timestamp_us, instrument, pnl_delta, instrument_delta});
    return true;
}

const FillHistoryEntry* FillHistory::find(int64_t timestamp_us, const std::string& instrument) const {
    auto it = index_.find(Key{timestamp_us, instrument});
    if (it == index_.end()) return nullptr;
    return &entries_[it->second];
}

std::vector<const FillHistoryEntry*> FillHistory::find_all(int64_t timestamp_us) const {
    std::vector<const FillHistoryEntry*> out;
    auto it = index_.lower_bound(Key{timestamp_us, std::string()});
    for (; it != index_.end() && it->first.first == timestamp_us; ++it) {
        out.push_back(&entries_[it->second]);
    }
    return out;
}

void FillHistory::clear() {
    entries_.clear();
    index_.clear();
    overwritten_ = 0;
}

} // namespace tickback::backtest
