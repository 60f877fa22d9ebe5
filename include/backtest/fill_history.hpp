#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace tickback::backtest {

struct FillHistoryEntry {
    int64_t timestamp_us = 0;
    std::string instrument;
    double pnl_delta = 0.0;
    double instrument_delta = 0.0;
};

/**
 * @class FillHistory
 * @brief Insertion-ordered record of executed intents, keyed by (timestamp, instrument).
 *
 * Holds at most one entry per key. Recording a key that already exists
 * replaces the stored values in place: the entry keeps its original position
 * and the earlier fill is lost. Such replacements are counted.
 */
class FillHistory {
public:
    /**
     * @return true if a new entry was appended, false if an existing one was overwritten.
     */
    bool record(int64_t timestamp_us, const std::string& instrument, double pnl_delta, double instrument_delta);

    [[nodiscard]] const FillHistoryEntry* find(int64_t timestamp_us, const std::string& instrument) const;
    [[nodiscard]] std::vector<const FillHistoryEntry*> find_all(int64_t timestamp_us) const;

    [[nodiscard]] const std::vector<FillHistoryEntry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t overwritten_count() const { return overwritten_; }

    auto begin() const { return entries_.begin(); }
    auto end() const { return entries_.end(); }

    void clear();

private:
    using Key = std::pair<int64_t, std::string>;

    std::vector<FillHistoryEntry> entries_;
    std::map<Key, size_t> index_;
    size_t overwritten_ = 0;
};

} // namespace tickback::backtest
