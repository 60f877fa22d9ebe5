#pragma once

#include "core/types.h"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace tickback::market {

// Quotes of one instrument, ascending by timestamp_us. Equal timestamps keep file order.
using SnapshotSeries = std::vector<BboSnapshot>;

// Instrument identifier -> quote history. Shared read-only by every fill of a run.
using MarketData = std::map<std::string, SnapshotSeries>;

inline bool is_time_ordered(const SnapshotSeries& series) {
    return std::is_sorted(series.begin(), series.end(),
                          [](const BboSnapshot& a, const BboSnapshot& b) {
                              return a.timestamp_us < b.timestamp_us;
                          });
}

inline void sort_by_time(SnapshotSeries& series) {
    std::stable_sort(series.begin(), series.end(),
                     [](const BboSnapshot& a, const BboSnapshot& b) {
                         return a.timestamp_us < b.timestamp_us;
                     });
}

/**
 * @brief Looks up an instrument without inserting it.
 * @return nullptr when the instrument has no market data.
 */
inline const SnapshotSeries* find_series(const MarketData& data, const std::string& instrument) {
    auto it = data.find(instrument);
    if (it == data.end()) return nullptr;
    return &it->second;
}

} // namespace tickback::market
