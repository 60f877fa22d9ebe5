#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tickback::backtest {

/**
 * @brief Request to change the position in one instrument.
 * quantity > 0 buys, < 0 sells, 0 is a no-op.
 */
struct BaseIntent {
    std::string instrument;
    double quantity = 0.0;
};

/**
 * @brief A strategy action: one or more base intents issued at the same time.
 */
struct Intent {
    int64_t timestamp_us = 0;
    std::vector<BaseIntent> base_intents;
};

inline size_t count_base_intents(const std::vector<Intent>& intents) {
    size_t total = 0;
    for (const auto& intent : intents) total += intent.base_intents.size();
    return total;
}

} // namespace tickback::backtest
