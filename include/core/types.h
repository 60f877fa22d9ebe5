#ifndef TICKBACK_CORE_TYPES_H
#define TICKBACK_CORE_TYPES_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Timestamps are microseconds since the Unix epoch (exchange "local_timestamp").
#define TICKBACK_US_PER_MS 1000
#define TICKBACK_US_PER_SECOND 1000000LL
#define TICKBACK_US_PER_DAY 86400000000LL

typedef enum {
    SIDE_BUY = 1,
    SIDE_SELL = 2
} Side;

/**
 * @brief Top-of-book quote observed at one point in time.
 * Sizes are in instrument units, prices in quote currency.
 */
typedef struct {
    int64_t timestamp_us;
    double bid_price;
    double bid_size;
    double ask_price;
    double ask_size;
} BboSnapshot;

/**
 * @brief A single public trade print, input to candle aggregation.
 */
typedef struct {
    int64_t timestamp_us;
    double price;
    double amount;
    uint8_t side;           // 1=Buy, 2=Sell (aggressor)
    uint8_t _padding[7];
} TradePrint;

#ifdef __cplusplus
}
#endif

#endif // TICKBACK_CORE_TYPES_H
