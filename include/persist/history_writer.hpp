#pragma once

#include "backtest/fill_history.hpp"
#include "core/errors.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

#ifdef TICKBACK_USE_LIBPQ
typedef struct pg_conn PGconn;
#endif

namespace tickback::persist {

// Quotes a CSV field when it is empty or holds a comma, quote or line break (PostgreSQL FORMAT csv rules).
std::string csv_field(std::string_view value);

// timestamp_us,instrument,pnl_delta,instrument_delta
std::string format_csv_row(const backtest::FillHistoryEntry& entry);

// run_id,time,instrument,pnl_delta,instrument_delta for COPY fill_history (see schema/fill_history.sql).
std::string format_copy_row(const std::string& run_id, const backtest::FillHistoryEntry& entry);

/**
 * @class HistoryWriter
 * @brief Persists a fill history for later analysis.
 *
 * With a PostgreSQL connection string (libpq builds only) the entries are
 * streamed into the fill_history table with COPY. The CSV file is written
 * when no database is configured and whenever the database path fails.
 */
class HistoryWriter {
public:
    explicit HistoryWriter(std::string connection_string = {});
    ~HistoryWriter();

    HistoryWriter(const HistoryWriter&) = delete;
    HistoryWriter& operator=(const HistoryWriter&) = delete;

    void set_csv_path(std::string path);
    [[nodiscard]] const std::string& csv_path() const { return csv_path_; }

    // Tags every database row so several runs can share the table.
    void set_run_id(std::string run_id);

    TickbackStatus write(const backtest::FillHistory& history);

    uint64_t failed_flush_count() const;

private:
    TickbackStatus flush_database(const backtest::FillHistory& history);
    TickbackStatus flush_csv(const backtest::FillHistory& history);

    std::string connection_string_;
    std::string csv_path_ = "data/fill_history.csv";
    std::string run_id_ = "default";
    std::atomic<uint64_t> failed_flushes_{0};

#ifdef TICKBACK_USE_LIBPQ
    PGconn* pg_conn_ = nullptr;
#endif
};

} // namespace tickback::persist
