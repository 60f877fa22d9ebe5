#include "persist/history_writer.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <system_error>

#ifdef TICKBACK_USE_LIBPQ
#include <libpq-fe.h>
#endif

namespace tickback::persist {

namespace {

std::string format_number(double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.10f", value);
    return buf;
}

} // namespace

std::string csv_field(std::string_view value) {
    if (!value.empty() && value.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(value);
    }
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string format_csv_row(const backtest::FillHistoryEntry& entry) {
    return std::to_string(entry.timestamp_us) + "," +
           csv_field(entry.instrument) + "," +
           format_number(entry.pnl_delta) + "," +
           format_number(entry.instrument_delta) + "\n";
}

std::string format_copy_row(const std::string& run_id, const backtest::FillHistoryEntry& entry) {
    return csv_field(run_id) + "," +
           core::to_utc_us(entry.timestamp_us) + "," +
           csv_field(entry.instrument) + "," +
           format_number(entry.pnl_delta) + "," +
           format_number(entry.instrument_delta) + "\n";
}

HistoryWriter::HistoryWriter(std::string connection_string)
    : connection_string_(std::move(connection_string)) {}

HistoryWriter::~HistoryWriter() {
#ifdef TICKBACK_USE_LIBPQ
    if (pg_conn_) {
        PQfinish(pg_conn_);
        pg_conn_ = nullptr;
    }
#endif
}

void HistoryWriter::set_csv_path(std::string path) {
    csv_path_ = std::move(path);
}

void HistoryWriter::set_run_id(std::string run_id) {
    run_id_ = std::move(run_id);
}

uint64_t HistoryWriter::failed_flush_count() const {
    return failed_flushes_.load(std::memory_order_relaxed);
}

TickbackStatus HistoryWriter::write(const backtest::FillHistory& history) {
    if (!connection_string_.empty()) {
        if (flush_database(history) == TICKBACK_OK) return TICKBACK_OK;
        failed_flushes_.fetch_add(1, std::memory_order_relaxed);
        audit::Logger::instance().warn("Database write failed; falling back to " + csv_path_);
    }
    return flush_csv(history);
}

TickbackStatus HistoryWriter::flush_database(const backtest::FillHistory& history) {
#ifdef TICKBACK_USE_LIBPQ
    auto& log = audit::Logger::instance();
    if (!pg_conn_ || PQstatus(pg_conn_) != CONNECTION_OK) {
        if (pg_conn_) {
            PQfinish(pg_conn_);
            pg_conn_ = nullptr;
        }
        pg_conn_ = PQconnectdb(connection_string_.c_str());
        if (!pg_conn_ || PQstatus(pg_conn_) != CONNECTION_OK) {
            log.error(std::string("PostgreSQL connection failed: ") +
                      (pg_conn_ ? PQerrorMessage(pg_conn_) : "out of memory"));
            if (pg_conn_) {
                PQfinish(pg_conn_);
                pg_conn_ = nullptr;
            }
            return TICKBACK_ERR_IO;
        }
    }

    PGresult* res = PQexec(pg_conn_,
        "COPY fill_history (run_id, time, instrument, pnl_delta, instrument_delta) "
        "FROM STDIN WITH (FORMAT csv)");
    if (!res || PQresultStatus(res) != PGRES_COPY_IN) {
        if (res) PQclear(res);
        log.error(std::string("COPY fill_history rejected: ") + PQerrorMessage(pg_conn_));
        return TICKBACK_ERR_IO;
    }
    PQclear(res);

    bool copy_failed = false;
    for (const auto& entry : history) {
        const std::string line = format_copy_row(run_id_, entry);
        if (PQputCopyData(pg_conn_, line.data(), static_cast<int>(line.size())) != 1) {
            copy_failed = true;
            break;
        }
    }
    if (PQputCopyEnd(pg_conn_, copy_failed ? "copy data failed" : NULL) != 1) {
        copy_failed = true;
    }

    bool result_failed = false;
    while ((res = PQgetResult(pg_conn_)) != NULL) {
        if (PQresultStatus(res) != PGRES_COMMAND_OK) {
            result_failed = true;
        }
        PQclear(res);
    }

    if (copy_failed || result_failed) {
        log.error(std::string("COPY fill_history failed: ") + PQerrorMessage(pg_conn_));
        return TICKBACK_ERR_IO;
    }
    log.info("Stored " + std::to_string(history.size()) + " history rows in PostgreSQL");
    return TICKBACK_OK;
#else
    (void)history;
    audit::Logger::instance().warn("Built without libpq; ignoring database connection string.");
    return TICKBACK_ERR_INVALID;
#endif
}

TickbackStatus HistoryWriter::flush_csv(const backtest::FillHistory& history) {
    std::filesystem::path path(csv_path_);
    std::error_code ec;
    if (!path.parent_path().empty()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            audit::Logger::instance().error("Cannot create " + path.parent_path().string() + ": " + ec.message());
            return TICKBACK_ERR_IO;
        }
    }

    FILE* file = std::fopen(path.string().c_str(), "wb");
    if (!file) {
        audit::Logger::instance().error("Cannot open " + csv_path_ + " for writing");
        return TICKBACK_ERR_IO;
    }

    std::fputs("timestamp_us,instrument,pnl_delta,instrument_delta\n", file);
    for (const auto& entry : history) {
        const std::string line = format_csv_row(entry);
        std::fwrite(line.data(), 1, line.size(), file);
    }
    const bool ok = (std::fflush(file) == 0) && !std::ferror(file);
    std::fclose(file);
    if (!ok) {
        audit::Logger::instance().error("Short write to " + csv_path_);
        return TICKBACK_ERR_IO;
    }
    return TICKBACK_OK;
}

} // namespace tickback::persist
