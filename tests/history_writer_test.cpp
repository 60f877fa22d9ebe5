#include "persist/history_writer.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> read_lines(const fs::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

} // namespace

int main() {
    const fs::path dir = fs::temp_directory_path() / "tickback_history_writer_test";
    fs::remove_all(dir);

    tickback::backtest::FillHistory history;
    history.record(1000, "DOGE", -12.5, 25.0);
    history.record(2000, "PEPE", 3.25, -1.0);

    {
        tickback::persist::HistoryWriter writer;
        assert(writer.csv_path() == "data/fill_history.csv");
        const fs::path out = dir / "nested" / "history.csv";
        writer.set_csv_path(out.string());
        assert(writer.write(history) == TICKBACK_OK);
        assert(writer.failed_flush_count() == 0);

        const auto lines = read_lines(out);
        assert(lines.size() == 3);
        assert(lines[0] == "timestamp_us,instrument,pnl_delta,instrument_delta");
        assert(lines[1] == "1000,DOGE,-12.5000000000,25.0000000000");
        assert(lines[2] == "2000,PEPE,3.2500000000,-1.0000000000");

        // Rewriting replaces the previous file.
        tickback::backtest::FillHistory shorter;
        shorter.record(5, "DOGE", 0.0, 0.0);
        assert(writer.write(shorter) == TICKBACK_OK);
        assert(read_lines(out).size() == 2);
    }

    {
        // Fields with separators or quotes are quoted; embedded quotes doubled.
        assert(tickback::persist::csv_field("DOGE") == "DOGE");
        assert(tickback::persist::csv_field("DOGE,USDT") == "\"DOGE,USDT\"");
        assert(tickback::persist::csv_field("say \"hi\"") == "\"say \"\"hi\"\"\"");
        assert(tickback::persist::csv_field("two\nlines") == "\"two\nlines\"");
        assert(tickback::persist::csv_field("") == "\"\"");

        const tickback::backtest::FillHistoryEntry odd{-1, "ODD,\"NAME\"", 1.5, -2.0};
        assert(tickback::persist::format_csv_row(odd) ==
               "-1,\"ODD,\"\"NAME\"\"\",1.5000000000,-2.0000000000\n");
        assert(tickback::persist::format_copy_row("random,42", odd) ==
               "\"random,42\",1969-12-31 23:59:59.999999+00,\"ODD,\"\"NAME\"\"\",1.5000000000,-2.0000000000\n");

        tickback::backtest::FillHistory tricky;
        tricky.record(7, "A,B", 1.0, 1.0);
        tickback::persist::HistoryWriter writer;
        const fs::path out = dir / "quoted.csv";
        writer.set_csv_path(out.string());
        assert(writer.write(tricky) == TICKBACK_OK);
        const auto lines = read_lines(out);
        assert(lines.size() == 2);
        assert(lines[1] == "7,\"A,B\",1.0000000000,1.0000000000");
    }

    {
        // An unreachable database falls back to CSV.
        tickback::persist::HistoryWriter writer("host=/nonexistent_tickback_socket dbname=tickback connect_timeout=1");
        const fs::path out = dir / "fallback.csv";
        writer.set_csv_path(out.string());
        writer.set_run_id("test-run");
        assert(writer.write(history) == TICKBACK_OK);
        assert(writer.failed_flush_count() == 1);
        assert(read_lines(out).size() == 3);
    }

    {
        // A regular file in the way of the output directory.
        fs::create_directories(dir);
        std::ofstream(dir / "blocker") << "x";
        tickback::persist::HistoryWriter writer;
        writer.set_csv_path((dir / "blocker" / "history.csv").string());
        assert(writer.write(history) == TICKBACK_ERR_IO);
    }

    fs::remove_all(dir);
    return 0;
}
