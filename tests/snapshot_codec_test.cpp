#include "codec/quote_cache.hpp"
#include "codec/snapshot_codec.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using tickback::codec::SeriesHeader;

namespace {

const char* kHeader = "local_timestamp,ask_amount,ask_price,bid_price,bid_amount\n";

void write_text(const fs::path& path, const std::string& body) {
    std::ofstream out(path, std::ios::trunc);
    out << body;
}

void test_encode_decode() {
    const tickback::market::SnapshotSeries series{
        {1000, 0.1, 40.0, 0.101, 50.0},
        {2000, 0.102, 20.0, 0.103, 10.0},
    };
    SeriesHeader header;
    header.instrument = "DOGE";
    header.source_path = "/data/doge.csv";
    header.source_size = 4096;
    header.source_mtime_ns = 1704067200000000000LL;

    std::vector<uint8_t> buf;
    assert(tickback::codec::encode_series(header, series, &buf) == TICKBACK_OK);
    assert(!buf.empty());

    SeriesHeader decoded_header;
    tickback::market::SnapshotSeries decoded;
    assert(tickback::codec::decode_series(buf.data(), buf.size(), &decoded_header, &decoded) == TICKBACK_OK);
    assert(decoded_header == header);
    assert(decoded.size() == 2);
    assert(decoded[1].timestamp_us == 2000);
    assert(decoded[1].ask_price == 0.103);
    assert(decoded[0].bid_size == 40.0);

    std::vector<uint8_t> garbage(buf.size(), 0xAB);
    assert(tickback::codec::decode_series(garbage.data(), garbage.size(), &decoded_header, &decoded) == TICKBACK_ERR_PROTO);
    assert(tickback::codec::decode_series(nullptr, 0, &decoded_header, &decoded) == TICKBACK_ERR_INVALID);
}

void test_series_files(const fs::path& dir) {
    const tickback::market::SnapshotSeries series{{1000, 0.1, 40.0, 0.101, 50.0}};
    SeriesHeader header;
    header.instrument = "DOGE";
    const std::string path = (dir / "files" / "DOGE.tbss").string();
    assert(tickback::codec::write_series_file(path, header, series) == TICKBACK_OK);

    SeriesHeader read_header;
    tickback::market::SnapshotSeries from_file;
    assert(tickback::codec::read_series_file(path, &read_header, &from_file) == TICKBACK_OK);
    assert(read_header.instrument == "DOGE");
    assert(from_file.size() == 1);
    assert(from_file[0].timestamp_us == 1000);

    assert(tickback::codec::read_series_file((dir / "missing.tbss").string(), &read_header, &from_file) == TICKBACK_ERR_IO);

    SeriesHeader stamp;
    assert(tickback::codec::stamp_source((dir / "absent.csv").string(), &stamp) == TICKBACK_ERR_IO);
}

void test_cache_follows_source(const fs::path& dir) {
    const fs::path cache_dir = dir / "cache";
    const fs::path jan = dir / "jan.csv";
    const fs::path feb = dir / "feb.csv";
    write_text(jan, std::string(kHeader) + "100,1,10,9,1\n200,1,11,10,1\n");
    write_text(feb, std::string(kHeader) + "300,1,12,11,1\n");

    bool hit = true;
    auto first = tickback::codec::load_series_cached(cache_dir.string(), {"DOGE", jan.string()}, &hit);
    assert(first);
    assert(!hit);
    assert(first.value().size() == 2);
    assert(fs::exists(tickback::codec::cache_file_path(cache_dir.string(), "DOGE")));

    auto again = tickback::codec::load_series_cached(cache_dir.string(), {"DOGE", jan.string()}, &hit);
    assert(again);
    assert(hit);
    assert(again.value().size() == 2);
    assert(again.value()[1].ask_price == 11.0);

    // Same instrument, different file: the January cache must not be served.
    auto other = tickback::codec::load_series_cached(cache_dir.string(), {"DOGE", feb.string()}, &hit);
    assert(other);
    assert(!hit);
    assert(other.value().size() == 1);
    assert(other.value()[0].timestamp_us == 300);

    // Same path and size, rewritten contents with a newer mtime.
    write_text(feb, std::string(kHeader) + "400,1,12,11,1\n");
    fs::last_write_time(feb, fs::last_write_time(feb) + std::chrono::seconds(10));
    auto rewritten = tickback::codec::load_series_cached(cache_dir.string(), {"DOGE", feb.string()}, &hit);
    assert(rewritten);
    assert(!hit);
    assert(rewritten.value()[0].timestamp_us == 400);

    // A cache file whose stamp matches is trusted as-is.
    SeriesHeader stamped;
    stamped.instrument = "DOGE";
    assert(tickback::codec::stamp_source(feb.string(), &stamped) == TICKBACK_OK);
    const tickback::market::SnapshotSeries doctored{{999, 1.0, 1.0, 2.0, 1.0}};
    assert(tickback::codec::write_series_file(tickback::codec::cache_file_path(cache_dir.string(), "DOGE"),
                                              stamped, doctored) == TICKBACK_OK);
    auto trusted = tickback::codec::load_series_cached(cache_dir.string(), {"DOGE", feb.string()}, &hit);
    assert(trusted);
    assert(hit);
    assert(trusted.value()[0].timestamp_us == 999);

    // A corrupt cache file is rebuilt from the CSV.
    write_text(tickback::codec::cache_file_path(cache_dir.string(), "DOGE"), "not a flatbuffer");
    auto rebuilt = tickback::codec::load_series_cached(cache_dir.string(), {"DOGE", feb.string()}, &hit);
    assert(rebuilt);
    assert(!hit);
    assert(rebuilt.value()[0].timestamp_us == 400);

    auto missing = tickback::codec::load_series_cached(cache_dir.string(), {"DOGE", (dir / "mar.csv").string()});
    assert(!missing);
    assert(missing.error() == tickback::core::ErrorCode::Io);
}

} // namespace

int main() {
    const fs::path dir = fs::temp_directory_path() / "tickback_codec_test";
    fs::remove_all(dir);
    fs::create_directories(dir);

    test_encode_decode();
    test_series_files(dir);
    test_cache_follows_source(dir);

    fs::remove_all(dir);
    return 0;
}
