#include "codec/snapshot_codec.hpp"

#include "tickback_generated.h"

#include <flatbuffers/flatbuffers.h>
#include <flatbuffers/verifier.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace tickback::codec {

TickbackStatus stamp_source(const std::string& path, SeriesHeader* header) {
    if (!header) return TICKBACK_ERR_INVALID;

    std::error_code ec;
    const std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) return TICKBACK_ERR_IO;
    const uintmax_t size = std::filesystem::file_size(absolute, ec);
    if (ec) return TICKBACK_ERR_IO;
    const auto mtime = std::filesystem::last_write_time(absolute, ec);
    if (ec) return TICKBACK_ERR_IO;

    header->source_path = absolute.lexically_normal().string();
    header->source_size = static_cast<uint64_t>(size);
    header->source_mtime_ns = static_cast<int64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(mtime.time_since_epoch()).count());
    return TICKBACK_OK;
}

TickbackStatus encode_series(const SeriesHeader& header,
                             const market::SnapshotSeries& series,
                             std::vector<uint8_t>* out) {
    if (!out) return TICKBACK_ERR_INVALID;

    std::vector<fb::Quote> quotes;
    quotes.reserve(series.size());
    for (const BboSnapshot& snap : series) {
        quotes.emplace_back(snap.timestamp_us, snap.bid_price, snap.bid_size, snap.ask_price, snap.ask_size);
    }

    flatbuffers::FlatBufferBuilder builder(128 + series.size() * sizeof(fb::Quote));
    auto name = builder.CreateString(header.instrument);
    auto quote_vec = builder.CreateVectorOfStructs(quotes);
    auto source = builder.CreateString(header.source_path);
    auto root = fb::CreateSnapshotSeries(builder, name, quote_vec, source,
                                         header.source_size, header.source_mtime_ns);
    fb::FinishSnapshotSeriesBuffer(builder, root);

    out->assign(builder.GetBufferPointer(), builder.GetBufferPointer() + builder.GetSize());
    return TICKBACK_OK;
}

TickbackStatus decode_series(const void* data, size_t size,
                             SeriesHeader* header,
                             market::SnapshotSeries* out) {
    if (!data || !out) return TICKBACK_ERR_INVALID;

    const auto* bytes = static_cast<const uint8_t*>(data);
    flatbuffers::Verifier verifier(bytes, size);
    if (!fb::VerifySnapshotSeriesBuffer(verifier)) return TICKBACK_ERR_PROTO;

    const auto* root = fb::GetSnapshotSeries(bytes);
    if (!root) return TICKBACK_ERR_PROTO;

    if (header) {
        header->instrument = root->instrument() ? root->instrument()->str() : std::string();
        header->source_path = root->source_path() ? root->source_path()->str() : std::string();
        header->source_size = root->source_size();
        header->source_mtime_ns = root->source_mtime_ns();
    }

    out->clear();
    if (const auto* quotes = root->quotes()) {
        out->reserve(quotes->size());
        for (const fb::Quote* q : *quotes) {
            out->push_back(BboSnapshot{q->timestamp_us(), q->bid_price(), q->bid_size(),
                                       q->ask_price(), q->ask_size()});
        }
    }
    return TICKBACK_OK;
}

TickbackStatus write_series_file(const std::string& path,
                                 const SeriesHeader& header,
                                 const market::SnapshotSeries& series) {
    std::vector<uint8_t> buffer;
    TickbackStatus status = encode_series(header, series, &buffer);
    if (status != TICKBACK_OK) return status;

    std::filesystem::path fs_path(path);
    std::error_code ec;
    if (!fs_path.parent_path().empty()) {
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) return TICKBACK_ERR_IO;
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return TICKBACK_ERR_IO;
    file.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    return file.good() ? TICKBACK_OK : TICKBACK_ERR_IO;
}

TickbackStatus read_series_file(const std::string& path,
                                SeriesHeader* header,
                                market::SnapshotSeries* out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return TICKBACK_ERR_IO;

    std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) return TICKBACK_ERR_IO;
    return decode_series(buffer.data(), buffer.size(), header, out);
}

} // namespace tickback::codec
