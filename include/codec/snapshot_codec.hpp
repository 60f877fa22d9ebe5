#pragma once

#include "core/errors.h"
#include "market/snapshot_series.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tickback::codec {

/**
 * @brief Identity of a cached series: the instrument and the CSV file it came from.
 */
struct SeriesHeader {
    std::string instrument;
    std::string source_path;
    uint64_t source_size = 0;
    int64_t source_mtime_ns = 0;

    bool operator==(const SeriesHeader& other) const = default;
};

// Fills the source_* fields from the file at `path` (absolute, normalised path).
TickbackStatus stamp_source(const std::string& path, SeriesHeader* header);

TickbackStatus encode_series(const SeriesHeader& header,
                             const market::SnapshotSeries& series,
                             std::vector<uint8_t>* out);

// Verifies the buffer before reading it; a corrupt or foreign buffer yields TICKBACK_ERR_PROTO.
TickbackStatus decode_series(const void* data, size_t size,
                             SeriesHeader* header,
                             market::SnapshotSeries* out);

TickbackStatus write_series_file(const std::string& path,
                                 const SeriesHeader& header,
                                 const market::SnapshotSeries& series);

TickbackStatus read_series_file(const std::string& path,
                                SeriesHeader* header,
                                market::SnapshotSeries* out);

} // namespace tickback::codec
