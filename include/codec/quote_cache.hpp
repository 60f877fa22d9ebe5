#pragma once

#include "core/error.hpp"
#include "market/csv_loader.hpp"
#include "market/snapshot_series.hpp"

#include <string>

namespace tickback::codec {

// <cache_dir>/<instrument>.tbss
std::string cache_file_path(const std::string& cache_dir, const std::string& instrument);

/**
 * @brief Loads a BBO series through the binary cache in cache_dir.
 *
 * A cache file is used only when its instrument, source path, source size and
 * source modification time all match the CSV named by `source`. Otherwise the
 * CSV is parsed and the cache file rewritten. Failing to write the cache is
 * logged, not returned.
 *
 * @param from_cache Optional; set to whether the cache file was used.
 */
core::Expected<market::SnapshotSeries> load_series_cached(const std::string& cache_dir,
                                                         const market::DataSource& source,
                                                         bool* from_cache = nullptr);

} // namespace tickback::codec
