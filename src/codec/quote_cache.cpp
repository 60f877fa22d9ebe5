#include "codec/quote_cache.hpp"

#include "audit/logger.hpp"
#include "codec/snapshot_codec.hpp"

#include <filesystem>

namespace tickback::codec {

std::string cache_file_path(const std::string& cache_dir, const std::string& instrument) {
    return (std::filesystem::path(cache_dir) / (instrument + ".tbss")).string();
}

core::Expected<market::SnapshotSeries> load_series_cached(const std::string& cache_dir,
                                                         const market::DataSource& source,
                                                         bool* from_cache) {
    auto& log = audit::Logger::instance();
    if (from_cache) *from_cache = false;

    SeriesHeader expected;
    expected.instrument = source.instrument;
    if (stamp_source(source.path, &expected) != TICKBACK_OK) {
        log.error("Cannot open BBO file " + source.path);
        return core::ErrorCode::Io;
    }

    const std::string cache_path = cache_file_path(cache_dir, source.instrument);
    SeriesHeader cached;
    market::SnapshotSeries series;
    const TickbackStatus status = read_series_file(cache_path, &cached, &series);
    if (status == TICKBACK_OK && cached == expected) {
        log.info("Loaded " + std::to_string(series.size()) + " quotes for " + source.instrument + " from cache");
        if (from_cache) *from_cache = true;
        return series;
    }
    if (status == TICKBACK_OK) {
        log.info("Quote cache " + cache_path + " was built from other data; reparsing " + source.path);
    } else if (status == TICKBACK_ERR_PROTO) {
        log.warn("Quote cache " + cache_path + " is corrupt; reparsing " + source.path);
    }

    auto loaded = market::load_bbo_csv(source.path);
    if (!loaded) return loaded.error();
    log.info("Loaded " + std::to_string(loaded.value().size()) + " quotes for " + source.instrument);

    if (write_series_file(cache_path, expected, loaded.value()) != TICKBACK_OK) {
        log.warn("Could not write quote cache " + cache_path);
    }
    return loaded;
}

} // namespace tickback::codec
