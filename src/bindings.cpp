#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "viewcache/viewcache.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_viewcache_cpp, m) {
    m.doc() = "viewcache C++ backend for viewport-aware spatial caching";
    m.attr("__version__") = viewcache::VERSION;

    py::register_exception<viewcache::ConfigError>(m, "ConfigError");

    py::class_<viewcache::Position>(m, "Position")
        .def(py::init<>())
        .def_static("from_degrees", &viewcache::Position::from_degrees,
                    py::arg("lat"), py::arg("lon"), py::arg("elevation") = 0.0)
        .def_readwrite("lat_e6", &viewcache::Position::lat_e6)
        .def_readwrite("lon_e6", &viewcache::Position::lon_e6)
        .def_readwrite("elevation_e4", &viewcache::Position::elevation_e4)
        .def_property_readonly("lat", &viewcache::Position::lat)
        .def_property_readonly("lon", &viewcache::Position::lon)
        .def_property_readonly("elevation", &viewcache::Position::elevation);

    py::class_<viewcache::GeoRecord>(m, "GeoRecord")
        .def(py::init<>())
        .def_readwrite("id", &viewcache::GeoRecord::id)
        .def_readwrite("position", &viewcache::GeoRecord::position)
        .def_readwrite("spatial_keys", &viewcache::GeoRecord::spatial_keys)
        .def_readwrite("generation", &viewcache::GeoRecord::generation)
        .def_readwrite("reference_count", &viewcache::GeoRecord::reference_count)
        .def_readwrite("content", &viewcache::GeoRecord::content)
        .def_readwrite("created_at", &viewcache::GeoRecord::created_at);

    py::class_<viewcache::BoundingBox>(m, "BoundingBox")
        .def(py::init<double, double, double, double>(),
             py::arg("west"), py::arg("south"), py::arg("east"), py::arg("north"))
        .def_readwrite("west", &viewcache::BoundingBox::west)
        .def_readwrite("south", &viewcache::BoundingBox::south)
        .def_readwrite("east", &viewcache::BoundingBox::east)
        .def_readwrite("north", &viewcache::BoundingBox::north)
        .def("contains", &viewcache::BoundingBox::contains, py::arg("lon"), py::arg("lat"))
        .def("is_degenerate", &viewcache::BoundingBox::is_degenerate);

    py::class_<viewcache::Viewport>(m, "Viewport")
        .def(py::init<>())
        .def_readwrite("center_lon", &viewcache::Viewport::center_lon)
        .def_readwrite("center_lat", &viewcache::Viewport::center_lat)
        .def_readwrite("zoom", &viewcache::Viewport::zoom)
        .def_readwrite("bounds", &viewcache::Viewport::bounds);

    py::class_<viewcache::PriorityWeights>(m, "PriorityWeights")
        .def(py::init<>())
        .def_readwrite("generation", &viewcache::PriorityWeights::generation)
        .def_readwrite("reference_count", &viewcache::PriorityWeights::reference_count)
        .def_readwrite("content", &viewcache::PriorityWeights::content)
        .def_readwrite("recency", &viewcache::PriorityWeights::recency)
        .def_readwrite("freshness", &viewcache::PriorityWeights::freshness)
        .def_readwrite("exploration_bonus", &viewcache::PriorityWeights::exploration_bonus)
        .def_readwrite("exploration_bonus_days", &viewcache::PriorityWeights::exploration_bonus_days)
        .def_readwrite("freshness_half_life_days", &viewcache::PriorityWeights::freshness_half_life_days)
        .def_readwrite("generation_cap", &viewcache::PriorityWeights::generation_cap)
        .def_readwrite("reference_count_cap", &viewcache::PriorityWeights::reference_count_cap);

    py::class_<viewcache::CacheConfig>(m, "CacheConfig")
        .def(py::init<>())
        .def_readwrite("expansion_factor", &viewcache::CacheConfig::expansion_factor)
        .def_readwrite("recency_window_ms", &viewcache::CacheConfig::recency_window_ms)
        .def_readwrite("hard_capacity", &viewcache::CacheConfig::hard_capacity)
        .def_readwrite("soft_capacity", &viewcache::CacheConfig::soft_capacity)
        .def_readwrite("per_record_kb", &viewcache::CacheConfig::per_record_kb)
        .def_readwrite("use_spatial_key_filtering", &viewcache::CacheConfig::use_spatial_key_filtering)
        .def_readwrite("max_visible_markers", &viewcache::CacheConfig::max_visible_markers)
        .def_readwrite("weights", &viewcache::CacheConfig::weights);

    m.def("load_config", &viewcache::load_config, py::arg("path"));

    py::class_<viewcache::CacheStats>(m, "CacheStats")
        .def_readonly("initial_count", &viewcache::CacheStats::initial_count)
        .def_readonly("kept_count", &viewcache::CacheStats::kept_count)
        .def_readonly("evicted_count", &viewcache::CacheStats::evicted_count)
        .def_readonly("memory_freed_mb", &viewcache::CacheStats::memory_freed_mb);

    py::class_<viewcache::CleanupResult>(m, "CleanupResult")
        .def_readonly("keep", &viewcache::CleanupResult::keep)
        .def_readonly("evict", &viewcache::CleanupResult::evict)
        .def_readonly("stats", &viewcache::CleanupResult::stats);

    py::class_<viewcache::TrackedSpatialKeys>(m, "TrackedSpatialKeys")
        .def(py::init<>())
        .def("add", &viewcache::TrackedSpatialKeys::add, py::arg("resolution"), py::arg("key"))
        .def("matches", &viewcache::TrackedSpatialKeys::matches);

    py::class_<viewcache::RankingFunction>(m, "RankingFunction")
        .def("score", &viewcache::RankingFunction::score,
             py::arg("record"), py::arg("last_access_ms"), py::arg("now_ms"));

    py::class_<viewcache::RetentionScorer, viewcache::RankingFunction>(m, "RetentionScorer")
        .def(py::init<viewcache::PriorityWeights>(), py::arg("weights") = viewcache::PriorityWeights{})
        .def_property_readonly("weights", &viewcache::RetentionScorer::weights);

    py::class_<viewcache::DiscoveryScorer, viewcache::RankingFunction>(m, "DiscoveryScorer")
        .def(py::init<>());

    m.def("score_priority", &viewcache::score_priority,
          py::arg("record"), py::arg("last_access_ms"), py::arg("now_ms"),
          py::arg("weights") = viewcache::PriorityWeights{});

    m.def("rank_top", [](const std::vector<viewcache::GeoRecord>& records,
                         const viewcache::AccessTimestamps& access,
                         const viewcache::RankingFunction& ranking,
                         size_t limit, int64_t now_ms) {
        std::vector<const viewcache::GeoRecord*> ptrs;
        ptrs.reserve(records.size());
        for (const auto& record : records) ptrs.push_back(&record);
        return viewcache::rank_top(ptrs, access, ranking, limit, now_ms);
    }, py::arg("records"), py::arg("access"), py::arg("ranking"), py::arg("limit"), py::arg("now_ms"));

    m.def("limit_markers", [](const std::vector<viewcache::GeoRecord>& records,
                              size_t max_markers, int64_t now_ms) {
        std::vector<const viewcache::GeoRecord*> ptrs;
        ptrs.reserve(records.size());
        for (const auto& record : records) ptrs.push_back(&record);
        return viewcache::limit_markers(ptrs, max_markers, now_ms);
    }, py::arg("records"), py::arg("max_markers"), py::arg("now_ms"));

    m.def("compute_cache_zone", &viewcache::compute_cache_zone,
          py::arg("viewport"), py::arg("expansion_factor"));
    m.def("estimate_memory_usage", &viewcache::estimate_memory_usage,
          py::arg("count"), py::arg("per_record_kb") = viewcache::DEFAULT_PER_RECORD_KB);

    m.def("cleanup", [](const viewcache::RecordTable& records,
                        const viewcache::AccessTimestamps& access,
                        const std::optional<viewcache::Viewport>& viewport,
                        const viewcache::TrackedSpatialKeys& keys,
                        const viewcache::CacheConfig& config,
                        int64_t now_ms) {
        return viewcache::cleanup(records, access, viewport, keys, config, now_ms);
    }, py::arg("records"), py::arg("access"), py::arg("viewport"), py::arg("tracked_keys"),
       py::arg("config"), py::arg("now_ms"));

    py::class_<viewcache::CumulativeCacheStats>(m, "CumulativeCacheStats")
        .def_readonly("total_cached", &viewcache::CumulativeCacheStats::total_cached)
        .def_readonly("total_evicted", &viewcache::CumulativeCacheStats::total_evicted)
        .def_readonly("last_cleanup_ms", &viewcache::CumulativeCacheStats::last_cleanup_ms)
        .def_readonly("cleanup_count", &viewcache::CumulativeCacheStats::cleanup_count)
        .def_readonly("memory_estimate_mb", &viewcache::CumulativeCacheStats::memory_estimate_mb);

    py::class_<viewcache::CacheStore>(m, "CacheStore")
        .def(py::init<viewcache::CacheConfig>(), py::arg("config") = viewcache::CacheConfig{})
        .def("ingest", &viewcache::CacheStore::ingest, py::arg("batch"), py::arg("now_ms"))
        .def("touch", &viewcache::CacheStore::touch, py::arg("ids"), py::arg("now_ms"))
        .def("update_viewport", &viewcache::CacheStore::update_viewport,
             py::arg("viewport"), py::arg("keys") = viewcache::TrackedSpatialKeys{})
        .def("set_fetch_in_progress", &viewcache::CacheStore::set_fetch_in_progress)
        .def("run_cleanup", &viewcache::CacheStore::run_cleanup, py::arg("now_ms"))
        .def("visible_markers", &viewcache::CacheStore::visible_markers, py::arg("now_ms"))
        .def("contains", &viewcache::CacheStore::contains)
        .def_property_readonly("size", &viewcache::CacheStore::size)
        .def_property_readonly("stats", &viewcache::CacheStore::cumulative_stats)
        .def("clear", &viewcache::CacheStore::clear);
}
