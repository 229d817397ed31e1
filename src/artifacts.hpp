#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "segment-geometry.hpp"
#include "segment-metrics.hpp"
#include "trajectory-accumulator.hpp"
#include "validator.hpp"

namespace fcd_digest {

using json = nlohmann::json;

enum class write_error {
	cannot_open,
	write_failed,
};

[[nodiscard]]
auto pformat(write_error err) -> std::string;

// [{"id":"veh0","waypoints":[[25200,28.85,47.01,36.5],...]},...]
[[nodiscard]]
auto trajectories_to_json(const std::vector<Trajectory>& trajectories) -> json;

// GeoJSON FeatureCollection of LineStrings
[[nodiscard]]
auto features_to_geojson(const std::vector<CongestionFeature>& features) -> json;

// Missing simulated speed and ratio are written as null.
[[nodiscard]]
auto validation_report_to_json(const ValidationReport& report) -> json;

// Compact (no incidental whitespace).
[[nodiscard]]
auto write_json(const std::filesystem::path& path, const json& document)
	-> tl::expected<void, write_error>;

[[nodiscard]]
auto write_edge_table_csv(const std::filesystem::path& path, const std::vector<SegmentMetrics>& metrics)
	-> tl::expected<void, write_error>;

} // namespace fcd_digest
