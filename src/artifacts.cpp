#include "artifacts.hpp"

#include <fstream>

#include <fmt/core.h>

#include "rounding.hpp"

namespace fcd_digest {

[[nodiscard]] auto pformat(const write_error err) -> std::string {
	switch (err) {
		case write_error::cannot_open:
			return "cannot open output file for writing";
		case write_error::write_failed:
			return "failed to write output file";
	}
	return "unknown write error";
}

[[nodiscard]] auto trajectories_to_json(const std::vector<Trajectory>& trajectories) -> json {
	auto document = json::array();
	for (const auto& trajectory : trajectories) {
		auto waypoints = json::array();
		for (const auto& w : trajectory.waypoints) {
			waypoints.push_back(json::array({w.second, w.lon, w.lat, w.speed_kmh}));
		}
		document.push_back(json {
			{"id",		   trajectory.vehicle_id},
			{"waypoints", std::move(waypoints)  },
		});
	}
	return document;
}

[[nodiscard]] auto features_to_geojson(const std::vector<CongestionFeature>& features) -> json {
	auto collection = json::array();
	for (const auto& feature : features) {
		auto coordinates = json::array();
		for (const auto& p : feature.coordinates) {
			coordinates.push_back(json::array({p.lon, p.lat}));
		}
		collection.push_back(json {
			{"type", "Feature"},
			{"geometry",
			 json {
				 {"type", "LineString"},
				 {"coordinates", std::move(coordinates)},
			 }},
			{"properties",
			 json {
				 {"speed_ratio", feature.speed_ratio},
				 {"peak_flow", feature.peak_flow},
				 {"color", json::array({feature.color.r, feature.color.g, feature.color.b})},
				 {"lane_count", feature.lane_count},
				 {"is_roundabout", feature.is_roundabout},
			 }},
		});
	}
	return json {
		{"type",	 "FeatureCollection"  },
		{"features", std::move(collection)},
	};
}

[[nodiscard]] auto validation_report_to_json(const ValidationReport& report) -> json {
	auto document = json::array();
	for (const auto& entry : report) {
		document.push_back(json {
			{"name", entry.name},
			{"reference_speed", entry.reference_speed_kmh},
			{"simulated_speed",
			 entry.simulated_speed_kmh.has_value() ? json(round_to(*entry.simulated_speed_kmh, 2))
												   : json(nullptr)},
			{"ratio", entry.ratio.has_value() ? json(round_to(*entry.ratio, 3)) : json(nullptr)},
			{"verdict", std::string(to_string(entry.verdict))},
			{"segment_count", entry.segment_count},
		});
	}
	return document;
}

[[nodiscard]] auto write_json(const std::filesystem::path& path, const json& document)
	-> tl::expected<void, write_error> {
	auto file = std::ofstream(path, std::ios::out | std::ios::trunc);
	if (! file.is_open()) {
		return tl::make_unexpected(write_error::cannot_open);
	}
	file << document.dump();
	file.flush();
	if (! file) {
		return tl::make_unexpected(write_error::write_failed);
	}
	return {};
}

[[nodiscard]] auto write_edge_table_csv(const std::filesystem::path&	  path,
										const std::vector<SegmentMetrics>& metrics)
	-> tl::expected<void, write_error> {
	auto file = std::ofstream(path, std::ios::out | std::ios::trunc);
	if (! file.is_open()) {
		return tl::make_unexpected(write_error::cannot_open);
	}
	file << "edge_id,mean_speed_kmh,mean_speed_rel,freeflow_kmh,length_m,sample_count,peak_flow\n";
	for (const auto& row : metrics) {
		file << fmt::format("{},{:.2f},{:.4f},{:.1f},{:.1f},{},{:.1f}\n", row.edge_id,
							row.mean_speed_kmh, row.speed_ratio, row.freeflow_kmh, row.length_m,
							row.sample_count, row.peak_flow);
	}
	file.flush();
	if (! file) {
		return tl::make_unexpected(write_error::write_failed);
	}
	return {};
}

} // namespace fcd_digest
