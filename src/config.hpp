#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <tl/expected.hpp>
#include <toml++/toml.hpp>

#include "congestion-classifier.hpp"
#include "segment-geometry.hpp"
#include "segment-metrics.hpp"
#include "trajectory-accumulator.hpp"
#include "validator.hpp"
#include "window-filter.hpp"

namespace fcd_digest {

struct OutputFiles {
	std::filesystem::path dir = "data/outputs";
	std::string			  trajectories = "trips_deckgl.json";
	std::string			  congestion = "roads_congestion.geojson";
	std::string			  validation = "validation_report.json";
	std::string			  edges = "edge_congestion.csv";
};

struct ProgramOptions {
	bool verbose = false;
	bool show_progress = true;
	bool early_stop = true;

	std::filesystem::path fcd_path = "data/outputs/fcd_full.xml";
	std::filesystem::path net_path = "data/sumo_net/network.net.xml";
	// x/y in the trace are lon/lat (sumo --fcd-output.geo)
	bool fcd_geo = true;

	OutputFiles output;

	bool			 trajectories_enabled = true;
	TimeWindow		 trajectory_window {"morning", 7 * 3600, 9 * 3600, 60, 1};
	TrajectoryLimits trajectory_limits;

	bool					aggregation_enabled = true;
	std::vector<TimeWindow> peak_windows {
		{"morning", 7 * 3600, 9 * 3600, 0, 30},
		{"evening", 17 * 3600, 20 * 3600, 0, 30},
	};
	MetricsSettings metrics;

	GeometrySettings	 geometry;
	CongestionClassifier classifier;

	std::vector<ReferenceCorridor> corridors = default_corridors();

	static auto print_toml_schema() -> void;
};

auto pprint(const ProgramOptions& options) -> void;

// Every key is optional and defaults to the value above. Returns a message
// naming the offending key when a value is out of range.
[[nodiscard]]
auto parse_config(const toml::table& config) -> tl::expected<ProgramOptions, std::string>;

// Parses and validates a TOML file, parse errors included.
[[nodiscard]]
auto load_config(const std::filesystem::path& config_file)
	-> tl::expected<ProgramOptions, std::string>;

} // namespace fcd_digest
