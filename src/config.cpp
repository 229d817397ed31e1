#include "config.hpp"

#include <array>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "pretty-printers.hpp"

using namespace std::string_view_literals;

namespace fcd_digest {

namespace {

auto unexpected(std::string message) -> tl::unexpected<std::string> {
	return tl::make_unexpected(std::move(message));
}

auto parse_window(const toml::table& table, const std::string_view key, TimeWindow window)
	-> tl::expected<TimeWindow, std::string> {
	window.name = table["name"].value_or(window.name);
	window.start = table["start"].value_or(window.start);
	window.end = table["end"].value_or(window.end);
	window.buffer = table["buffer"].value_or(window.buffer);
	window.stride = static_cast<int>(table["stride"].value_or(std::int64_t {window.stride}));

	if (window.start > window.end) {
		return unexpected(fmt::format("{}: window '{}' starts after it ends ({} > {})", key,
									  window.name, window.start, window.end));
	}
	if (window.buffer < 0.0) {
		return unexpected(fmt::format("{}: window '{}' has a negative buffer", key, window.name));
	}
	if (window.stride <= 0) {
		return unexpected(fmt::format("{}: window '{}' must have a positive stride", key, window.name));
	}
	return window;
}

auto parse_corridor(const toml::table& table, const std::size_t index)
	-> tl::expected<ReferenceCorridor, std::string> {
	auto corridor = ReferenceCorridor {};
	corridor.name = table["name"].value_or(std::string_view {});
	if (corridor.name.empty()) {
		corridor.name = fmt::format("corridor-{}", index);
	}

	const auto* const bbox = table["bbox"].as_array();
	if (bbox == nullptr || bbox->size() != 4) {
		return unexpected(fmt::format("validation.corridors[{}].bbox must be "
									  "[lon_min, lon_max, lat_min, lat_max]",
									  index));
	}
	auto values = std::array<double, 4> {};
	for (std::size_t i = 0; i < values.size(); ++i) {
		const auto value = (*bbox)[i].value<double>();
		if (! value) {
			return unexpected(fmt::format("validation.corridors[{}].bbox[{}] is not a number", index, i));
		}
		values[i] = *value;
	}
	corridor.bbox = BoundingBox {values[0], values[1], values[2], values[3]};
	if (corridor.bbox.lon_min > corridor.bbox.lon_max || corridor.bbox.lat_min > corridor.bbox.lat_max) {
		return unexpected(fmt::format("validation.corridors[{}].bbox is inverted", index));
	}

	corridor.reference_speed_kmh = table["reference-speed"].value_or(0.0);
	if (corridor.reference_speed_kmh <= 0.0) {
		return unexpected(
			fmt::format("validation.corridors[{}].reference-speed must be positive", index));
	}
	return corridor;
}

auto parse_classifier(const toml::table& config, const CongestionClassifier& defaults)
	-> tl::expected<CongestionClassifier, std::string> {
	const auto* const threshold_array = config["congestion"]["thresholds"].as_array();
	const auto* const color_array = config["congestion"]["colors"].as_array();
	if (threshold_array == nullptr && color_array == nullptr) {
		return defaults;
	}

	auto thresholds = defaults.thresholds();
	if (threshold_array != nullptr) {
		thresholds.clear();
		for (const auto& node : *threshold_array) {
			const auto value = node.value<double>();
			if (! value) {
				return unexpected("congestion.thresholds must only contain numbers");
			}
			thresholds.push_back(*value);
		}
	}

	auto colors = defaults.colors();
	if (color_array != nullptr) {
		colors.clear();
		for (const auto& node : *color_array) {
			const auto* const rgb = node.as_array();
			if (rgb == nullptr || rgb->size() != 3) {
				return unexpected("congestion.colors must only contain [r, g, b] triples");
			}
			auto channels = std::array<std::uint8_t, 3> {};
			for (std::size_t i = 0; i < channels.size(); ++i) {
				const auto channel = (*rgb)[i].value<std::int64_t>();
				if (! channel || *channel < 0 || *channel > 255) {
					return unexpected("congestion.colors channels must be integers in [0, 255]");
				}
				channels[i] = static_cast<std::uint8_t>(*channel);
			}
			colors.push_back(Rgb {channels[0], channels[1], channels[2]});
		}
	}

	return CongestionClassifier::create(std::move(thresholds), std::move(colors))
		.map_error([](const std::string& err) { return fmt::format("congestion: {}", err); });
}

} // namespace

auto ProgramOptions::print_toml_schema() -> void {
	fmt::print(R"(
verbose = false # <bool>
progress = true # <bool> progress bar while scanning
early-stop = true # <bool> stop reading once every window has closed

[input]
fcd = "data/outputs/fcd_full.xml" # <string> sumo --fcd-output
net = "data/sumo_net/network.net.xml" # <string> netconvert output
fcd-geo = true # <bool> x/y in the trace are lon/lat

[output]
dir = "data/outputs" # <string>
trajectories = "trips_deckgl.json" # <string>
congestion = "roads_congestion.geojson" # <string>
validation = "validation_report.json" # <string>
edges = "edge_congestion.csv" # <string>

[trajectories]
enabled = true # <bool>
window = {{ name = "morning", start = 25200, end = 32400, buffer = 60 }} # seconds
min-waypoints = 5 # <unsigned integer>
max-vehicles = 8000 # <unsigned integer>
coordinate-decimals = 6 # <unsigned integer>

[aggregation]
enabled = true # <bool>
stride = 30 # <unsigned integer> default stride of every peak window
windows = [
    {{ name = "morning", start = 25200, end = 32400 }},
    {{ name = "evening", start = 61200, end = 72000 }},
]
flow-divisor = 4.0 # <float>
min-freeflow-kmh = 10.0 # <float>
fallback-freeflow-kmh = 50.0 # <float>
fallback-length-m = 50.0 # <float>

[geometry]
lane-width = 3.2 # <float> meters
meters-per-degree-lon = 75000.0 # <float>
meters-per-degree-lat = 111000.0 # <float>
merge-tolerance-deg = 5e-5 # <float>

[congestion]
thresholds = [0.25, 0.45, 0.60, 0.75, 0.90] # <float array> ascending
colors = [[204, 0, 0], [255, 68, 0], [255, 136, 0], [255, 187, 0], [136, 204, 0], [0, 170, 68]]

[[validation.corridors]]
name = "Calea Ieșilor → Centru" # <string>
bbox = [28.830, 28.855, 46.960, 46.975] # lon_min, lon_max, lat_min, lat_max
reference-speed = 8.6 # <float> km/h
)");
}

auto pprint(const ProgramOptions& options) -> void {
	using namespace escape_codes;
	fmt::print("({}ProgramOptions{}) {{\n", color::fg::cyan, reset);
	pprint_field("verbose", options.verbose);
	pprint_field("show_progress", options.show_progress);
	pprint_field("early_stop", options.early_stop);
	pprint_field("fcd_path", options.fcd_path);
	pprint_field("net_path", options.net_path);
	pprint_field("fcd_geo", options.fcd_geo);
	pprint_field("output.dir", options.output.dir);
	pprint_field("trajectories_enabled", options.trajectories_enabled);
	pprint_field("trajectory_window", pformat(options.trajectory_window));
	pprint_field("trajectory_limits", pformat(options.trajectory_limits));
	pprint_field("aggregation_enabled", options.aggregation_enabled);
	for (const auto& window : options.peak_windows) {
		pprint_field("peak_window", pformat(window));
	}
	pprint_field("geometry", pformat(options.geometry));
	pprint_field("congestion_bands", options.classifier.band_count());
	pprint_field("corridors", options.corridors.size());
	fmt::print("}};\n");
}

[[nodiscard]] auto parse_config(const toml::table& config) -> tl::expected<ProgramOptions, std::string> {
	auto options = ProgramOptions {};

	options.verbose = config["verbose"].value_or(options.verbose);
	options.show_progress = config["progress"].value_or(options.show_progress);
	options.early_stop = config["early-stop"].value_or(options.early_stop);

	options.fcd_path = config["input"]["fcd"].value_or(options.fcd_path.string());
	options.net_path = config["input"]["net"].value_or(options.net_path.string());
	options.fcd_geo = config["input"]["fcd-geo"].value_or(options.fcd_geo);
	if (options.fcd_path.empty()) {
		return unexpected("input.fcd must be set");
	}

	options.output.dir = config["output"]["dir"].value_or(options.output.dir.string());
	options.output.trajectories =
		config["output"]["trajectories"].value_or(options.output.trajectories);
	options.output.congestion =
		config["output"]["congestion"].value_or(options.output.congestion);
	options.output.validation =
		config["output"]["validation"].value_or(options.output.validation);
	options.output.edges = config["output"]["edges"].value_or(options.output.edges);

	{ // [trajectories]
		const auto trajectories = config["trajectories"];
		options.trajectories_enabled = trajectories["enabled"].value_or(options.trajectories_enabled);
		if (const auto* const window = trajectories["window"].as_table()) {
			auto parsed = parse_window(*window, "trajectories.window", options.trajectory_window);
			if (! parsed) {
				return unexpected(parsed.error());
			}
			options.trajectory_window = *parsed;
		}

		const auto min_waypoints = trajectories["min-waypoints"].value_or(
			static_cast<std::int64_t>(options.trajectory_limits.min_waypoints));
		if (min_waypoints < 1) {
			return unexpected("trajectories.min-waypoints must be at least 1");
		}
		const auto max_vehicles = trajectories["max-vehicles"].value_or(
			static_cast<std::int64_t>(options.trajectory_limits.max_vehicles));
		if (max_vehicles < 1) {
			return unexpected("trajectories.max-vehicles must be at least 1");
		}
		const auto decimals = trajectories["coordinate-decimals"].value_or(
			static_cast<std::int64_t>(options.trajectory_limits.coordinate_decimals));
		if (decimals < 0 || decimals > 12) {
			return unexpected("trajectories.coordinate-decimals must be between 0 and 12");
		}
		options.trajectory_limits = TrajectoryLimits {
			.min_waypoints = static_cast<std::size_t>(min_waypoints),
			.max_vehicles = static_cast<std::size_t>(max_vehicles),
			.coordinate_decimals = static_cast<int>(decimals),
		};
	}

	{ // [aggregation]
		const auto aggregation = config["aggregation"];
		options.aggregation_enabled = aggregation["enabled"].value_or(options.aggregation_enabled);

		const auto stride = aggregation["stride"].value_or(std::int64_t {30});
		if (stride <= 0) {
			return unexpected("aggregation.stride must be positive");
		}
		for (auto& window : options.peak_windows) {
			window.stride = static_cast<int>(stride);
		}

		if (const auto* const windows = aggregation["windows"].as_array()) {
			options.peak_windows.clear();
			for (std::size_t i = 0; i < windows->size(); ++i) {
				const auto* const table = (*windows)[i].as_table();
				if (table == nullptr) {
					return unexpected(fmt::format("aggregation.windows[{}] must be a table", i));
				}
				auto defaults = TimeWindow {fmt::format("peak-{}", i), 0.0, 0.0, 0.0, static_cast<int>(stride)};
				auto parsed = parse_window(*table, fmt::format("aggregation.windows[{}]", i), defaults);
				if (! parsed) {
					return unexpected(parsed.error());
				}
				options.peak_windows.push_back(std::move(*parsed));
			}
		}

		options.metrics.flow_divisor = aggregation["flow-divisor"].value_or(options.metrics.flow_divisor);
		options.metrics.min_freeflow_kmh =
			aggregation["min-freeflow-kmh"].value_or(options.metrics.min_freeflow_kmh);
		options.metrics.fallback_freeflow_kmh =
			aggregation["fallback-freeflow-kmh"].value_or(options.metrics.fallback_freeflow_kmh);
		options.metrics.fallback_length_m =
			aggregation["fallback-length-m"].value_or(options.metrics.fallback_length_m);
		if (options.metrics.flow_divisor <= 0.0) {
			return unexpected("aggregation.flow-divisor must be positive");
		}
		if (options.metrics.min_freeflow_kmh <= 0.0 || options.metrics.fallback_freeflow_kmh <= 0.0) {
			return unexpected("aggregation freeflow speeds must be positive");
		}
	}

	{ // [geometry]
		const auto geometry = config["geometry"];
		options.geometry.lane_width = geometry["lane-width"].value_or(options.geometry.lane_width);
		options.geometry.meters_per_degree_lon =
			geometry["meters-per-degree-lon"].value_or(options.geometry.meters_per_degree_lon);
		options.geometry.meters_per_degree_lat =
			geometry["meters-per-degree-lat"].value_or(options.geometry.meters_per_degree_lat);
		options.geometry.merge_tolerance_deg =
			geometry["merge-tolerance-deg"].value_or(options.geometry.merge_tolerance_deg);
		if (options.geometry.lane_width <= 0.0) {
			return unexpected("geometry.lane-width must be positive");
		}
		if (options.geometry.meters_per_degree_lon <= 0.0 ||
			options.geometry.meters_per_degree_lat <= 0.0) {
			return unexpected("geometry.meters-per-degree-* must be positive");
		}
		if (options.geometry.merge_tolerance_deg < 0.0) {
			return unexpected("geometry.merge-tolerance-deg must not be negative");
		}
	}

	{ // [congestion]
		auto classifier = parse_classifier(config, options.classifier);
		if (! classifier) {
			return unexpected(classifier.error());
		}
		options.classifier = std::move(*classifier);
	}

	if (const auto* const corridors = config["validation"]["corridors"].as_array()) {
		options.corridors.clear();
		for (std::size_t i = 0; i < corridors->size(); ++i) {
			const auto* const table = (*corridors)[i].as_table();
			if (table == nullptr) {
				return unexpected(fmt::format("validation.corridors[{}] must be a table", i));
			}
			auto corridor = parse_corridor(*table, i);
			if (! corridor) {
				return unexpected(corridor.error());
			}
			options.corridors.push_back(std::move(*corridor));
		}
	}

	if (options.verbose) {
		std::cout << toml::json_formatter {config} << "\n";
	}

	return options;
}

[[nodiscard]] auto load_config(const std::filesystem::path& config_file)
	-> tl::expected<ProgramOptions, std::string> {
	if (! std::filesystem::exists(config_file)) {
		return unexpected(fmt::format("configuration file not found: {}", config_file.string()));
	}

	toml::table config;
	try {
		config = toml::parse_file(config_file.string());
	} catch (const toml::parse_error& err) {
		return unexpected(fmt::format("parsing {} failed:\n{}", config_file.string(), err.what()));
	}
	return parse_config(config);
}

} // namespace fcd_digest
