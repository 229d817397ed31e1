#include "pipeline.hpp"

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "artifacts.hpp"
#include "edge-aggregator.hpp"
#include "timer.hpp"

namespace fcd_digest {

[[nodiscard]] auto needs_network(const ProgramOptions& options) -> bool {
	return options.aggregation_enabled || (options.trajectories_enabled && ! options.fcd_geo);
}

[[nodiscard]] auto make_window_filter(const ProgramOptions& options) -> WindowFilter {
	auto trajectory_window = std::optional<TimeWindow> {};
	if (options.trajectories_enabled) {
		trajectory_window = options.trajectory_window;
	}
	auto peak_windows = std::vector<TimeWindow> {};
	if (options.aggregation_enabled) {
		peak_windows = options.peak_windows;
	}
	return WindowFilter(std::move(trajectory_window), std::move(peak_windows));
}

[[nodiscard]] auto digest(const ProgramOptions& options, const RoadNetwork* network,
						  TrajectoryAccumulator&& trajectories, const EdgeAggregator& edges,
						  ScanStats stats) -> PipelineResult {
	auto result = PipelineResult {};
	result.scan = stats;

	if (options.trajectories_enabled) {
		result.trajectories = std::move(trajectories).finalize();
		if (result.trajectories.empty()) {
			spdlog::warn("No vehicle has {} or more waypoints in window {}",
						 options.trajectory_limits.min_waypoints, options.trajectory_window.name);
		}
	}

	if (options.aggregation_enabled && network != nullptr) {
		spdlog::info("Aggregated {} samples over {} edges", edges.total_samples(), edges.size());
		result.segments = compute_segment_metrics(edges, *network, options.metrics);
		result.summary = summarize(result.segments);
		if (result.segments.empty()) {
			spdlog::warn("No samples fell into the peak windows, congestion outputs will be empty");
		} else {
			spdlog::info("{}", pformat(result.summary));
		}

		const auto timer = Timer {};
		const auto builder = SegmentGeometryBuilder(*network, options.classifier, options.geometry);
		result.features = builder.build(result.segments);
		spdlog::info("Built {} lane features in {}", result.features.size(),
					 humantime(timer.elapsed_us()));

		const auto validator = Validator(options.corridors);
		result.validation = validator.validate(result.segments, *network);
		log_report(result.validation);
	}

	return result;
}

[[nodiscard]] auto run_pipeline(const ProgramOptions& options)
	-> tl::expected<PipelineResult, std::string> {
	auto network = std::optional<RoadNetwork> {};
	if (needs_network(options)) {
		const auto timer = Timer {};
		auto loaded = RoadNetwork::load(options.net_path);
		if (! loaded) {
			return tl::make_unexpected(
				fmt::format("{}: {}", options.net_path.string(), pformat(loaded.error())));
		}
		network = std::move(*loaded);
		spdlog::info("Loaded {} edges ({} on roundabouts) from {} in {}", network->size(),
					 network->roundabout_count(), options.net_path.string(),
					 humantime(timer.elapsed_us()));
		spdlog::debug("{}", pformat(network->projection()));
	}

	const auto windows = make_window_filter(options);
	if (const auto& window = windows.trajectory_window()) {
		spdlog::info("Trajectory window {}", pformat(*window));
	}
	for (const auto& window : windows.peak_windows()) {
		spdlog::info("Peak window {}", pformat(window));
	}

	auto projection = std::optional<Projection> {};
	if (! options.fcd_geo && network.has_value()) {
		projection = network->projection();
	}
	auto trajectories = TrajectoryAccumulator(options.trajectory_limits, projection);
	auto edges = EdgeAggregator {};

	const auto sinks = ScanSinks {
		.trajectories = options.trajectories_enabled ? &trajectories : nullptr,
		.edges = options.aggregation_enabled ? &edges : nullptr,
	};
	const auto scanner = TraceScanner(windows, ScanOptions {
												   .early_stop = options.early_stop,
												   .show_progress = options.show_progress,
											   });

	const auto timer = Timer {};
	const auto stats = scanner.scan_file(options.fcd_path, sinks);
	if (! stats) {
		return tl::make_unexpected(
			fmt::format("{}: {}", options.fcd_path.string(), pformat(stats.error())));
	}
	spdlog::info("Scanned {} lines in {}{}", stats->lines, humantime(timer.elapsed_us()),
				 stats->stopped_early ? fmt::format(", stopped early at t={}", stats->last_time) : "");
	if (stats->skipped_lines > 0) {
		spdlog::warn("Skipped {} malformed lines", stats->skipped_lines);
	}
	spdlog::debug("{}", pformat(*stats));

	return digest(options, network.has_value() ? &*network : nullptr, std::move(trajectories), edges,
				  *stats);
}

[[nodiscard]] auto write_artifacts(const ProgramOptions& options, const PipelineResult& result)
	-> tl::expected<void, std::string> {
	const auto& dir = options.output.dir;
	std::error_code ec;
	std::filesystem::create_directories(dir, ec);
	if (ec) {
		return tl::make_unexpected(
			fmt::format("cannot create output directory {}: {}", dir.string(), ec.message()));
	}

	const auto report = [](const std::filesystem::path& path,
						   const tl::expected<void, write_error>& written)
		-> tl::expected<void, std::string> {
		if (! written) {
			return tl::make_unexpected(fmt::format("{}: {}", path.string(), pformat(written.error())));
		}
		spdlog::info("Wrote {}", path.string());
		return {};
	};

	if (options.trajectories_enabled) {
		const auto path = dir / options.output.trajectories;
		auto written = report(path, write_json(path, trajectories_to_json(result.trajectories)));
		if (! written) {
			return written;
		}
	}

	if (options.aggregation_enabled) {
		{
			const auto path = dir / options.output.congestion;
			auto written = report(path, write_json(path, features_to_geojson(result.features)));
			if (! written) {
				return written;
			}
		}
		{
			const auto path = dir / options.output.validation;
			auto written =
				report(path, write_json(path, validation_report_to_json(result.validation)));
			if (! written) {
				return written;
			}
		}
		{
			const auto path = dir / options.output.edges;
			auto written = report(path, write_edge_table_csv(path, result.segments));
			if (! written) {
				return written;
			}
		}
	}

	return {};
}

} // namespace fcd_digest
