#pragma once

#include <optional>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "config.hpp"
#include "road-network.hpp"
#include "segment-geometry.hpp"
#include "segment-metrics.hpp"
#include "trace-scanner.hpp"
#include "trajectory-accumulator.hpp"
#include "validator.hpp"

namespace fcd_digest {

struct PipelineResult {
	ScanStats						scan;
	std::vector<Trajectory>			trajectories;
	std::vector<SegmentMetrics>		segments;
	CongestionSummary				summary;
	std::vector<CongestionFeature> features;
	ValidationReport				validation;
};

// The network is only needed for aggregation and for projected (non-geo)
// traces.
[[nodiscard]]
auto needs_network(const ProgramOptions& options) -> bool;

// Builds the window filter from the enabled stages only.
[[nodiscard]]
auto make_window_filter(const ProgramOptions& options) -> WindowFilter;

// Runs every post-scan stage over an already scanned trace. `network` may be
// null when `needs_network(options)` is false.
[[nodiscard]]
auto digest(const ProgramOptions& options, const RoadNetwork* network, TrajectoryAccumulator&& trajectories,
			const EdgeAggregator& edges, ScanStats stats) -> PipelineResult;

// Loads the network, scans the trace once and digests it.
[[nodiscard]]
auto run_pipeline(const ProgramOptions& options) -> tl::expected<PipelineResult, std::string>;

// Writes the artifacts of the enabled stages into `options.output.dir`,
// creating it if needed.
[[nodiscard]]
auto write_artifacts(const ProgramOptions& options, const PipelineResult& result)
	-> tl::expected<void, std::string>;

} // namespace fcd_digest
