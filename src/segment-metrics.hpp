#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fcd_digest {

class EdgeAggregator;
class RoadNetwork;

struct MetricsSettings {
	double flow_divisor = 4.0;
	double min_freeflow_kmh = 10.0;
	// Used for aggregated segments the network does not know
	double fallback_freeflow_kmh = 50.0;
	double fallback_length_m = 50.0;
};

struct SegmentMetrics {
	std::string	  edge_id;
	double		  mean_speed_kmh = 0.0;
	double		  speed_ratio = 0.0;
	double		  freeflow_kmh = 0.0;
	double		  length_m = 0.0;
	std::uint64_t sample_count = 0;
	double		  peak_flow = 0.0;
};

struct CongestionSummary {
	std::size_t segment_count = 0;
	double		mean_speed_ratio = 0.0;
	double		median_speed_kmh = 0.0;
	std::size_t below_030 = 0;
	std::size_t below_050 = 0;
};

[[nodiscard]]
auto pformat(const CongestionSummary& summary) -> std::string;

// One row per aggregated segment, sorted by edge id.
[[nodiscard]]
auto compute_segment_metrics(const EdgeAggregator& edges, const RoadNetwork& network,
							 const MetricsSettings& settings) -> std::vector<SegmentMetrics>;

[[nodiscard]]
auto summarize(const std::vector<SegmentMetrics>& metrics) -> CongestionSummary;

} // namespace fcd_digest
