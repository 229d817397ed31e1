#include "segment-metrics.hpp"

#include <algorithm>
#include <numeric>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "edge-aggregator.hpp"
#include "road-network.hpp"
#include "rounding.hpp"

namespace fcd_digest {

[[nodiscard]] auto pformat(const CongestionSummary& summary) -> std::string {
	return fmt::format("(CongestionSummary) {{ .segment_count = {}, .mean_speed_ratio = {:.3f}, "
					   ".median_speed_kmh = {:.1f}, .below_030 = {}, .below_050 = {} }}",
					   summary.segment_count, summary.mean_speed_ratio,
					   summary.median_speed_kmh, summary.below_030, summary.below_050);
}

[[nodiscard]] auto compute_segment_metrics(const EdgeAggregator& edges, const RoadNetwork& network,
										   const MetricsSettings& settings)
	-> std::vector<SegmentMetrics> {
	auto metrics = std::vector<SegmentMetrics> {};
	metrics.reserve(edges.size());

	std::size_t unknown = 0;
	for (const auto& [edge_id, aggregate] : edges.table()) {
		if (aggregate.sample_count == 0) {
			continue;
		}
		const auto* const segment = network.find(edge_id);
		double freeflow_kmh = settings.fallback_freeflow_kmh;
		double length_m = settings.fallback_length_m;
		// Internal junction lanes carry no usable speed limit or length.
		if (segment != nullptr && ! segment->is_internal) {
			freeflow_kmh = std::max(segment->speed_ms * kmh_per_ms, settings.min_freeflow_kmh);
			length_m = segment->length_m;
		} else {
			++unknown;
		}

		const auto mean = aggregate.mean_speed_kmh();
		metrics.push_back(SegmentMetrics {
			.edge_id = edge_id,
			.mean_speed_kmh = mean,
			.speed_ratio = mean / freeflow_kmh,
			.freeflow_kmh = freeflow_kmh,
			.length_m = length_m,
			.sample_count = aggregate.sample_count,
			.peak_flow = static_cast<double>(aggregate.sample_count) / settings.flow_divisor,
		});
	}

	if (unknown > 0) {
		spdlog::warn("{} aggregated edges are internal or not in the network, using fallback "
					 "freeflow {} km/h and length {} m",
					 unknown, settings.fallback_freeflow_kmh, settings.fallback_length_m);
	}

	std::sort(metrics.begin(), metrics.end(), [](const SegmentMetrics& a, const SegmentMetrics& b) {
		return a.edge_id < b.edge_id;
	});
	return metrics;
}

[[nodiscard]] auto summarize(const std::vector<SegmentMetrics>& metrics) -> CongestionSummary {
	auto summary = CongestionSummary {};
	summary.segment_count = metrics.size();
	if (metrics.empty()) {
		return summary;
	}

	const auto ratio_sum = std::accumulate(
		metrics.begin(), metrics.end(), 0.0,
		[](const double acc, const SegmentMetrics& m) { return acc + m.speed_ratio; });
	summary.mean_speed_ratio = ratio_sum / static_cast<double>(metrics.size());

	auto speeds = std::vector<double> {};
	speeds.reserve(metrics.size());
	for (const auto& m : metrics) {
		speeds.push_back(m.mean_speed_kmh);
		if (m.speed_ratio < 0.30) {
			++summary.below_030;
		}
		if (m.speed_ratio < 0.50) {
			++summary.below_050;
		}
	}
	std::sort(speeds.begin(), speeds.end());
	const auto n = speeds.size();
	summary.median_speed_kmh = n % 2 == 1 ? speeds[n / 2] : (speeds[n / 2 - 1] + speeds[n / 2]) / 2.0;

	return summary;
}

} // namespace fcd_digest
