#include "validator.hpp"

#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "road-network.hpp"
#include "segment-metrics.hpp"

namespace fcd_digest {

[[nodiscard]] auto to_string(const Verdict verdict) -> std::string_view {
	switch (verdict) {
		case Verdict::good:
			return "good";
		case Verdict::needs_tuning:
			return "needs tuning";
		case Verdict::under_congested:
			return "model under-congests";
		case Verdict::no_data:
			return "no data";
	}
	return "no data";
}

[[nodiscard]] auto verdict_for_ratio(const double ratio) -> Verdict {
	if (ratio < 1.5) {
		return Verdict::good;
	}
	if (ratio < 2.5) {
		return Verdict::needs_tuning;
	}
	return Verdict::under_congested;
}

[[nodiscard]] auto collect_probes(const std::vector<SegmentMetrics>& metrics,
								  const RoadNetwork& network) -> std::vector<SpeedProbe> {
	auto probes = std::vector<SpeedProbe> {};
	probes.reserve(metrics.size());
	for (const auto& row : metrics) {
		const auto* const segment = network.find(row.edge_id);
		if (segment == nullptr || segment->is_internal || segment->shape.empty()) {
			continue;
		}
		probes.push_back(SpeedProbe {
			.position = network.to_lon_lat(segment->shape.front()),
			.mean_speed_kmh = row.mean_speed_kmh,
		});
	}
	return probes;
}

[[nodiscard]] auto default_corridors() -> std::vector<ReferenceCorridor> {
	return {
		{"Calea Ieșilor → Centru", {28.830, 28.855, 46.960, 46.975}, 8.6},
		{"Botanica → Primărie", {28.840, 28.870, 46.955, 46.990}, 7.1},
		{"Moscova → UTM", {28.845, 28.870, 47.005, 47.030}, 8.8},
		{"Alba Iulia → Bd. Dacia", {28.800, 28.860, 47.005, 47.045}, 10.7},
		{"Ciocana → Centru", {28.890, 28.950, 46.990, 47.030}, 9.7},
		{"Muncești → Bd. Ștefan", {28.820, 28.865, 46.950, 46.985}, 12.5},
	};
}

Validator::Validator(std::vector<ReferenceCorridor> corridors) : corridors_(std::move(corridors)) { }

auto Validator::validate(std::span<const SpeedProbe> probes) const -> ValidationReport {
	auto report = ValidationReport {};
	report.reserve(this->corridors_.size());
	for (const auto& corridor : this->corridors_) {
		auto entry = CorridorReport {
			.name = corridor.name,
			.reference_speed_kmh = corridor.reference_speed_kmh,
		};

		double speed_sum = 0.0;
		for (const auto& probe : probes) {
			if (corridor.bbox.contains(probe.position)) {
				speed_sum += probe.mean_speed_kmh;
				++entry.segment_count;
			}
		}

		if (entry.segment_count > 0) {
			const auto simulated = speed_sum / static_cast<double>(entry.segment_count);
			entry.simulated_speed_kmh = simulated;
			if (corridor.reference_speed_kmh > 0.0) {
				entry.ratio = simulated / corridor.reference_speed_kmh;
				entry.verdict = verdict_for_ratio(*entry.ratio);
			}
		}
		report.push_back(std::move(entry));
	}
	return report;
}

auto Validator::validate(const std::vector<SegmentMetrics>& metrics, const RoadNetwork& network) const
	-> ValidationReport {
	const auto probes = collect_probes(metrics, network);
	return this->validate(std::span<const SpeedProbe>(probes));
}

auto log_report(const ValidationReport& report) -> void {
	spdlog::info("{:<30} {:>9} {:>7} {:>6}  {}", "Corridor", "Reference", "Sim", "Ratio", "Status");
	for (const auto& entry : report) {
		if (entry.simulated_speed_kmh.has_value() && entry.ratio.has_value()) {
			spdlog::info("{:<30} {:>9.1f} {:>7.1f} {:>5.1f}x  {}", entry.name,
						 entry.reference_speed_kmh, *entry.simulated_speed_kmh, *entry.ratio,
						 to_string(entry.verdict));
		} else {
			spdlog::info("{:<30} {:>9.1f} {:>7} {:>6}  {}", entry.name, entry.reference_speed_kmh,
						 "N/A", "?", to_string(entry.verdict));
		}
	}
}

} // namespace fcd_digest
