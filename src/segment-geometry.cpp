#include "segment-geometry.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <iterator>
#include <map>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "road-network.hpp"
#include "rounding.hpp"
#include "segment-metrics.hpp"

namespace fcd_digest {

namespace {

auto is_digit(const char c) -> bool {
	return c >= '0' && c <= '9';
}

struct GroupMember {
	const RoadSegment*	  segment = nullptr;
	const SegmentMetrics* metrics = nullptr;
	int					  split = 0;
};

auto weighted_mean(const std::vector<GroupMember>& members, auto value_of) -> double {
	double weighted = 0.0;
	double total_weight = 0.0;
	double plain = 0.0;
	for (const auto& member : members) {
		const auto weight = std::max(member.segment->length_m, 0.0);
		weighted += value_of(member) * weight;
		total_weight += weight;
		plain += value_of(member);
	}
	if (total_weight <= 0.0) {
		return plain / static_cast<double>(members.size());
	}
	return weighted / total_weight;
}

} // namespace

[[nodiscard]] auto pformat(const GeometrySettings& settings) -> std::string {
	return fmt::format("(GeometrySettings) {{ .lane_width = {}, .meters_per_degree_lon = {}, "
					   ".meters_per_degree_lat = {}, .merge_tolerance_deg = {} }}",
					   settings.lane_width, settings.meters_per_degree_lon,
					   settings.meters_per_degree_lat, settings.merge_tolerance_deg);
}

[[nodiscard]] auto base_id(std::string_view id) -> std::string_view {
	const std::size_t start = is_reverse_segment(id) ? 1 : 0;
	std::size_t		  end = start;
	while (end < id.size() && is_digit(id[end])) {
		++end;
	}
	if (end == start) {
		return id;
	}
	return id.substr(start, end - start);
}

[[nodiscard]] auto split_index(std::string_view id) -> int {
	const auto hash = id.rfind('#');
	if (hash == std::string_view::npos || hash + 1 == id.size()) {
		return 0;
	}
	const auto digits = id.substr(hash + 1);
	if (! std::all_of(digits.begin(), digits.end(), is_digit)) {
		return 0;
	}
	int		   index = 0;
	const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
	if (ec != std::errc {}) {
		return 0;
	}
	return index;
}

auto append_polyline(std::vector<LonLat>& merged, const std::vector<LonLat>& next,
					 const double tolerance_deg) -> void {
	auto first = next.begin();
	if (! merged.empty() && first != next.end()) {
		const auto& last = merged.back();
		if (std::abs(first->lon - last.lon) < tolerance_deg &&
			std::abs(first->lat - last.lat) < tolerance_deg) {
			++first;
		}
	}
	merged.insert(merged.end(), first, next.end());
}

[[nodiscard]] auto offset_polyline(const std::vector<LonLat>& line, const double offset_m,
								   const GeometrySettings& settings) -> std::vector<LonLat> {
	const auto n = line.size();
	if (n < 2) {
		return line;
	}

	auto result = std::vector<LonLat> {};
	result.reserve(n);
	for (std::size_t i = 0; i < n; ++i) {
		// forward difference at the start, backward at the end, central elsewhere
		const auto& from = i == 0 ? line[0] : line[i - 1];
		const auto& to = i == n - 1 ? line[n - 1] : line[i + 1];
		const double dx = to.lon - from.lon;
		const double dy = to.lat - from.lat;
		const double length = std::sqrt(dx * dx + dy * dy);
		if (length == 0.0) {
			result.push_back(line[i]);
			continue;
		}
		result.push_back(LonLat {
			line[i].lon + (-dy / length) * offset_m / settings.meters_per_degree_lon,
			line[i].lat + (dx / length) * offset_m / settings.meters_per_degree_lat,
		});
	}
	return result;
}

[[nodiscard]] auto lane_offsets(const int lane_count, const double lane_width) -> std::vector<double> {
	auto offsets = std::vector<double> {};
	if (lane_count <= 0) {
		return offsets;
	}
	offsets.reserve(static_cast<std::size_t>(lane_count));
	const double center = (lane_count - 1) / 2.0;
	for (int lane = 0; lane < lane_count; ++lane) {
		offsets.push_back((lane - center) * lane_width);
	}
	return offsets;
}

SegmentGeometryBuilder::SegmentGeometryBuilder(const RoadNetwork&			network,
											   const CongestionClassifier& classifier,
											   GeometrySettings			settings)
: network_(network), classifier_(classifier), settings_(settings) { }

auto SegmentGeometryBuilder::build_roads(const std::vector<SegmentMetrics>& metrics) const
	-> std::vector<LogicalRoad> {
	auto groups = std::map<RoadGroupKey, std::vector<GroupMember>> {};
	for (const auto& row : metrics) {
		if (is_internal_segment(row.edge_id)) {
			continue;
		}
		const auto* const segment = this->network_.find(row.edge_id);
		if (segment == nullptr || segment->is_internal) {
			continue;
		}
		auto key = RoadGroupKey {
			.base_id = std::string(base_id(segment->id)),
			.lane_count = segment->lane_count,
			.reverse = is_reverse_segment(segment->id),
		};
		groups[std::move(key)].push_back(GroupMember {
			.segment = segment,
			.metrics = &row,
			.split = split_index(segment->id),
		});
	}

	auto roads = std::vector<LogicalRoad> {};
	roads.reserve(groups.size());
	std::size_t degenerate = 0;
	for (auto& [key, members] : groups) {
		std::sort(members.begin(), members.end(), [](const GroupMember& a, const GroupMember& b) {
			if (a.split != b.split) {
				return a.split < b.split;
			}
			return a.segment->id < b.segment->id;
		});

		auto road = LogicalRoad {};
		road.key = key;
		for (const auto& member : members) {
			auto geographic = std::vector<LonLat> {};
			geographic.reserve(member.segment->shape.size());
			for (const auto& p : member.segment->shape) {
				geographic.push_back(this->network_.to_lon_lat(p));
			}
			append_polyline(road.polyline, geographic, this->settings_.merge_tolerance_deg);
			road.segment_ids.push_back(member.segment->id);
			road.is_roundabout = road.is_roundabout || member.segment->is_roundabout;
		}
		if (road.polyline.size() < 2) {
			++degenerate;
			continue;
		}

		road.speed_ratio =
			weighted_mean(members, [](const GroupMember& m) { return m.metrics->speed_ratio; });
		road.flow = weighted_mean(members, [](const GroupMember& m) { return m.metrics->peak_flow; });
		roads.push_back(std::move(road));
	}

	if (degenerate > 0) {
		spdlog::debug("Dropped {} roads whose merged shape has fewer than 2 points", degenerate);
	}
	return roads;
}

auto SegmentGeometryBuilder::render(const LogicalRoad& road) const -> std::vector<CongestionFeature> {
	const auto band = this->classifier_.classify(road.speed_ratio);
	const auto feature_for = [&](std::vector<LonLat> coordinates) {
		return CongestionFeature {
			.coordinates = std::move(coordinates),
			.speed_ratio = round_to(road.speed_ratio, 3),
			.peak_flow = static_cast<std::int64_t>(road.flow),
			.color = band.color,
			.lane_count = std::max(road.key.lane_count, 1),
			.is_roundabout = road.is_roundabout,
		};
	};

	auto features = std::vector<CongestionFeature> {};
	if (road.key.lane_count <= 1) {
		features.push_back(feature_for(road.polyline));
		return features;
	}

	for (const auto offset : lane_offsets(road.key.lane_count, this->settings_.lane_width)) {
		features.push_back(feature_for(offset_polyline(road.polyline, offset, this->settings_)));
	}
	return features;
}

auto SegmentGeometryBuilder::build(const std::vector<SegmentMetrics>& metrics) const
	-> std::vector<CongestionFeature> {
	auto features = std::vector<CongestionFeature> {};
	for (const auto& road : this->build_roads(metrics)) {
		auto lanes = this->render(road);
		features.insert(features.end(), std::make_move_iterator(lanes.begin()),
						std::make_move_iterator(lanes.end()));
	}
	return features;
}

} // namespace fcd_digest
