#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "congestion-classifier.hpp"
#include "projection.hpp"

namespace fcd_digest {

class RoadNetwork;
struct SegmentMetrics;

struct GeometrySettings {
	double lane_width = 3.2;
	double meters_per_degree_lon = 75000.0;
	double meters_per_degree_lat = 111000.0;
	// Two vertices closer than this on both axes are the same point
	double merge_tolerance_deg = 5e-5;
};

[[nodiscard]]
auto pformat(const GeometrySettings& settings) -> std::string;

// Segment id conventions of netconvert output:
//   ":J12_0"   internal (junction) edge
//   "-1234#2"  reverse direction of way 1234, third piece after splitting

[[nodiscard]] inline auto is_internal_segment(std::string_view id) -> bool {
	return ! id.empty() && id.front() == ':';
}

[[nodiscard]] inline auto is_reverse_segment(std::string_view id) -> bool {
	return ! id.empty() && id.front() == '-';
}

// Leading run of digits after an optional '-'. An id without a numeric prefix
// is its own base.
[[nodiscard]]
auto base_id(std::string_view id) -> std::string_view;

// Number after a trailing "#", 0 when there is none.
[[nodiscard]]
auto split_index(std::string_view id) -> int;

struct RoadGroupKey {
	std::string base_id;
	int			lane_count = 0;
	bool		reverse = false;

	auto operator<=>(const RoadGroupKey&) const = default;
};

// Appends `next` to `merged`, dropping the first point of `next` when it
// coincides with the last point of `merged` within `tolerance_deg`.
auto append_polyline(std::vector<LonLat>& merged, const std::vector<LonLat>& next,
					 double tolerance_deg) -> void;

// Parallel copy of a polyline shifted `offset_m` meters to the left of the
// direction of travel (negative: to the right).
[[nodiscard]]
auto offset_polyline(const std::vector<LonLat>& line, double offset_m,
					 const GeometrySettings& settings) -> std::vector<LonLat>;

// (i - (n-1)/2) * lane_width for i in [0, n)
[[nodiscard]]
auto lane_offsets(int lane_count, double lane_width) -> std::vector<double>;

// Several network segments stitched back into one physical road.
struct LogicalRoad {
	RoadGroupKey			 key;
	std::vector<std::string> segment_ids; // traversal order
	std::vector<LonLat>		 polyline;
	double					 speed_ratio = 0.0; // length-weighted
	double					 flow = 0.0;		// length-weighted
	bool					 is_roundabout = false;
};

struct CongestionFeature {
	std::vector<LonLat> coordinates;
	double				speed_ratio = 0.0;
	std::int64_t		peak_flow = 0;
	Rgb					color;
	int					lane_count = 1;
	bool				is_roundabout = false;
};

class SegmentGeometryBuilder {
  public:
	SegmentGeometryBuilder(const RoadNetwork& network, const CongestionClassifier& classifier,
						   GeometrySettings settings);

	// Groups the aggregated, non-internal segments by (base id, lane count,
	// direction) and merges each group. Groups whose merged polyline has fewer
	// than two points are dropped. Sorted by group key.
	[[nodiscard]] auto build_roads(const std::vector<SegmentMetrics>& metrics) const
		-> std::vector<LogicalRoad>;

	// One feature per lane; a single-lane road is emitted unoffset.
	[[nodiscard]] auto render(const LogicalRoad& road) const -> std::vector<CongestionFeature>;

	[[nodiscard]] auto build(const std::vector<SegmentMetrics>& metrics) const
		-> std::vector<CongestionFeature>;

  private:
	const RoadNetwork&			network_;
	const CongestionClassifier& classifier_;
	GeometrySettings			settings_;
};

} // namespace fcd_digest
