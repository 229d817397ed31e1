#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

#include "projection.hpp"

namespace fcd_digest {

struct Waypoint {
	int	   second = 0;
	double lon = 0.0;
	double lat = 0.0;
	double speed_kmh = 0.0;
};

struct Trajectory {
	std::string			  vehicle_id;
	std::vector<Waypoint> waypoints;
};

struct TrajectoryLimits {
	std::size_t min_waypoints = 5;
	std::size_t max_vehicles = 8000;
	int			coordinate_decimals = 6;
};

[[nodiscard]]
auto pformat(const TrajectoryLimits& limits) -> std::string;

// Per-vehicle waypoint lists for the trajectory window. Owned by the scan loop
// and only read through `finalize()` once the pass is over.
class TrajectoryAccumulator {
  public:
	// Without a projection the sample x/y are taken as lon/lat already
	// (fcd written with --fcd-output.geo).
	explicit TrajectoryAccumulator(TrajectoryLimits limits,
								   std::optional<Projection> projection = std::nullopt);

	// Returns false when the waypoint is dropped because its second does not
	// come strictly after the last one recorded for the vehicle.
	auto add(std::string_view vehicle_id, int second, double x, double y, double speed_ms) -> bool;

	// Folds in the vehicles of another accumulator. The vehicle sets must be
	// disjoint, as they are for a scan sharded by vehicle id.
	auto merge(TrajectoryAccumulator&& other) -> void;

	// Drops trajectories shorter than `min_waypoints`, then keeps the
	// `max_vehicles` longest ones (ties broken by ascending vehicle id).
	// Retained trajectories come back in first-seen order.
	[[nodiscard]] auto finalize() && -> std::vector<Trajectory>;

	[[nodiscard]] auto vehicle_count() const -> std::size_t { return this->trajectories_.size(); }
	[[nodiscard]] auto waypoint_count() const -> std::size_t { return this->waypoint_count_; }
	[[nodiscard]] auto limits() const -> const TrajectoryLimits& { return this->limits_; }

  private:
	TrajectoryLimits							   limits_;
	std::optional<Projection>					   projection_;
	std::vector<Trajectory>						   trajectories_;
	phmap::flat_hash_map<std::string, std::size_t> slot_of_;
	std::string									   key_buffer_;
	std::size_t									   waypoint_count_ = 0;
};

} // namespace fcd_digest
