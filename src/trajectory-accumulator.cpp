#include "trajectory-accumulator.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "rounding.hpp"

namespace fcd_digest {

[[nodiscard]] auto pformat(const TrajectoryLimits& limits) -> std::string {
	return fmt::format("(TrajectoryLimits) {{ .min_waypoints = {}, .max_vehicles = {}, "
					   ".coordinate_decimals = {} }}",
					   limits.min_waypoints, limits.max_vehicles, limits.coordinate_decimals);
}

TrajectoryAccumulator::TrajectoryAccumulator(TrajectoryLimits limits,
											 std::optional<Projection> projection)
: limits_(limits), projection_(std::move(projection)) { }

auto TrajectoryAccumulator::add(std::string_view vehicle_id, const int second, const double x,
								const double y, const double speed_ms) -> bool {
	this->key_buffer_.assign(vehicle_id);
	auto it = this->slot_of_.find(this->key_buffer_);
	if (it == this->slot_of_.end()) {
		it = this->slot_of_.emplace(this->key_buffer_, this->trajectories_.size()).first;
		this->trajectories_.push_back(Trajectory {.vehicle_id = this->key_buffer_, .waypoints = {}});
	}

	auto& waypoints = this->trajectories_[it->second].waypoints;
	if (! waypoints.empty() && second <= waypoints.back().second) {
		return false;
	}

	const auto position =
		this->projection_.has_value() ? this->projection_->to_lon_lat(x, y) : LonLat {x, y};
	const auto decimals = this->limits_.coordinate_decimals;
	waypoints.push_back(Waypoint {
		.second = second,
		.lon = round_to(position.lon, decimals),
		.lat = round_to(position.lat, decimals),
		.speed_kmh = round_to(speed_ms * kmh_per_ms, 1),
	});
	++this->waypoint_count_;
	return true;
}

auto TrajectoryAccumulator::merge(TrajectoryAccumulator&& other) -> void {
	for (auto& trajectory : other.trajectories_) {
		const auto [it, inserted] =
			this->slot_of_.emplace(trajectory.vehicle_id, this->trajectories_.size());
		if (! inserted) {
			spdlog::warn("Vehicle {} appears in two partitions, keeping the first",
						 trajectory.vehicle_id);
			continue;
		}
		this->waypoint_count_ += trajectory.waypoints.size();
		this->trajectories_.push_back(std::move(trajectory));
	}
	other.trajectories_.clear();
	other.slot_of_.clear();
	other.waypoint_count_ = 0;
}

auto TrajectoryAccumulator::finalize() && -> std::vector<Trajectory> {
	auto retained = std::vector<std::size_t> {};
	retained.reserve(this->trajectories_.size());
	for (std::size_t slot = 0; slot < this->trajectories_.size(); ++slot) {
		if (this->trajectories_[slot].waypoints.size() >= this->limits_.min_waypoints) {
			retained.push_back(slot);
		}
	}
	spdlog::info("Vehicles with {}+ waypoints: {} of {}", this->limits_.min_waypoints,
				 retained.size(), this->trajectories_.size());

	if (retained.size() > this->limits_.max_vehicles) {
		const auto longest_first = [&](const std::size_t a, const std::size_t b) {
			const auto& ta = this->trajectories_[a];
			const auto& tb = this->trajectories_[b];
			if (ta.waypoints.size() != tb.waypoints.size()) {
				return ta.waypoints.size() > tb.waypoints.size();
			}
			return ta.vehicle_id < tb.vehicle_id;
		};
		const auto cut = retained.begin() + static_cast<std::ptrdiff_t>(this->limits_.max_vehicles);
		std::nth_element(retained.begin(), cut, retained.end(), longest_first);
		retained.erase(cut, retained.end());
		// back to first-seen order
		std::sort(retained.begin(), retained.end());
		spdlog::info("Kept the {} most active vehicles", this->limits_.max_vehicles);
	}

	auto result = std::vector<Trajectory> {};
	result.reserve(retained.size());
	for (const auto slot : retained) {
		result.push_back(std::move(this->trajectories_[slot]));
	}
	this->trajectories_.clear();
	this->slot_of_.clear();
	this->waypoint_count_ = 0;
	return result;
}

} // namespace fcd_digest
