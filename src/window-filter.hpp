#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fcd_digest {

// A named interval of simulated time, in seconds.
// `buffer` widens the interval symmetrically, `stride` subsamples it.
struct TimeWindow {
	std::string name;
	double		start = 0.0;
	double		end = 0.0;
	double		buffer = 0.0;
	int			stride = 1;

	[[nodiscard]] auto contains(const double t) const -> bool {
		return start - buffer <= t && t <= end + buffer;
	}

	[[nodiscard]] auto horizon() const -> double { return end + buffer; }
};

[[nodiscard]]
auto pformat(const TimeWindow& window) -> std::string;

struct WindowMembership {
	bool trajectory = false;
	bool aggregation = false;

	[[nodiscard]] auto any() const -> bool { return trajectory || aggregation; }
};

// Decides which consumers a timestep belongs to. Evaluated once per boundary
// line, never per sample.
class WindowFilter {
  public:
	WindowFilter(std::optional<TimeWindow> trajectory_window, std::vector<TimeWindow> peak_windows);

	[[nodiscard]] auto evaluate(double t) const -> WindowMembership;

	// Inclusive range widened by the window buffer. The stride is not applied,
	// trajectories are sampled every second.
	[[nodiscard]] auto in_trajectory_window(double t) const -> bool;

	// Inside any peak window AND on that window's stride.
	[[nodiscard]] auto in_aggregation_window(double t) const -> bool;

	// Latest end + buffer over all windows. Past this point no window can match
	// again because time in a trace never decreases.
	[[nodiscard]] auto horizon() const -> std::optional<double>;
	[[nodiscard]] auto past_horizon(double t) const -> bool;

	[[nodiscard]] auto trajectory_window() const -> const std::optional<TimeWindow>& {
		return this->trajectory_window_;
	}
	[[nodiscard]] auto peak_windows() const -> const std::vector<TimeWindow>& {
		return this->peak_windows_;
	}

  private:
	std::optional<TimeWindow> trajectory_window_;
	std::vector<TimeWindow>	  peak_windows_;
	std::optional<double>	  horizon_;
};

} // namespace fcd_digest
