#include "window-filter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>

#include <fmt/core.h>

namespace fcd_digest {

[[nodiscard]] auto pformat(const TimeWindow& window) -> std::string {
	return fmt::format("(TimeWindow) {{ .name = \"{}\", .start = {}, .end = {}, .buffer = {}, "
					   ".stride = {} }}",
					   window.name, window.start, window.end, window.buffer, window.stride);
}

WindowFilter::WindowFilter(std::optional<TimeWindow> trajectory_window,
						   std::vector<TimeWindow>	 peak_windows)
: trajectory_window_(std::move(trajectory_window)), peak_windows_(std::move(peak_windows)) {
	if (this->trajectory_window_.has_value()) {
		this->horizon_ = this->trajectory_window_->horizon();
	}
	for (const auto& window : this->peak_windows_) {
		this->horizon_ = this->horizon_.has_value() ? std::max(*this->horizon_, window.horizon())
													: window.horizon();
	}
}

auto WindowFilter::evaluate(const double t) const -> WindowMembership {
	return WindowMembership {
		.trajectory = this->in_trajectory_window(t),
		.aggregation = this->in_aggregation_window(t),
	};
}

auto WindowFilter::in_trajectory_window(const double t) const -> bool {
	return this->trajectory_window_.has_value() && this->trajectory_window_->contains(t);
}

auto WindowFilter::in_aggregation_window(const double t) const -> bool {
	const auto second = static_cast<std::int64_t>(std::floor(t));
	return std::any_of(this->peak_windows_.begin(), this->peak_windows_.end(),
					   [&](const TimeWindow& window) {
						   const auto stride = std::max(window.stride, 1);
						   return window.contains(t) && second % stride == 0;
					   });
}

auto WindowFilter::horizon() const -> std::optional<double> {
	return this->horizon_;
}

auto WindowFilter::past_horizon(const double t) const -> bool {
	// Without any window nothing is ever collected, stop right away
	return ! this->horizon_.has_value() || t > *this->horizon_;
}

} // namespace fcd_digest
