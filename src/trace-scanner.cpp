#include "trace-scanner.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <indicators/block_progress_bar.hpp>
#include <indicators/cursor_control.hpp>
#include <spdlog/spdlog.h>

#include "edge-aggregator.hpp"
#include "field-decoder.hpp"
#include "ringbuf.hpp"
#include "timer.hpp"
#include "trajectory-accumulator.hpp"

namespace fcd_digest {

namespace {

constexpr std::size_t stream_buffer_size = 1 << 23;
constexpr double	  seconds_per_report_bucket = 1800.0;

struct ThroughputSample {
	double		  elapsed_s = 0.0;
	std::uint64_t bytes = 0;
};

// Side-effect only: nothing here feeds back into the scan.
class ProgressReporter {
  public:
	ProgressReporter(const bool show_bar, const std::uint64_t total_bytes)
	: total_bytes_(total_bytes) {
		if (show_bar && total_bytes > 0) {
			this->bar_.emplace(indicators::option::BarWidth {60}, indicators::option::Start {"|"},
							   indicators::option::End {"|"},
							   indicators::option::ShowElapsedTime {true},
							   indicators::option::ForegroundColor {indicators::Color::blue});
			indicators::show_console_cursor(false);
		}
	}

	ProgressReporter(const ProgressReporter&) = delete;
	auto operator=(const ProgressReporter&) -> ProgressReporter& = delete;

	~ProgressReporter() {
		if (this->bar_.has_value()) {
			indicators::show_console_cursor(true);
		}
	}

	auto on_timestep(const double time, const ScanStats& stats, const ScanSinks& sinks) -> void {
		const auto vehicles = sinks.trajectories != nullptr ? sinks.trajectories->vehicle_count() : 0;
		const auto segments = sinks.edges != nullptr ? sinks.edges->size() : 0;

		const auto bucket = static_cast<std::int64_t>(std::floor(time / seconds_per_report_bucket));
		if (bucket > this->last_bucket_) {
			this->last_bucket_ = bucket;
			const auto message = fmt::format(
				"{:.1f}h sim | {:.1f}% file | {} vehicles | {} edges | {} elapsed", time / 3600.0,
				this->percent_of(stats.bytes_read), vehicles, segments,
				humantime(this->timer_.elapsed_us()));
			if (this->bar_.has_value()) {
				spdlog::debug(message);
			} else {
				spdlog::info(message);
			}
		}

		if (! this->bar_.has_value()) {
			return;
		}
		const auto percent = static_cast<int>(this->percent_of(stats.bytes_read));
		if (percent <= this->last_percent_) {
			return;
		}
		this->last_percent_ = percent;
		this->recent_.push_back(ThroughputSample {this->timer_.elapsed_s(), stats.bytes_read});
		this->bar_->set_option(indicators::option::PostfixText {
			fmt::format("{} | {} vehicles | {} edges | {:.1f} MB/s", sim_clock(time), vehicles,
						segments, this->throughput_mb_s())});
		this->bar_->set_progress(static_cast<float>(percent));
	}

	auto finish() -> void {
		if (this->bar_.has_value()) {
			this->bar_->set_progress(100.0f);
			this->bar_->mark_as_completed();
		}
	}

  private:
	std::uint64_t								  total_bytes_ = 0;
	std::optional<indicators::BlockProgressBar> bar_;
	Timer										  timer_;
	RingBuffer<ThroughputSample, 16>			  recent_;
	int											  last_percent_ = -1;
	std::int64_t								  last_bucket_ = -1;

	[[nodiscard]] auto percent_of(const std::uint64_t bytes) const -> double {
		if (this->total_bytes_ == 0) {
			return 0.0;
		}
		return std::min(100.0, static_cast<double>(bytes) / this->total_bytes_ * 100.0);
	}

	// Rate over the last few progress steps rather than since the start
	[[nodiscard]] auto throughput_mb_s() const -> double {
		const auto first = this->recent_.front();
		const auto last = this->recent_.back();
		if (! first || ! last || last->elapsed_s <= first->elapsed_s) {
			return 0.0;
		}
		return static_cast<double>(last->bytes - first->bytes) / 1e6 /
			   (last->elapsed_s - first->elapsed_s);
	}
};

// Returns false when a consumer had to drop the sample because an attribute
// it needs is missing or malformed.
auto fold_sample(std::string_view line, const double time, const WindowMembership membership,
				 const ScanSinks& sinks) -> bool {
	const auto speed = decode_double(line, "speed");
	if (! speed || *speed < 0.0) {
		return false;
	}

	bool complete = true;
	if (membership.aggregation) {
		if (const auto lane = decode_string(line, "lane")) {
			sinks.edges->add(*lane, *speed);
		} else {
			complete = false;
		}
	}

	if (membership.trajectory) {
		const auto id = decode_string(line, "id");
		const auto x = decode_double(line, "x");
		const auto y = decode_double(line, "y");
		if (id && x && y) {
			const auto second = static_cast<int>(std::floor(time));
			sinks.trajectories->add(*id, second, *x, *y, *speed);
		} else {
			complete = false;
		}
	}
	return complete;
}

} // namespace

[[nodiscard]] auto pformat(const ScanStats& stats) -> std::string {
	return fmt::format("(ScanStats) {{ .lines = {}, .boundary_lines = {}, .sample_lines = {}, "
					   ".skipped_lines = {}, .bytes_read = {}, .last_time = {}, "
					   ".stopped_early = {} }}",
					   stats.lines, stats.boundary_lines, stats.sample_lines, stats.skipped_lines,
					   stats.bytes_read, stats.last_time, stats.stopped_early);
}

[[nodiscard]] auto pformat(const scan_error err) -> std::string {
	switch (err) {
		case scan_error::file_not_found:
			return "trace file not found";
		case scan_error::cannot_open:
			return "trace file cannot be opened";
		case scan_error::read_failed:
			return "I/O error while reading the trace file";
	}
	return "unknown scan error";
}

TraceScanner::TraceScanner(const WindowFilter& windows, const ScanOptions options)
: windows_(windows), options_(options) { }

auto TraceScanner::scan_file(const std::filesystem::path& fcd_file, const ScanSinks sinks) const
	-> tl::expected<ScanStats, scan_error> {
	if (! std::filesystem::exists(fcd_file)) {
		return tl::make_unexpected(scan_error::file_not_found);
	}

	std::error_code ec;
	const auto		total_bytes = std::filesystem::file_size(fcd_file, ec);

	auto		  buffer = std::vector<char>(stream_buffer_size);
	std::ifstream file;
	file.rdbuf()->pubsetbuf(buffer.data(), static_cast<std::streamsize>(buffer.size()));
	file.open(fcd_file, std::ios::in | std::ios::binary);
	if (! file.is_open()) {
		return tl::make_unexpected(scan_error::cannot_open);
	}

	const auto stats = this->scan(file, ec ? 0 : total_bytes, sinks);
	if (file.bad()) {
		return tl::make_unexpected(scan_error::read_failed);
	}
	return stats;
}

auto TraceScanner::scan(std::istream& in, const std::uint64_t total_bytes, const ScanSinks sinks) const
	-> ScanStats {
	auto stats = ScanStats {};
	auto progress = ProgressReporter(this->options_.show_progress, total_bytes);

	auto   membership = WindowMembership {};
	double current_time = -1.0;
	bool   warned_time_regression = false;

	const auto mask = [&](WindowMembership m) {
		m.trajectory = m.trajectory && sinks.trajectories != nullptr;
		m.aggregation = m.aggregation && sinks.edges != nullptr;
		return m;
	};

	std::string line;
	while (std::getline(in, line)) {
		++stats.lines;
		stats.bytes_read += line.size() + 1;
		const auto view = std::string_view(line);

		if (is_boundary_line(view)) {
			++stats.boundary_lines;
			const auto time = decode_double(view, "time");
			if (! time) {
				// The second is unknown, so none of its samples can be placed
				++stats.skipped_lines;
				membership = WindowMembership {};
				spdlog::debug("line {}: timestep {}, samples dropped until the next timestep",
							  stats.lines, pformat(time.error()));
				continue;
			}

			if (*time < current_time && ! warned_time_regression) {
				spdlog::warn("line {}: time goes back from {} to {}, the trace is not ordered",
							 stats.lines, current_time, *time);
				warned_time_regression = true;
			}
			current_time = *time;
			stats.last_time = current_time;

			if (this->options_.early_stop && this->windows_.past_horizon(current_time)) {
				stats.stopped_early = true;
				break;
			}

			membership = mask(this->windows_.evaluate(current_time));
			progress.on_timestep(current_time, stats, sinks);
		} else if (membership.any() && is_sample_line(view)) {
			if (fold_sample(view, current_time, membership, sinks)) {
				++stats.sample_lines;
			} else {
				++stats.skipped_lines;
			}
		}
	}

	progress.finish();
	return stats;
}

} // namespace fcd_digest
