#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "window-filter.hpp"

namespace fcd_digest {

class TrajectoryAccumulator;
class EdgeAggregator;

struct ScanStats {
	std::uint64_t lines = 0;
	std::uint64_t boundary_lines = 0;
	std::uint64_t sample_lines = 0; // in-window samples that were decoded
	std::uint64_t skipped_lines = 0;
	std::uint64_t bytes_read = 0;
	double		  last_time = -1.0;
	bool		  stopped_early = false;
};

[[nodiscard]]
auto pformat(const ScanStats& stats) -> std::string;

struct ScanOptions {
	bool early_stop = true;
	bool show_progress = false;
};

// Where in-window samples go. A null sink disables that consumer.
struct ScanSinks {
	TrajectoryAccumulator* trajectories = nullptr;
	EdgeAggregator*		   edges = nullptr;
};

enum class scan_error {
	file_not_found,
	cannot_open,
	read_failed,
};

[[nodiscard]]
auto pformat(scan_error err) -> std::string;

[[nodiscard]] inline auto is_boundary_line(std::string_view line) -> bool {
	return line.find("<timestep") != std::string_view::npos;
}

[[nodiscard]] inline auto is_sample_line(std::string_view line) -> bool {
	return line.find("<vehicle") != std::string_view::npos;
}

// Single pass over an FCD trace. Lines are classified by substring before any
// attribute is decoded, samples outside every window are never decoded, and
// the pass ends at the first timestep past the window horizon.
class TraceScanner {
  public:
	TraceScanner(const WindowFilter& windows, ScanOptions options);

	[[nodiscard]] auto scan_file(const std::filesystem::path& fcd_file, ScanSinks sinks) const
		-> tl::expected<ScanStats, scan_error>;

	// `total_bytes` is only used for progress reporting, 0 if unknown.
	[[nodiscard]] auto scan(std::istream& in, std::uint64_t total_bytes, ScanSinks sinks) const
		-> ScanStats;

  private:
	const WindowFilter& windows_;
	ScanOptions			options_;
};

} // namespace fcd_digest
