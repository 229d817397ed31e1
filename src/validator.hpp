#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "projection.hpp"

namespace fcd_digest {

class RoadNetwork;
struct SegmentMetrics;

struct BoundingBox {
	double lon_min = 0.0;
	double lon_max = 0.0;
	double lat_min = 0.0;
	double lat_max = 0.0;

	[[nodiscard]] auto contains(const LonLat& p) const -> bool {
		return lon_min <= p.lon && p.lon <= lon_max && lat_min <= p.lat && p.lat <= lat_max;
	}
};

// A stretch of road with an externally measured travel speed.
struct ReferenceCorridor {
	std::string name;
	BoundingBox bbox;
	double		reference_speed_kmh = 0.0;
};

enum class Verdict {
	good,
	needs_tuning,
	under_congested,
	no_data,
};

[[nodiscard]]
auto to_string(Verdict verdict) -> std::string_view;

// < 1.5 good, < 2.5 needs tuning, otherwise the simulation is too fast.
[[nodiscard]]
auto verdict_for_ratio(double ratio) -> Verdict;

struct CorridorReport {
	std::string			  name;
	double				  reference_speed_kmh = 0.0;
	std::optional<double> simulated_speed_kmh;
	std::optional<double> ratio;
	Verdict				  verdict = Verdict::no_data;
	std::size_t			  segment_count = 0;
};

using ValidationReport = std::vector<CorridorReport>;

// Where a segment is and how fast traffic was on it.
struct SpeedProbe {
	LonLat position;
	double mean_speed_kmh = 0.0;
};

// First shape vertex of every aggregated segment the network knows.
[[nodiscard]]
auto collect_probes(const std::vector<SegmentMetrics>& metrics, const RoadNetwork& network)
	-> std::vector<SpeedProbe>;

// The six Chișinău corridors measured with Google Maps travel times.
[[nodiscard]]
auto default_corridors() -> std::vector<ReferenceCorridor>;

// Diagnostic only, nothing here feeds back into the other artifacts.
class Validator {
  public:
	explicit Validator(std::vector<ReferenceCorridor> corridors);

	[[nodiscard]] auto validate(std::span<const SpeedProbe> probes) const -> ValidationReport;
	[[nodiscard]] auto validate(const std::vector<SegmentMetrics>& metrics,
								const RoadNetwork&				   network) const -> ValidationReport;

	[[nodiscard]] auto corridors() const -> const std::vector<ReferenceCorridor>& {
		return this->corridors_;
	}

  private:
	std::vector<ReferenceCorridor> corridors_;
};

// Logs the report as a table.
auto log_report(const ValidationReport& report) -> void;

} // namespace fcd_digest
