#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <parallel_hashmap/phmap.h>

namespace fcd_digest {

struct SegmentAggregate {
	double		  speed_sum_kmh = 0.0;
	std::uint64_t sample_count = 0;

	[[nodiscard]] auto mean_speed_kmh() const -> double {
		return this->sample_count == 0 ? 0.0
									   : this->speed_sum_kmh / static_cast<double>(this->sample_count);
	}
};

// Segment id owning a lane: "<segment-id>_<lane-index>" split at the last '_'.
// A lane id without '_' is returned unchanged.
[[nodiscard]]
auto segment_of_lane(std::string_view lane_id) -> std::string_view;

// Running speed sum/count per segment over the sampled aggregation timesteps.
// Memory is bounded by the number of distinct segments, not by the sample
// count; segments without samples never get an entry.
class EdgeAggregator {
  public:
	using table_type = phmap::flat_hash_map<std::string, SegmentAggregate>;

	auto add(std::string_view lane_id, double speed_ms) -> void;

	// Folds another partition in. Both sides own disjoint samples, so sums and
	// counts simply add up.
	auto merge(const EdgeAggregator& other) -> void;

	[[nodiscard]] auto find(std::string_view segment_id) const -> std::optional<SegmentAggregate>;
	[[nodiscard]] auto table() const -> const table_type& { return this->table_; }
	[[nodiscard]] auto size() const -> std::size_t { return this->table_.size(); }
	[[nodiscard]] auto empty() const -> bool { return this->table_.empty(); }
	[[nodiscard]] auto total_samples() const -> std::uint64_t { return this->total_samples_; }

  private:
	table_type	  table_;
	std::string	  key_buffer_;
	std::uint64_t total_samples_ = 0;
};

} // namespace fcd_digest
