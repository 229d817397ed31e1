#include "edge-aggregator.hpp"

#include "rounding.hpp"

namespace fcd_digest {

[[nodiscard]] auto segment_of_lane(std::string_view lane_id) -> std::string_view {
	const auto underscore = lane_id.rfind('_');
	if (underscore == std::string_view::npos) {
		return lane_id;
	}
	return lane_id.substr(0, underscore);
}

auto EdgeAggregator::add(std::string_view lane_id, const double speed_ms) -> void {
	this->key_buffer_.assign(segment_of_lane(lane_id));
	auto& aggregate = this->table_[this->key_buffer_];
	aggregate.speed_sum_kmh += speed_ms * kmh_per_ms;
	++aggregate.sample_count;
	++this->total_samples_;
}

auto EdgeAggregator::merge(const EdgeAggregator& other) -> void {
	for (const auto& [segment_id, aggregate] : other.table_) {
		auto& mine = this->table_[segment_id];
		mine.speed_sum_kmh += aggregate.speed_sum_kmh;
		mine.sample_count += aggregate.sample_count;
	}
	this->total_samples_ += other.total_samples_;
}

auto EdgeAggregator::find(std::string_view segment_id) const -> std::optional<SegmentAggregate> {
	const auto it = this->table_.find(std::string(segment_id));
	if (it == this->table_.end()) {
		return std::nullopt;
	}
	return it->second;
}

} // namespace fcd_digest
