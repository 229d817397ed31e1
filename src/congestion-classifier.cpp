#include "congestion-classifier.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <fmt/core.h>

namespace fcd_digest {

namespace {

const auto default_labels =
	std::array<const char*, 6> {"severe", "heavy", "congested", "moderate", "light", "free"};

} // namespace

CongestionClassifier::CongestionClassifier()
: CongestionClassifier({0.25, 0.45, 0.60, 0.75, 0.90},
					   {
						   Rgb {204, 0, 0},
						   Rgb {255, 68, 0},
						   Rgb {255, 136, 0},
						   Rgb {255, 187, 0},
						   Rgb {136, 204, 0},
						   Rgb {0, 170, 68},
					   }) { }

CongestionClassifier::CongestionClassifier(std::vector<double> thresholds, std::vector<Rgb> colors)
: thresholds_(std::move(thresholds)), colors_(std::move(colors)) {
	this->labels_.reserve(this->colors_.size());
	for (std::size_t i = 0; i < this->colors_.size(); ++i) {
		this->labels_.push_back(this->colors_.size() == default_labels.size()
									? std::string(default_labels[i])
									: fmt::format("band-{}", i));
	}
}

auto CongestionClassifier::create(std::vector<double> thresholds, std::vector<Rgb> colors)
	-> tl::expected<CongestionClassifier, std::string> {
	if (colors.size() != thresholds.size() + 1) {
		return tl::make_unexpected(
			fmt::format("expected {} colors for {} thresholds, got {}", thresholds.size() + 1,
						thresholds.size(), colors.size()));
	}
	const auto not_ascending = std::adjacent_find(thresholds.begin(), thresholds.end(),
												  [](const double a, const double b) { return a >= b; });
	if (not_ascending != thresholds.end()) {
		return tl::make_unexpected(
			fmt::format("thresholds must be strictly ascending, {} is followed by {}",
						*not_ascending, *std::next(not_ascending)));
	}
	return CongestionClassifier(std::move(thresholds), std::move(colors));
}

auto CongestionClassifier::classify(const double speed_ratio) const -> CongestionBand {
	// first threshold strictly greater than the ratio
	const auto it = std::upper_bound(this->thresholds_.begin(), this->thresholds_.end(), speed_ratio);
	const auto index = static_cast<std::size_t>(std::distance(this->thresholds_.begin(), it));
	return CongestionBand {
		.index = index,
		.label = this->labels_[index],
		.color = this->colors_[index],
	};
}

} // namespace fcd_digest
