#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <tl/expected.hpp>

namespace fcd_digest {

struct Rgb {
	std::uint8_t r = 0;
	std::uint8_t g = 0;
	std::uint8_t b = 0;

	auto operator==(const Rgb&) const -> bool = default;
};

struct CongestionBand {
	std::size_t index = 0; // 0 is the most severe band
	std::string label;
	Rgb			color;
};

// Maps a speed ratio to an ordered severity band. Band i covers
// [thresholds[i-1], thresholds[i]), so a ratio exactly on a threshold falls
// into the less severe band above it.
class CongestionClassifier {
  public:
	// thresholds {0.25, 0.45, 0.60, 0.75, 0.90}, red to green
	CongestionClassifier();

	// Needs strictly ascending thresholds and exactly one more color than
	// thresholds.
	[[nodiscard]] static auto create(std::vector<double> thresholds, std::vector<Rgb> colors)
		-> tl::expected<CongestionClassifier, std::string>;

	[[nodiscard]] auto classify(double speed_ratio) const -> CongestionBand;

	[[nodiscard]] auto band_count() const -> std::size_t { return this->colors_.size(); }
	[[nodiscard]] auto thresholds() const -> const std::vector<double>& { return this->thresholds_; }
	[[nodiscard]] auto colors() const -> const std::vector<Rgb>& { return this->colors_; }

  private:
	std::vector<double>		 thresholds_;
	std::vector<Rgb>		 colors_;
	std::vector<std::string> labels_;

	CongestionClassifier(std::vector<double> thresholds, std::vector<Rgb> colors);
};

} // namespace fcd_digest
