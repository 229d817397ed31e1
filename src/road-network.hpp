#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>
#include <tl/expected.hpp>

#include "projection.hpp"

namespace pugi {
class xml_document;
}

namespace fcd_digest {

// One directed edge of a SUMO network.
struct RoadSegment {
	std::string		   id;
	int				   lane_count = 0;
	double			   speed_ms = 0.0; // speed limit of lane 0
	double			   length_m = 0.0; // length of lane 0
	std::vector<Point> shape;
	bool			   is_roundabout = false;
	bool			   is_internal = false;
};

[[nodiscard]]
auto pformat(const RoadSegment& segment) -> std::string;

enum class load_network_error {
	file_not_found,
	xml_parse_error,
	missing_net_element,
	invalid_location,
};

[[nodiscard]]
auto pformat(load_network_error err) -> std::string;

// Parses "x1,y1 x2,y2 ..." (an optional z component is ignored).
// Returns an empty vector when any point is malformed.
[[nodiscard]]
auto parse_shape(std::string_view text) -> std::vector<Point>;

// Read-only view of a `.net.xml` file, shared by the geometry builder and the
// validator once loaded.
class RoadNetwork {
  public:
	using load_result = tl::expected<RoadNetwork, load_network_error>;

	[[nodiscard]] static auto load(const std::filesystem::path& net_file) -> load_result;
	[[nodiscard]] static auto load_string(std::string_view xml) -> load_result;
	[[nodiscard]] static auto from_document(const pugi::xml_document& doc) -> load_result;

	[[nodiscard]] auto find(std::string_view id) const -> const RoadSegment*;
	[[nodiscard]] auto segments() const -> const std::vector<RoadSegment>& {
		return this->segments_;
	}
	[[nodiscard]] auto projection() const -> const Projection& { return this->projection_; }
	[[nodiscard]] auto to_lon_lat(const Point& p) const -> LonLat {
		return this->projection_.to_lon_lat(p);
	}
	[[nodiscard]] auto size() const -> std::size_t { return this->segments_.size(); }
	[[nodiscard]] auto roundabout_count() const -> std::size_t { return this->roundabout_count_; }

  private:
	std::vector<RoadSegment>						  segments_;
	phmap::flat_hash_map<std::string, std::size_t> index_;
	Projection										  projection_ = Projection::identity();
	std::size_t										  roundabout_count_ = 0;
};

} // namespace fcd_digest
