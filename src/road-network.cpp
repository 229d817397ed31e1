#include "road-network.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include <fmt/core.h>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>

#include "field-decoder.hpp"

namespace fcd_digest {

namespace {

struct LaneRecord {
	int				   index = 0;
	double			   speed_ms = 0.0;
	double			   length_m = 0.0;
	std::vector<Point> shape;
};

// Centerline of an edge, rebuilt from its lanes the way sumolib does: the
// middle lane for an odd lane count, otherwise the pointwise mean of all lanes
// truncated to the shortest lane shape.
auto centerline(const std::vector<LaneRecord>& lanes) -> std::vector<Point> {
	if (lanes.empty()) {
		return {};
	}
	const auto n = lanes.size();
	if (n % 2 == 1) {
		return lanes[n / 2].shape;
	}
	const auto shortest = std::min_element(
		lanes.begin(), lanes.end(), [](const LaneRecord& a, const LaneRecord& b) {
			return a.shape.size() < b.shape.size();
		});
	const auto points = shortest->shape.size();

	auto shape = std::vector<Point> {};
	shape.reserve(points);
	for (std::size_t i = 0; i < points; ++i) {
		auto mean = Point {0.0, 0.0};
		for (const auto& lane : lanes) {
			mean.x += lane.shape[i].x;
			mean.y += lane.shape[i].y;
		}
		mean.x /= static_cast<double>(n);
		mean.y /= static_cast<double>(n);
		shape.push_back(mean);
	}
	return shape;
}

auto parse_lane(const pugi::xml_node lane) -> LaneRecord {
	return LaneRecord {
		.index = lane.attribute("index").as_int(0),
		.speed_ms = lane.attribute("speed").as_double(0.0),
		.length_m = lane.attribute("length").as_double(0.0),
		.shape = parse_shape(lane.attribute("shape").as_string()),
	};
}

} // namespace

[[nodiscard]] auto pformat(const RoadSegment& segment) -> std::string {
	return fmt::format("(RoadSegment) {{ .id = \"{}\", .lane_count = {}, .speed_ms = {}, "
					   ".length_m = {}, .shape = [{} points], .is_roundabout = {}, "
					   ".is_internal = {} }}",
					   segment.id, segment.lane_count, segment.speed_ms, segment.length_m,
					   segment.shape.size(), segment.is_roundabout, segment.is_internal);
}

[[nodiscard]] auto pformat(const load_network_error err) -> std::string {
	switch (err) {
		case load_network_error::file_not_found:
			return "network file not found";
		case load_network_error::xml_parse_error:
			return "failed to parse network XML";
		case load_network_error::missing_net_element:
			return "network file has no <net> root element";
		case load_network_error::invalid_location:
			return "network <location> has an unusable netOffset or projParameter";
	}
	return "unknown network error";
}

[[nodiscard]] auto parse_shape(std::string_view text) -> std::vector<Point> {
	auto shape = std::vector<Point> {};
	while (! text.empty()) {
		const auto space = text.find(' ');
		const auto token = text.substr(0, space);
		text = space == std::string_view::npos ? std::string_view {} : text.substr(space + 1);
		if (token.empty()) {
			continue;
		}

		const auto first_comma = token.find(',');
		if (first_comma == std::string_view::npos) {
			return {};
		}
		const auto rest = token.substr(first_comma + 1);
		const auto second_comma = rest.find(',');
		const auto x = parse_double(token.substr(0, first_comma));
		const auto y = parse_double(rest.substr(0, second_comma));
		if (! x || ! y) {
			return {};
		}
		shape.push_back(Point {*x, *y});
	}
	return shape;
}

auto RoadNetwork::load(const std::filesystem::path& net_file) -> load_result {
	if (! std::filesystem::exists(net_file)) {
		return tl::make_unexpected(load_network_error::file_not_found);
	}
	pugi::xml_document			 doc;
	const pugi::xml_parse_result result = doc.load_file(net_file.c_str());
	if (! result) {
		spdlog::error("Failed to parse {}: {}", net_file.string(), result.description());
		return tl::make_unexpected(load_network_error::xml_parse_error);
	}
	return RoadNetwork::from_document(doc);
}

auto RoadNetwork::load_string(std::string_view xml) -> load_result {
	pugi::xml_document			 doc;
	const pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
	if (! result) {
		spdlog::error("Failed to parse network: {}", result.description());
		return tl::make_unexpected(load_network_error::xml_parse_error);
	}
	return RoadNetwork::from_document(doc);
}

auto RoadNetwork::from_document(const pugi::xml_document& doc) -> load_result {
	const auto net = doc.child("net");
	if (! net) {
		return tl::make_unexpected(load_network_error::missing_net_element);
	}

	auto network = RoadNetwork {};

	if (const auto location = net.child("location")) {
		const auto projection = Projection::from_sumo_location(
			location.attribute("netOffset").as_string(),
			location.attribute("projParameter").as_string());
		if (! projection) {
			spdlog::error("<location>: {}", pformat(projection.error()));
			return tl::make_unexpected(load_network_error::invalid_location);
		}
		network.projection_ = *projection;
	} else {
		spdlog::warn("Network has no <location> element, treating coordinates as lon/lat");
	}

	std::size_t skipped = 0;
	for (const auto edge : net.children("edge")) {
		auto segment = RoadSegment {};
		segment.id = edge.attribute("id").as_string();
		if (segment.id.empty()) {
			++skipped;
			continue;
		}
		segment.is_internal = segment.id.front() == ':' ||
							  std::string_view(edge.attribute("function").as_string()) == "internal";

		auto lanes = std::vector<LaneRecord> {};
		for (const auto lane : edge.children("lane")) {
			lanes.push_back(parse_lane(lane));
		}
		if (lanes.empty()) {
			++skipped;
			continue;
		}
		std::sort(lanes.begin(), lanes.end(),
				  [](const LaneRecord& a, const LaneRecord& b) { return a.index < b.index; });

		segment.lane_count = static_cast<int>(lanes.size());
		segment.speed_ms = lanes.front().speed_ms;
		segment.length_m = lanes.front().length_m;

		// The edge's own shape attribute is the reference line of the road, not
		// the middle of its lanes.
		segment.shape = centerline(lanes);

		const auto [_, inserted] = network.index_.emplace(segment.id, network.segments_.size());
		if (! inserted) {
			++skipped;
			continue;
		}
		network.segments_.push_back(std::move(segment));
	}

	for (const auto roundabout : net.children("roundabout")) {
		++network.roundabout_count_;
		auto edges = std::istringstream(roundabout.attribute("edges").as_string());
		std::string id;
		while (edges >> id) {
			if (const auto it = network.index_.find(id); it != network.index_.end()) {
				network.segments_[it->second].is_roundabout = true;
			}
		}
	}

	if (skipped > 0) {
		spdlog::warn("Skipped {} edges without id, without lanes or with a duplicate id", skipped);
	}
	spdlog::debug("Loaded {} edges, {} roundabouts, {}", network.segments_.size(),
				  network.roundabout_count_, pformat(network.projection_));

	return network;
}

auto RoadNetwork::find(std::string_view id) const -> const RoadSegment* {
	const auto it = this->index_.find(std::string(id));
	if (it == this->index_.end()) {
		return nullptr;
	}
	return &this->segments_[it->second];
}

} // namespace fcd_digest
