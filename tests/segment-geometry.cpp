#include <cmath>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "congestion-classifier.hpp"
#include "road-network.hpp"
#include "segment-geometry.hpp"
#include "segment-metrics.hpp"

using namespace fcd_digest;

namespace {
// shift projection with a zero offset: shapes are already lon/lat
constexpr auto net_xml = R"(<net>
    <location netOffset="0.00,0.00" projParameter="!"/>
    <edge id="12#0" shape="28.800,47.000 28.810,47.000">
        <lane id="12#0_0" index="0" speed="13.89" length="100.00" shape="28.800,47.000 28.810,47.000"/>
        <lane id="12#0_1" index="1" speed="13.89" length="100.00" shape="28.800,47.000 28.810,47.000"/>
    </edge>
    <edge id="12#1" shape="28.810,47.000 28.820,47.000">
        <lane id="12#1_0" index="0" speed="13.89" length="300.00" shape="28.810,47.000 28.820,47.000"/>
        <lane id="12#1_1" index="1" speed="13.89" length="300.00" shape="28.810,47.000 28.820,47.000"/>
    </edge>
    <edge id="-12#0" shape="28.810,47.001 28.800,47.001">
        <lane id="-12#0_0" index="0" speed="13.89" length="100.00" shape="28.810,47.001 28.800,47.001"/>
    </edge>
    <edge id="77" shape="28.900,47.100">
        <lane id="77_0" index="0" speed="13.89" length="0.00" shape="28.900,47.100"/>
    </edge>
    <edge id="88" shape="28.700,47.200 28.700,47.210">
        <lane id="88_0" index="0" speed="13.89" length="50.00" shape="28.700,47.200 28.700,47.210"/>
    </edge>
    <edge id=":J1_0" function="internal">
        <lane id=":J1_0_0" index="0" speed="5.00" length="3.00" shape="28.810,47.000 28.811,47.001"/>
    </edge>
    <roundabout nodes="J8" edges="88"/>
</net>)";

auto row(const char* id, double ratio, double flow) -> SegmentMetrics {
    return SegmentMetrics{.edge_id = id, .speed_ratio = ratio, .sample_count = 1, .peak_flow = flow};
}
} // namespace

TEST_CASE("segment id conventions", "[segment-geometry]") {
    REQUIRE(base_id("12#0") == "12");
    REQUIRE(base_id("-12#3") == "12");
    REQUIRE(base_id("-4567") == "4567");
    REQUIRE(base_id("abc") == "abc");
    REQUIRE(split_index("12#3") == 3);
    REQUIRE(split_index("12") == 0);
    REQUIRE(split_index("12#x") == 0);
    REQUIRE(is_reverse_segment("-12#0"));
    REQUIRE(!is_reverse_segment("12#0"));
    REQUIRE(is_internal_segment(":J1_0"));
    REQUIRE(!is_internal_segment("12#0"));
}

TEST_CASE("polylines merge on a shared endpoint", "[segment-geometry]") {
    auto merged = std::vector<LonLat>{{0.0, 0.0}, {1.0, 0.0}, {2.0, 0.0}};
    const auto next = std::vector<LonLat>{{2.00001, 0.00001}, {3.0, 0.0}};
    append_polyline(merged, next, 5e-5);
    REQUIRE(merged.size() == 3 + 2 - 1);
    REQUIRE(merged.back().lon == Catch::Approx(3.0));

    const auto far = std::vector<LonLat>{{3.1, 0.0}, {4.0, 0.0}};
    append_polyline(merged, far, 5e-5);
    REQUIRE(merged.size() == 6);

    auto empty = std::vector<LonLat>{};
    append_polyline(empty, next, 5e-5);
    REQUIRE(empty.size() == 2);
}

TEST_CASE("lane offsets are symmetric", "[segment-geometry]") {
    for (int n = 1; n <= 5; ++n) {
        const auto offsets = lane_offsets(n, 3.2);
        REQUIRE(offsets.size() == static_cast<std::size_t>(n));
        for (int i = 0; i < n; ++i) {
            REQUIRE(offsets[i] == Catch::Approx(-offsets[n - 1 - i]).margin(1e-12));
        }
    }
    const auto three = lane_offsets(3, 3.2);
    REQUIRE(three[0] == Catch::Approx(-3.2));
    REQUIRE(three[1] == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(lane_offsets(0, 3.2).empty());
}

TEST_CASE("offset polyline moves left of travel", "[segment-geometry]") {
    const auto settings = GeometrySettings{};
    const auto eastbound = std::vector<LonLat>{{28.80, 47.0}, {28.81, 47.0}};

    const auto left = offset_polyline(eastbound, 111.0, settings);
    REQUIRE(left.size() == 2);
    REQUIRE(left[0].lon == Catch::Approx(28.80));
    REQUIRE(left[0].lat == Catch::Approx(47.001));

    const auto right = offset_polyline(eastbound, -111.0, settings);
    REQUIRE(right[1].lat == Catch::Approx(46.999));

    const auto northbound = std::vector<LonLat>{{28.80, 47.0}, {28.80, 47.01}};
    const auto shifted = offset_polyline(northbound, 75.0, settings);
    REQUIRE(shifted[0].lon == Catch::Approx(28.799));

    const auto single = std::vector<LonLat>{{1.0, 2.0}};
    REQUIRE(offset_polyline(single, 10.0, settings).size() == 1);
}

TEST_CASE("only sampled splits make up a road", "[segment-geometry]") {
    const auto network = RoadNetwork::load_string(net_xml).value();
    const auto classifier = CongestionClassifier{};
    const auto builder = SegmentGeometryBuilder(network, classifier, GeometrySettings{});

    SECTION("one split sampled") {
        const auto roads = builder.build_roads({row("12#0", 0.5, 2.0)});
        REQUIRE(roads.size() == 1);
        REQUIRE(roads[0].segment_ids == std::vector<std::string>{"12#0"});
        REQUIRE(roads[0].polyline.size() == 2);
        REQUIRE(roads[0].key.lane_count == 2);

        const auto features = builder.build({row("12#0", 0.5, 2.0)});
        REQUIRE(features.size() == 2);
        REQUIRE(features[0].lane_count == 2);
    }
    SECTION("nothing sampled") {
        REQUIRE(builder.build_roads({}).empty());
        REQUIRE(builder.build({}).empty());
    }
    SECTION("both splits are stitched in order") {
        const auto roads = builder.build_roads({row("12#1", 1.0, 4.0), row("12#0", 0.2, 0.0)});
        REQUIRE(roads.size() == 1);
        REQUIRE(roads[0].segment_ids == std::vector<std::string>{"12#0", "12#1"});
        REQUIRE(roads[0].polyline.size() == 3);
        // weighted by length 100 and 300
        REQUIRE(roads[0].speed_ratio == Catch::Approx(0.8));
        REQUIRE(roads[0].flow == Catch::Approx(3.0));
    }
}

TEST_CASE("grouping keys", "[segment-geometry]") {
    const auto network = RoadNetwork::load_string(net_xml).value();
    const auto classifier = CongestionClassifier{};
    const auto builder = SegmentGeometryBuilder(network, classifier, GeometrySettings{});

    const auto roads = builder.build_roads({
        row("12#0", 0.5, 1.0),
        row("-12#0", 0.5, 1.0),
        row(":J1_0", 0.5, 1.0), // internal
        row("unknown", 0.5, 1.0),
        row("77", 0.5, 1.0), // degenerate shape
        row("88", 0.5, 1.0),
    });
    // the reverse direction is its own road; 77 has a single point
    REQUIRE(roads.size() == 3);
    REQUIRE(roads[0].key.base_id == "12");
    REQUIRE(roads[0].key.lane_count == 1);
    REQUIRE(roads[0].key.reverse);
    REQUIRE(roads[1].key.base_id == "12");
    REQUIRE(roads[1].key.lane_count == 2);
    REQUIRE(!roads[1].key.reverse);
    REQUIRE(roads[2].key.base_id == "88");
    REQUIRE(roads[2].is_roundabout);
}

TEST_CASE("features carry rounded properties", "[segment-geometry]") {
    const auto network = RoadNetwork::load_string(net_xml).value();
    const auto classifier = CongestionClassifier{};
    const auto builder = SegmentGeometryBuilder(network, classifier, GeometrySettings{});

    const auto features = builder.build({row("88", 0.123456, 7.9)});
    REQUIRE(features.size() == 1);
    const auto& feature = features[0];
    REQUIRE(feature.speed_ratio == Catch::Approx(0.123));
    REQUIRE(feature.peak_flow == 7);
    REQUIRE(feature.color == Rgb{204, 0, 0});
    REQUIRE(feature.lane_count == 1);
    REQUIRE(feature.is_roundabout);
    // a single lane is not offset
    REQUIRE(feature.coordinates[0].lon == Catch::Approx(28.7));
    REQUIRE(feature.coordinates[1].lat == Catch::Approx(47.21));
}
