#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "road-network.hpp"
#include "segment-metrics.hpp"
#include "validator.hpp"

using namespace fcd_digest;

namespace {
auto corridor(const char* name, double reference) -> ReferenceCorridor {
    return ReferenceCorridor{name, BoundingBox{28.80, 28.90, 46.90, 47.00}, reference};
}
} // namespace

TEST_CASE("verdict thresholds", "[validator]") {
    REQUIRE(verdict_for_ratio(0.5) == Verdict::good);
    REQUIRE(verdict_for_ratio(1.49) == Verdict::good);
    REQUIRE(verdict_for_ratio(1.5) == Verdict::needs_tuning);
    REQUIRE(verdict_for_ratio(2.49) == Verdict::needs_tuning);
    REQUIRE(verdict_for_ratio(2.5) == Verdict::under_congested);
    REQUIRE(to_string(Verdict::under_congested) == "model under-congests");
    REQUIRE(to_string(Verdict::no_data) == "no data");
}

TEST_CASE("a corridor twice as fast as measured needs tuning", "[validator]") {
    const auto validator = Validator({corridor("c", 10.0)});
    const auto probes = std::vector<SpeedProbe>{{LonLat{28.85, 46.95}, 20.0}};
    const auto report = validator.validate(probes);
    REQUIRE(report.size() == 1);
    REQUIRE(report[0].segment_count == 1);
    REQUIRE(report[0].simulated_speed_kmh.value() == Catch::Approx(20.0));
    REQUIRE(report[0].ratio.value() == Catch::Approx(2.0));
    REQUIRE(report[0].verdict == Verdict::needs_tuning);
}

TEST_CASE("corridor without samples has no data", "[validator]") {
    const auto validator = Validator({corridor("empty", 10.0), corridor("full", 10.0)});
    const auto outside = std::vector<SpeedProbe>{{LonLat{29.5, 46.95}, 20.0}};
    const auto report = validator.validate(outside);
    REQUIRE(report.size() == 2);
    for (const auto& entry : report) {
        REQUIRE(entry.verdict == Verdict::no_data);
        REQUIRE(!entry.simulated_speed_kmh.has_value());
        REQUIRE(!entry.ratio.has_value());
        REQUIRE(entry.segment_count == 0);
    }
}

TEST_CASE("simulated speed is the plain mean of the probes inside", "[validator]") {
    const auto validator = Validator({corridor("c", 10.0)});
    const auto probes = std::vector<SpeedProbe>{
        {LonLat{28.81, 46.91}, 5.0},
        {LonLat{28.89, 46.99}, 10.0},
        {LonLat{28.90, 47.00}, 15.0}, // on the edge counts
        {LonLat{28.91, 47.00}, 1000.0},
    };
    const auto report = validator.validate(probes);
    REQUIRE(report[0].segment_count == 3);
    REQUIRE(report[0].simulated_speed_kmh.value() == Catch::Approx(10.0));
    REQUIRE(report[0].verdict == Verdict::good);
}

TEST_CASE("probes come from the first shape point of each segment", "[validator]") {
    const auto network = RoadNetwork::load_string(R"(<net>
        <location netOffset="0,0" projParameter="!"/>
        <edge id="in"><lane id="in_0" index="0" speed="10" length="10" shape="28.85,46.95 29.50,46.95"/></edge>
        <edge id="out"><lane id="out_0" index="0" speed="10" length="10" shape="29.50,46.95 28.85,46.95"/></edge>
    </net>)").value();

    const auto metrics = std::vector<SegmentMetrics>{
        {.edge_id = "in", .mean_speed_kmh = 30.0},
        {.edge_id = "out", .mean_speed_kmh = 99.0},
        {.edge_id = "missing", .mean_speed_kmh = 1.0},
    };
    const auto probes = collect_probes(metrics, network);
    REQUIRE(probes.size() == 2);

    const auto report = Validator({corridor("c", 10.0)}).validate(metrics, network);
    REQUIRE(report[0].segment_count == 1);
    REQUIRE(report[0].ratio.value() == Catch::Approx(3.0));
    REQUIRE(report[0].verdict == Verdict::under_congested);
}

TEST_CASE("internal junction segments are not probed", "[validator]") {
    const auto network = RoadNetwork::load_string(R"(<net>
        <location netOffset="0,0" projParameter="!"/>
        <edge id="in"><lane id="in_0" index="0" speed="10" length="10" shape="28.85,46.95 29.50,46.95"/></edge>
        <edge id=":J1_0" function="internal"><lane id=":J1_0_0" index="0" speed="5" length="3" shape="28.86,46.96 28.87,46.96"/></edge>
    </net>)").value();

    const auto junction_only = std::vector<SegmentMetrics>{
        {.edge_id = ":J1_0", .mean_speed_kmh = 5.0},
    };
    REQUIRE(collect_probes(junction_only, network).empty());
    const auto empty_report = Validator({corridor("c", 10.0)}).validate(junction_only, network);
    REQUIRE(empty_report[0].segment_count == 0);
    REQUIRE(empty_report[0].verdict == Verdict::no_data);

    const auto mixed = std::vector<SegmentMetrics>{
        {.edge_id = ":J1_0", .mean_speed_kmh = 5.0},
        {.edge_id = "in", .mean_speed_kmh = 30.0},
    };
    const auto report = Validator({corridor("c", 10.0)}).validate(mixed, network);
    REQUIRE(report[0].segment_count == 1);
    REQUIRE(report[0].simulated_speed_kmh.value() == Catch::Approx(30.0));
}

TEST_CASE("default corridors", "[validator]") {
    const auto corridors = default_corridors();
    REQUIRE(corridors.size() == 6);
    for (const auto& c : corridors) {
        REQUIRE(c.reference_speed_kmh > 0.0);
        REQUIRE(c.bbox.lon_min < c.bbox.lon_max);
        REQUIRE(c.bbox.lat_min < c.bbox.lat_max);
    }
}
