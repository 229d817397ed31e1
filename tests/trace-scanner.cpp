#include <sstream>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "edge-aggregator.hpp"
#include "trace-scanner.hpp"
#include "trajectory-accumulator.hpp"

using namespace fcd_digest;

namespace {

auto vehicle(const std::string& id, double x, double y, double speed, const std::string& lane)
    -> std::string {
    return "        <vehicle id=\"" + id + "\" x=\"" + std::to_string(x) + "\" y=\"" +
           std::to_string(y) + "\" angle=\"90.00\" type=\"car\" speed=\"" + std::to_string(speed) +
           "\" pos=\"1.00\" lane=\"" + lane + "\" slope=\"0.00\"/>\n";
}

auto timestep(int t) -> std::string {
    return "    <timestep time=\"" + std::to_string(t) + ".00\">\n";
}

// v1 every 30 s from 0 to 600 on edge e1, v2 from 60 to 180 on e2
auto synthetic_trace() -> std::string {
    std::string trace = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<fcd-export>\n";
    for (int t = 0; t <= 600; t += 30) {
        trace += timestep(t);
        trace += vehicle("v1", 28.8 + t * 1e-5, 47.0, 10.0, "e1_0");
        if (t >= 60 && t <= 180) {
            trace += vehicle("v2", 28.9, 47.0 + t * 1e-5, 5.0, "e2_1");
        }
        trace += "    </timestep>\n";
    }
    trace += "</fcd-export>\n";
    return trace;
}

struct ScanOutput {
    ScanStats stats;
    std::vector<Trajectory> trajectories;
    EdgeAggregator edges;
};

auto run(const std::string& trace, const WindowFilter& filter, bool early_stop) -> ScanOutput {
    auto trajectories = TrajectoryAccumulator(TrajectoryLimits{.min_waypoints = 1});
    auto output = ScanOutput{};
    auto in = std::istringstream(trace);
    const auto scanner = TraceScanner(filter, ScanOptions{.early_stop = early_stop});
    output.stats = scanner.scan(in, 0, ScanSinks{&trajectories, &output.edges});
    output.trajectories = std::move(trajectories).finalize();
    return output;
}

} // namespace

TEST_CASE("line classification", "[trace-scanner]") {
    REQUIRE(is_boundary_line(R"(    <timestep time="0.00">)"));
    REQUIRE(!is_boundary_line(R"(    </timestep>)"));
    REQUIRE(is_sample_line(R"(<vehicle id="a" speed="1"/>)"));
    REQUIRE(!is_sample_line(R"(<person id="p"/>)"));
}

TEST_CASE("one vehicle sampled five times is retained", "[trace-scanner]") {
    std::string trace;
    for (const int t : {100, 130, 160, 190, 220}) {
        trace += timestep(t) + vehicle("solo", 28.85, 47.01, 8.0, "e1_0");
    }
    const auto filter = WindowFilter(TimeWindow{"t", 0, 300, 0, 1}, {});
    auto trajectories = TrajectoryAccumulator(TrajectoryLimits{.min_waypoints = 5});
    auto in = std::istringstream(trace);
    const auto stats =
        TraceScanner(filter, ScanOptions{}).scan(in, 0, ScanSinks{.trajectories = &trajectories});
    REQUIRE(stats.sample_lines == 5);

    const auto result = std::move(trajectories).finalize();
    REQUIRE(result.size() == 1);
    REQUIRE(result[0].vehicle_id == "solo");
    REQUIRE(result[0].waypoints.size() == 5);
    int expected = 100;
    for (const auto& w : result[0].waypoints) {
        REQUIRE(w.second == expected);
        REQUIRE(w.speed_kmh == Catch::Approx(28.8));
        expected += 30;
    }
}

TEST_CASE("early stop matches a full scan", "[trace-scanner]") {
    const auto trace = synthetic_trace();
    const auto filter = WindowFilter(TimeWindow{"t", 60, 150, 30, 1},
                                     {TimeWindow{"p", 0, 200, 0, 60}});

    const auto early = run(trace, filter, true);
    const auto full = run(trace, filter, false);

    REQUIRE(early.stats.stopped_early);
    REQUIRE(!full.stats.stopped_early);
    REQUIRE(early.stats.lines < full.stats.lines);
    REQUIRE(early.stats.last_time == Catch::Approx(210));

    REQUIRE(early.trajectories.size() == full.trajectories.size());
    for (std::size_t i = 0; i < early.trajectories.size(); ++i) {
        const auto& a = early.trajectories[i];
        const auto& b = full.trajectories[i];
        REQUIRE(a.vehicle_id == b.vehicle_id);
        REQUIRE(a.waypoints.size() == b.waypoints.size());
        for (std::size_t j = 0; j < a.waypoints.size(); ++j) {
            REQUIRE(a.waypoints[j].second == b.waypoints[j].second);
            REQUIRE(a.waypoints[j].lon == b.waypoints[j].lon);
        }
    }

    REQUIRE(early.edges.size() == full.edges.size());
    for (const auto& [id, aggregate] : full.edges.table()) {
        const auto other = early.edges.find(id);
        REQUIRE(other.has_value());
        REQUIRE(other->sample_count == aggregate.sample_count);
        REQUIRE(other->speed_sum_kmh == Catch::Approx(aggregate.speed_sum_kmh));
    }
}

TEST_CASE("windowed samples reach the right consumers", "[trace-scanner]") {
    const auto filter = WindowFilter(TimeWindow{"t", 60, 150, 30, 1},
                                     {TimeWindow{"p", 0, 200, 0, 60}});
    const auto out = run(synthetic_trace(), filter, true);

    // trajectory window [30, 180]: v1 at 30..180, v2 at 60..180
    REQUIRE(out.trajectories.size() == 2);
    REQUIRE(out.trajectories[0].vehicle_id == "v1");
    REQUIRE(out.trajectories[0].waypoints.size() == 6);
    REQUIRE(out.trajectories[0].waypoints.front().second == 30);
    REQUIRE(out.trajectories[0].waypoints.back().second == 180);
    REQUIRE(out.trajectories[1].vehicle_id == "v2");
    REQUIRE(out.trajectories[1].waypoints.size() == 5);

    // aggregation at 0, 60, 120, 180
    REQUIRE(out.edges.find("e1")->sample_count == 4);
    REQUIRE(out.edges.find("e1")->mean_speed_kmh() == Catch::Approx(36.0));
    REQUIRE(out.edges.find("e2")->sample_count == 3);
    REQUIRE(out.edges.find("e2")->mean_speed_kmh() == Catch::Approx(18.0));
}

TEST_CASE("malformed lines are skipped and counted", "[trace-scanner]") {
    std::string trace;
    trace += timestep(0);
    trace += vehicle("a", 28.8, 47.0, 10.0, "e1_0");
    trace += R"(<vehicle id="b" x="28.8" y="47.0" speed="fast" lane="e1_0"/>)" "\n";
    trace += R"(<vehicle id="c" x="28.8" y="47.0" speed="-1" lane="e1_0"/>)" "\n";
    trace += R"(<vehicle id="d" x="28.8" y="47.0" speed="3.0"/>)" "\n";
    trace += R"(<vehicle id="e" x="28.8)" "\n";
    trace += R"(<timestep time="bogus">)" "\n";
    trace += vehicle("f", 28.8, 47.0, 10.0, "e1_0");
    trace += timestep(1);
    trace += vehicle("a", 28.9, 47.0, 20.0, "e1_0");

    const auto filter = WindowFilter(TimeWindow{"t", 0, 10, 0, 1}, {TimeWindow{"p", 0, 10, 0, 1}});
    const auto out = run(trace, filter, true);

    // b, c: bad speed; d: no lane; e: truncated; bogus timestep
    REQUIRE(out.stats.skipped_lines == 5);
    REQUIRE(out.stats.boundary_lines == 3);
    REQUIRE(out.stats.sample_lines == 2);

    // f sits under the unreadable timestep and is never decoded
    REQUIRE(out.edges.find("e1")->sample_count == 2);
    REQUIRE(out.trajectories.size() == 2);
    REQUIRE(out.trajectories[0].vehicle_id == "a");
    REQUIRE(out.trajectories[0].waypoints.size() == 2);
    REQUIRE(out.trajectories[1].vehicle_id == "d");
}

TEST_CASE("nothing is decoded without a window", "[trace-scanner]") {
    const auto filter = WindowFilter(std::nullopt, {});
    auto in = std::istringstream(synthetic_trace());
    const auto stats = TraceScanner(filter, ScanOptions{}).scan(in, 0, ScanSinks{});
    REQUIRE(stats.stopped_early);
    REQUIRE(stats.sample_lines == 0);
    REQUIRE(stats.boundary_lines == 1);
}

TEST_CASE("missing trace file", "[trace-scanner]") {
    const auto filter = WindowFilter(TimeWindow{"t", 0, 10, 0, 1}, {});
    const auto stats = TraceScanner(filter, ScanOptions{}).scan_file("does/not/exist.xml", ScanSinks{});
    REQUIRE(!stats.has_value());
    REQUIRE(stats.error() == scan_error::file_not_found);
}
