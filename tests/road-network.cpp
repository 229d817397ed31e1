#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "projection.hpp"
#include "road-network.hpp"

using namespace fcd_digest;

namespace {
constexpr auto net_xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<net version="1.16">
    <location netOffset="-10.00,-20.00" convBoundary="0,0,100,100" origBoundary="0,0,1,1" projParameter="!"/>
    <edge id=":J1_0" function="internal">
        <lane id=":J1_0_0" index="0" speed="8.00" length="4.00" shape="10,10 12,12"/>
    </edge>
    <edge id="100#0" from="J0" to="J1" priority="1">
        <lane id="100#0_0" index="0" speed="13.89" length="50.00" shape="0,0 50,0"/>
    </edge>
    <edge id="200" from="J1" to="J2" priority="1">
        <lane id="200_1" index="1" speed="11.00" length="41.00" shape="0,4 40,4"/>
        <lane id="200_0" index="0" speed="10.00" length="40.00" shape="0,0 40,0"/>
    </edge>
    <edge id="300" from="J2" to="J3" priority="1">
        <lane id="300_0" index="0" speed="10.00" length="40.00" shape="0,0 20,0 40,0"/>
        <lane id="300_1" index="1" speed="10.00" length="40.00" shape="0,3 40,3"/>
        <lane id="300_2" index="2" speed="10.00" length="40.00" shape="0,6 40,6"/>
    </edge>
    <edge id="400" from="J3" to="J4" priority="1" shape="5,5 6,6 7,7">
        <lane id="400_0" index="0" speed="10.00" length="40.00" shape="0,0 40,0"/>
    </edge>
    <edge id="500" from="J4" to="J5"/>
    <edge id="600" from="J5" to="J6" priority="1" shape="0,0 40,0">
        <lane id="600_0" index="0" speed="10.00" length="40.00" shape="0,-1.6 20,-1.6 40,-1.6"/>
        <lane id="600_1" index="1" speed="10.00" length="40.00" shape="0,1.6 40,1.6"/>
        <lane id="600_2" index="2" speed="10.00" length="40.00" shape="0,4.8 40,4.8"/>
        <lane id="600_3" index="3" speed="10.00" length="40.00" shape="0,8.0 40,8.0"/>
    </edge>
    <edge id="100#0" from="J0" to="J1" priority="1">
        <lane id="100#0_0" index="0" speed="1.00" length="1.00" shape="0,0 1,0"/>
    </edge>
    <roundabout nodes="J3 J4" edges="300 400"/>
</net>
)";
} // namespace

TEST_CASE("shapes are parsed strictly", "[road-network]") {
    const auto shape = parse_shape("0.00,1.50 2,3,7.5  4,5");
    REQUIRE(shape.size() == 3);
    REQUIRE(shape[0].y == Catch::Approx(1.5));
    REQUIRE(shape[1].x == Catch::Approx(2.0));
    REQUIRE(shape[1].y == Catch::Approx(3.0));
    REQUIRE(parse_shape("").empty());
    REQUIRE(parse_shape("1,2 3").empty());
    REQUIRE(parse_shape("1,2 a,b").empty());
}

TEST_CASE("network is loaded from xml", "[road-network]") {
    const auto network = RoadNetwork::load_string(net_xml);
    REQUIRE(network.has_value());
    // :J1_0, 100#0, 200, 300, 400, 600; the lane-less 500 and the duplicate are skipped
    REQUIRE(network->size() == 6);
    REQUIRE(network->roundabout_count() == 1);

    const auto* internal = network->find(":J1_0");
    REQUIRE(internal != nullptr);
    REQUIRE(internal->is_internal);

    const auto* first = network->find("100#0");
    REQUIRE(first != nullptr);
    REQUIRE(first->lane_count == 1);
    REQUIRE(first->speed_ms == Catch::Approx(13.89));
    REQUIRE(first->length_m == Catch::Approx(50.0));
    REQUIRE(!first->is_internal);
    REQUIRE(!first->is_roundabout);

    REQUIRE(network->find("500") == nullptr);
    REQUIRE(network->find("nope") == nullptr);
}

TEST_CASE("edge attributes come from lane 0", "[road-network]") {
    const auto network = RoadNetwork::load_string(net_xml);
    const auto* two_lanes = network->find("200");
    REQUIRE(two_lanes->lane_count == 2);
    REQUIRE(two_lanes->speed_ms == Catch::Approx(10.0));
    REQUIRE(two_lanes->length_m == Catch::Approx(40.0));
}

TEST_CASE("edge centerline", "[road-network]") {
    const auto network = RoadNetwork::load_string(net_xml);

    SECTION("even lane count averages the lanes") {
        const auto& shape = network->find("200")->shape;
        REQUIRE(shape.size() == 2);
        REQUIRE(shape[0].y == Catch::Approx(2.0));
        REQUIRE(shape[1].x == Catch::Approx(40.0));
    }
    SECTION("odd lane count takes the middle lane") {
        const auto& shape = network->find("300")->shape;
        REQUIRE(shape.size() == 2);
        REQUIRE(shape[0].y == Catch::Approx(3.0));
    }
    SECTION("edge shape attribute is ignored") {
        const auto* edge = network->find("400");
        REQUIRE(edge->shape.size() == 2);
        REQUIRE(edge->shape[0].x == Catch::Approx(0.0));
        REQUIRE(edge->shape[0].y == Catch::Approx(0.0));
        REQUIRE(edge->shape[1].x == Catch::Approx(40.0));
        REQUIRE(edge->is_roundabout);
    }
    SECTION("uneven lane shapes are cut to the shortest lane") {
        const auto& shape = network->find("600")->shape;
        REQUIRE(shape.size() == 2);
        REQUIRE(shape[0].x == Catch::Approx(0.0));
        REQUIRE(shape[0].y == Catch::Approx(3.2));
        // the second point pairs 20,-1.6 with the ends of the other lanes
        REQUIRE(shape[1].x == Catch::Approx(35.0));
        REQUIRE(shape[1].y == Catch::Approx(3.2));
    }
}

TEST_CASE("unprojected network shifts by the offset", "[road-network]") {
    const auto network = RoadNetwork::load_string(net_xml);
    REQUIRE(!network->projection().is_utm());
    const auto p = network->to_lon_lat(Point{38.0, 27.0});
    REQUIRE(p.lon == Catch::Approx(48.0));
    REQUIRE(p.lat == Catch::Approx(47.0));
}

TEST_CASE("broken network documents", "[road-network]") {
    REQUIRE(RoadNetwork::load_string("<net><edge").error() == load_network_error::xml_parse_error);
    REQUIRE(RoadNetwork::load_string("<other/>").error() == load_network_error::missing_net_element);
    REQUIRE(RoadNetwork::load_string(R"(<net><location netOffset="0,0" projParameter="+proj=lcc"/></net>)")
                .error() == load_network_error::invalid_location);
    REQUIRE(RoadNetwork::load("does/not/exist.net.xml").error() == load_network_error::file_not_found);
}

TEST_CASE("utm projection", "[projection]") {
    const auto projection =
        Projection::from_sumo_location("-500000.00,-5200000.00", "+proj=utm +zone=35 +ellps=WGS84 +datum=WGS84 +units=m +no_defs");
    REQUIRE(projection.has_value());
    REQUIRE(projection->is_utm());
    REQUIRE(projection->zone() == 35);

    // easting 500000 is the central meridian of zone 35
    const auto equator = projection->to_lon_lat(0.0, -5200000.0);
    REQUIRE(equator.lon == Catch::Approx(27.0).margin(1e-9));
    REQUIRE(equator.lat == Catch::Approx(0.0).margin(1e-9));

    const auto north = projection->to_lon_lat(0.0, 5164.0);
    REQUIRE(north.lon == Catch::Approx(27.0).margin(1e-9));
    REQUIRE(north.lat == Catch::Approx(47.0).margin(1e-3));

    // east of the central meridian
    const auto east = projection->to_lon_lat(10000.0, 5164.0);
    REQUIRE(east.lon > 27.1);
    REQUIRE(east.lon < 27.2);
}

TEST_CASE("projection parameters", "[projection]") {
    REQUIRE(!Projection::from_sumo_location("", "").value().is_utm());
    REQUIRE(!Projection::from_sumo_location("1,2", "!").value().is_utm());
    REQUIRE(Projection::from_sumo_location("1;2", "!").error() == projection_error::malformed_net_offset);
    REQUIRE(Projection::from_sumo_location("0,0", "+proj=merc").error() ==
            projection_error::unsupported_projection);
    REQUIRE(Projection::from_sumo_location("0,0", "+proj=utm").error() ==
            projection_error::malformed_utm_zone);
    REQUIRE(Projection::from_sumo_location("0,0", "+proj=utm +zone=61").error() ==
            projection_error::malformed_utm_zone);

    const auto south = Projection::from_sumo_location("0,0", "+proj=utm +zone=23 +south");
    REQUIRE(south.has_value());
    const auto p = south->to_lon_lat(500000.0, 10000000.0);
    REQUIRE(p.lon == Catch::Approx(-45.0).margin(1e-9));
    REQUIRE(p.lat == Catch::Approx(0.0).margin(1e-9));
}
