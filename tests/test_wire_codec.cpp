#include <string>
#include <variant>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/time_format.hpp"
#include "freight_tracking/wire_codec.hpp"
#include "tracking_fakes.hpp"

using namespace freight_tracking;
using freight_tracking::test::make_sample;
using freight_tracking::test::reference_time;
using json = nlohmann::json;

TEST_CASE("Subscription keys combine the entity type and id") {
    REQUIRE(to_subscription_key(EntityKey{EntityType::SmartHub, "hub_7"}) == "SMART_HUB_hub_7");

    const EntityKey hub = parse_subscription_key("SMART_HUB_hub_7");
    REQUIRE(hub.entity_type == EntityType::SmartHub);
    REQUIRE(hub.entity_id == "hub_7");

    const EntityKey driver = parse_subscription_key("DRIVER_d_1");
    REQUIRE(driver.entity_type == EntityType::Driver);
    REQUIRE(driver.entity_id == "d_1");

    REQUIRE_THROWS_AS(parse_subscription_key("TRAILER_9"), ValidationError);
    REQUIRE_THROWS_AS(parse_subscription_key("VEHICLE_"), ValidationError);
}

TEST_CASE("Control frames carry the operation and the entity") {
    const json subscribe = json::parse(encode_subscription_control(ControlOp::Subscribe, {EntityType::Vehicle, "t-1"}));
    REQUIRE(subscribe.at("op") == "subscribe");
    REQUIRE(subscribe.at("entityId") == "t-1");
    REQUIRE(subscribe.at("entityType") == "VEHICLE");

    const json release = json::parse(encode_load_status_control(ControlOp::Unsubscribe, "load-9"));
    REQUIRE(release.at("op") == "unsubscribe_load_status");
    REQUIRE(release.at("loadId") == "load-9");
}

TEST_CASE("Position updates decode into normalized samples") {
    const std::string frame = R"({
        "event": "position_update",
        "key": "SMART_HUB_hub_7",
        "payload": {
            "latitude": 33.74900049,
            "longitude": -84.3879824,
            "speed": 0,
            "source": "SYSTEM",
            "recordedAt": "2026-10-19T11:59:30Z"
        }
    })";

    const InboundEvent inbound = decode_inbound(frame);
    REQUIRE(std::holds_alternative<PositionUpdateEvent>(inbound));
    const PositionUpdateEvent& update = std::get<PositionUpdateEvent>(inbound);
    REQUIRE(update.entity == EntityKey{EntityType::SmartHub, "hub_7"});
    REQUIRE(update.sample.entity_id == "hub_7");
    REQUIRE(update.sample.latitude_deg == Approx(33.749000).margin(1e-9));
    REQUIRE(update.sample.longitude_deg == Approx(-84.387982).margin(1e-9));
    REQUIRE(update.sample.speed_kmh == Approx(0.0));
    REQUIRE_FALSE(update.sample.heading_deg.has_value());
    REQUIRE(update.sample.source == PositionSource::System);
    REQUIRE(update.sample.created_at == update.sample.recorded_at);
}

TEST_CASE("Encoded position updates decode to the same sample") {
    PositionSample sample = make_sample("truck-1", 41.878114, -87.629798, reference_time());
    sample.heading_deg = 90.0;
    sample.accuracy_m = 4.5;
    sample.source_log_id = "eld-1";

    const InboundEvent inbound = decode_inbound(encode_position_update(sample));
    REQUIRE(std::get<PositionUpdateEvent>(inbound).sample == sample);
}

TEST_CASE("Malformed inbound frames are validation errors") {
    REQUIRE_THROWS_AS(decode_inbound("{not json"), ValidationError);
    REQUIRE_THROWS_AS(decode_inbound("[1, 2]"), ValidationError);
    REQUIRE_THROWS_AS(decode_inbound(R"({"event":"teleport"})"), ValidationError);
    REQUIRE_THROWS_AS(decode_inbound(R"({"event":"position_update","key":"VEHICLE_t-1"})"), ValidationError);
    REQUIRE_THROWS_AS(
        decode_inbound(
            R"({"event":"position_update","key":"VEHICLE_t-1","payload":{"latitude":120,"longitude":0,"recordedAt":"2026-10-19T00:00:00Z"}})"),
        ValidationError);
    REQUIRE_THROWS_AS(
        decode_inbound(
            R"({"event":"position_update","key":"VEHICLE_t-1","payload":{"entityId":"t-2","latitude":1,"longitude":1,"recordedAt":"2026-10-19T00:00:00Z"}})"),
        ValidationError);
    REQUIRE_THROWS_AS(decode_inbound(R"({"event":"load_status","loadId":"","status":"delivered"})"), ValidationError);
    REQUIRE_THROWS_AS(decode_inbound(R"({"event":"load_status","loadId":"l-1","status":"teleported"})"),
                      ValidationError);
}

TEST_CASE("Load status events keep their details") {
    LoadStatusEvent event{};
    event.load_id = "load-9";
    event.status = LoadStatus::InTransit;
    event.details = json{{"note", "left the yard"}};

    const json encoded = json::parse(encode_load_status_event(event));
    REQUIRE(encoded.at("status") == "in_transit");

    const LoadStatusEvent decoded = std::get<LoadStatusEvent>(decode_inbound(encoded.dump()));
    REQUIRE(decoded.load_id == "load-9");
    REQUIRE(decoded.status == LoadStatus::InTransit);
    REQUIRE(decoded.details.at("note") == "left the yard");
}

TEST_CASE("Trajectories export as GeoJSON LineString features") {
    Trajectory trajectory{};
    trajectory.entity = EntityKey{EntityType::Vehicle, "truck-1"};
    trajectory.window_start = reference_time() - Milliseconds{60'000};
    trajectory.window_end = reference_time();
    trajectory.tolerance_deg = 0.0001;
    trajectory.raw_point_count = 5;
    trajectory.points = {make_sample("truck-1", 41.0, -87.0, trajectory.window_start),
                         make_sample("truck-1", 41.5, -87.5, trajectory.window_end)};

    const json feature = trajectory_to_geojson(trajectory);
    REQUIRE(feature.at("type") == "Feature");
    REQUIRE(feature.at("geometry").at("type") == "LineString");
    const json& coordinates = feature.at("geometry").at("coordinates");
    REQUIRE(coordinates.size() == 2);
    REQUIRE(coordinates[0][0].get<double>() == Approx(-87.0));
    REQUIRE(coordinates[0][1].get<double>() == Approx(41.0));
    REQUIRE(feature.at("properties").at("rawPointCount") == 5);
    REQUIRE(feature.at("properties").at("endTime") == format_iso8601(reference_time()));
    REQUIRE(feature.at("properties").at("timestamps").size() == 2);
}
