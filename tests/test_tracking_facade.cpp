#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/geo.hpp"
#include "freight_tracking/partitioned_position_store.hpp"
#include "freight_tracking/time_format.hpp"
#include "freight_tracking/tracking_facade.hpp"
#include "logging_test_fixture.hpp"
#include "tracking_fakes.hpp"

using namespace freight_tracking;
using freight_tracking::test::FakeLoadService;
using freight_tracking::test::FakeTransport;
using freight_tracking::test::make_load;
using freight_tracking::test::make_sample;
using freight_tracking::test::reference_time;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    freight_tracking::test::ensure_logger_initialized();
    return true;
}();

constexpr Milliseconds k_wait{2'000};
const GeodeticCoordinate k_pickup{41.0, -88.0};
const GeodeticCoordinate k_delivery{41.0, -86.0};

struct FacadeFixture {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>(reference_time());
    std::shared_ptr<PartitionedPositionStore> store =
        std::make_shared<PartitionedPositionStore>(PartitionedStoreConfig{true}, clock);
    std::shared_ptr<PositionCache> cache = std::make_shared<PositionCache>(Milliseconds{30'000}, clock);
    std::shared_ptr<TrajectoryEngine> trajectories =
        std::make_shared<TrajectoryEngine>(store, Milliseconds{60'000}, clock);
    std::shared_ptr<EtaEngine> eta = std::make_shared<EtaEngine>(store, cache, nullptr, EtaConfig{}, clock);
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<SubscriptionHub> hub = SubscriptionHub::create(transport, cache);
    std::shared_ptr<FakeLoadService> loads = std::make_shared<FakeLoadService>();
    TrackingFacade facade{store, cache, trajectories, eta, hub, loads, FacadeConfig{}, clock};

    ~FacadeFixture() { hub->stop(); }

    /** @brief truck-1 driving east from the pickup over the last half hour. */
    void drive_truck() {
        for (int minute = 30; minute >= 0; minute -= 10) {
            PositionSample sample = make_sample(
                "truck-1", 41.0, -88.0 + 0.05 * (30 - minute) / 10.0, reference_time() - Milliseconds{minute * 60'000});
            sample.speed_kmh = 70.0;
            facade.ingest(sample);
        }
    }
};
}  // namespace

TEST_CASE("TrackingFacade ingest persists, caches and refreshes trajectories") {
    FacadeFixture fixture;
    const TimePoint earlier = reference_time() - Milliseconds{120'000};
    fixture.facade.ingest(make_sample("truck-1", 41.0, -88.0, earlier));

    const Trajectory before = fixture.facade.trajectory("truck-1", EntityType::Vehicle);
    REQUIRE(before.raw_point_count == 1);

    PositionSample newer = make_sample("truck-1", 41.1, -87.9, reference_time() - Milliseconds{60'000});
    newer.source_log_id = "eld-5";
    const auto stored = fixture.facade.ingest(newer);
    REQUIRE(stored.has_value());
    REQUIRE(stored->created_at == reference_time());

    const Trajectory after = fixture.facade.trajectory("truck-1", EntityType::Vehicle);
    REQUIRE(after.raw_point_count == 2);
    REQUIRE(after.window_end == reference_time());
    REQUIRE(after.window_start == reference_time() - Milliseconds{24 * 3'600'000LL});

    SECTION("duplicates are ignored") {
        REQUIRE_FALSE(fixture.facade.ingest(newer).has_value());
        REQUIRE(fixture.store->sample_count() == 2);
    }

    SECTION("late samples do not displace the cached position") {
        fixture.facade.ingest(make_sample("truck-1", 40.0, -89.0, earlier - Milliseconds{1'000}));
        const auto current = fixture.facade.current_position("truck-1", EntityType::Vehicle);
        REQUIRE(current.has_value());
        REQUIRE(current->latitude_deg == Approx(41.1));
    }

    SECTION("invalid samples propagate") {
        REQUIRE_THROWS_AS(fixture.facade.ingest(make_sample("truck-1", 0.0, 181.0, earlier)), ValidationError);
    }
}

TEST_CASE("TrackingFacade default trajectory windows share a cache entry per minute") {
    FacadeFixture fixture;
    fixture.drive_truck();

    fixture.clock->advance(Milliseconds{10'000});
    const Trajectory first = fixture.facade.trajectory("truck-1", EntityType::Vehicle);
    fixture.clock->advance(Milliseconds{20'000});
    const Trajectory second = fixture.facade.trajectory("truck-1", EntityType::Vehicle);
    REQUIRE(first.window_end == reference_time() + Milliseconds{60'000});
    REQUIRE(second.window_end == first.window_end);
    REQUIRE(second.raw_point_count == 4);
    REQUIRE(fixture.trajectories->cached_count() == 1);

    for (int call = 0; call < 600; ++call) {
        fixture.clock->advance(Milliseconds{60'000});
        (void)fixture.facade.trajectory("truck-1", EntityType::Vehicle);
    }
    REQUIRE(fixture.trajectories->cached_count() <= 1);
}

TEST_CASE("TrackingFacade reads current position and history from the store") {
    FacadeFixture fixture;
    fixture.drive_truck();
    fixture.facade.clear_position_cache(EntityKey{EntityType::Vehicle, "truck-1"});
    REQUIRE_FALSE(fixture.cache->get("truck-1", EntityType::Vehicle).has_value());

    const auto current = fixture.facade.current_position("truck-1", EntityType::Vehicle);
    REQUIRE(current.has_value());
    REQUIRE(current->recorded_at == reference_time());
    REQUIRE(fixture.cache->get("truck-1", EntityType::Vehicle).has_value());

    RangeQuery query{};
    query.start = reference_time() - Milliseconds{20 * 60'000};
    query.end = reference_time();
    REQUIRE(fixture.facade.position_history("truck-1", EntityType::Vehicle, query).size() == 3);
    REQUIRE_FALSE(fixture.facade.current_position("ghost", EntityType::Driver).has_value());

    const double remaining = fixture.facade.remaining_distance("truck-1", EntityType::Vehicle, 41.0, -86.0);
    REQUIRE(remaining > 0.0);
    const EtaResult eta = fixture.facade.estimate_eta("truck-1", EntityType::Vehicle, 41.0, -86.0);
    REQUIRE(eta.remaining_distance_km == Approx(remaining));
    REQUIRE(eta.arrival_time > reference_time());
}

TEST_CASE("TrackingFacade load tracking tolerates missing pieces") {
    FacadeFixture fixture;

    SECTION("a moving load reports position, ETA and route") {
        fixture.drive_truck();
        fixture.loads->put(make_load("load-1", LoadStatus::InTransit, "truck-1", k_pickup, k_delivery));

        const LoadTracking tracking = fixture.facade.load_tracking("load-1");
        REQUIRE(tracking.status == LoadStatus::InTransit);
        REQUIRE(tracking.assignment.has_value());
        REQUIRE(tracking.assignment->vehicle_id == "truck-1");
        REQUIRE(tracking.position.has_value());
        REQUIRE(tracking.eta.has_value());
        REQUIRE(tracking.eta->factors.hos_delay_min == Approx(0.0));
        REQUIRE(tracking.route.has_value());
        REQUIRE(tracking.route->raw_point_count == 4);
    }

    SECTION("a vehicle without positions leaves position, ETA and route empty") {
        fixture.loads->put(make_load("load-2", LoadStatus::Assigned, "truck-silent", k_pickup, k_delivery));

        const LoadTracking tracking = fixture.facade.load_tracking("load-2");
        REQUIRE(tracking.assignment.has_value());
        REQUIRE_FALSE(tracking.position.has_value());
        REQUIRE_FALSE(tracking.eta.has_value());
        REQUIRE_FALSE(tracking.route.has_value());
    }

    SECTION("a delivered load only reports its status") {
        fixture.drive_truck();
        fixture.loads->put(make_load("load-3", LoadStatus::Delivered, "truck-1", k_pickup, k_delivery));

        const LoadTracking tracking = fixture.facade.load_tracking("load-3");
        REQUIRE(tracking.status == LoadStatus::Delivered);
        REQUIRE_FALSE(tracking.assignment.has_value());
        REQUIRE_FALSE(tracking.position.has_value());
    }

    SECTION("an unknown load is not found") {
        REQUIRE_THROWS_AS(fixture.facade.load_tracking("load-404"), NotFoundError);
    }
}

TEST_CASE("TrackingFacade route visualization") {
    FacadeFixture fixture;

    SECTION("follows the vehicle trajectory when one exists") {
        fixture.drive_truck();
        fixture.loads->put(make_load("load-1", LoadStatus::InTransit, "truck-1", k_pickup, k_delivery));

        const RouteVisualization route = fixture.facade.route_visualization("load-1");
        REQUIRE(route.path_from_trajectory);
        REQUIRE(route.trajectory.has_value());
        REQUIRE(route.path.size() == route.trajectory->points.size());
        REQUIRE(route.markers.size() == 3);
        REQUIRE(route.markers[0].kind == MarkerKind::Vehicle);
        REQUIRE(route.markers[0].label == "truck-1");
        REQUIRE(route.markers[1].kind == MarkerKind::Pickup);
        REQUIRE(route.markers[2].kind == MarkerKind::Delivery);
    }

    SECTION("falls back to a straight pickup to delivery line") {
        LoadWithAssignments load = make_load("load-2", LoadStatus::Available, std::nullopt, k_pickup, k_delivery);
        load.locations.push_back(LoadLocation{LocationType::Stop, "Fuel stop", GeodeticCoordinate{41.0, -87.0}});
        fixture.loads->put(load);

        const RouteVisualization route = fixture.facade.route_visualization("load-2", true);
        REQUIRE_FALSE(route.path_from_trajectory);
        REQUIRE(route.path.size() == 2);
        REQUIRE(route.path[0].longitude_deg == Approx(k_pickup.longitude_deg));
        REQUIRE(route.path[1].longitude_deg == Approx(k_delivery.longitude_deg));
        REQUIRE(route.markers.size() == 3);
        REQUIRE(route.markers[2].kind == MarkerKind::Stop);
        REQUIRE(route.markers[2].label == "Fuel stop");
    }

    SECTION("requires pickup and delivery locations") {
        LoadWithAssignments load = make_load("load-3", LoadStatus::Assigned, "truck-1", k_pickup, k_delivery);
        load.locations.pop_back();
        fixture.loads->put(load);
        REQUIRE_THROWS_AS(fixture.facade.route_visualization("load-3"), ValidationError);
    }
}

TEST_CASE("TrackingFacade load update subscriptions") {
    FacadeFixture fixture;
    fixture.hub->start();

    SECTION("an unknown load reports through the error listener") {
        std::atomic<int> errors{0};
        const Unsubscribe unsubscribe = fixture.facade.subscribe_load_updates(
            "load-404", [](const PositionSample&) {}, [](const LoadStatusEvent&) {}, [&](const TrackingError& error) {
                REQUIRE(dynamic_cast<const NotFoundError*>(&error) != nullptr);
                ++errors;
            });
        REQUIRE(errors.load() == 1);
        REQUIRE_NOTHROW(unsubscribe());
        REQUIRE(fixture.transport->connect_calls() == 0);
    }

    SECTION("follows the active vehicle and the load status") {
        fixture.loads->put(make_load("load-1", LoadStatus::InTransit, "truck-1", k_pickup, k_delivery));
        std::atomic<int> positions{0};
        std::atomic<int> statuses{0};
        const Unsubscribe unsubscribe = fixture.facade.subscribe_load_updates(
            "load-1", [&](const PositionSample&) { ++positions; }, [&](const LoadStatusEvent&) { ++statuses; });
        REQUIRE(fixture.hub->wait_for_state(HubState::Connected, k_wait));
        REQUIRE(fixture.hub->wait_until_idle(k_wait));
        REQUIRE(fixture.hub->listener_count(EntityKey{EntityType::Vehicle, "truck-1"}) == 1);
        REQUIRE(fixture.hub->load_listener_count("load-1") == 1);

        fixture.transport->push(encode_position_update(make_sample("truck-1", 41.0, -87.5, reference_time())));
        fixture.transport->push(R"({"event":"load_status","loadId":"load-1","status":"at_dropoff"})");
        REQUIRE(fixture.hub->wait_until_idle(k_wait));
        REQUIRE(positions.load() == 1);
        REQUIRE(statuses.load() == 1);

        unsubscribe();
        unsubscribe();
        REQUIRE(fixture.hub->listener_count(EntityKey{EntityType::Vehicle, "truck-1"}) == 0);
        REQUIRE(fixture.hub->load_listener_count("load-1") == 0);
    }
}

TEST_CASE("TrackingFacade partition maintenance") {
    FacadeFixture fixture;

    const PartitionMaintenanceReport idle = fixture.facade.run_partition_maintenance(reference_time());
    REQUIRE(idle.created == 0);
    REQUIRE(idle.dropped == 0);

    const TimePoint february = parse_iso8601("2027-02-03T00:00:00Z");
    const PartitionMaintenanceReport report = fixture.facade.run_partition_maintenance(february, 1);
    REQUIRE(report.created == 4);
    REQUIRE(report.dropped == 3);
    REQUIRE(fixture.store->partitions().front().name == "position_history_y2027m01");
    REQUIRE(fixture.store->partitions().back().name == "position_history_y2027m03");
}

TEST_CASE("TrackingFacade load operations need a load service") {
    auto clock = std::make_shared<ManualClock>(reference_time());
    auto store = std::make_shared<PartitionedPositionStore>(PartitionedStoreConfig{}, clock);
    auto cache = std::make_shared<PositionCache>(Milliseconds{30'000}, clock);
    auto trajectories = std::make_shared<TrajectoryEngine>(store, Milliseconds{60'000}, clock);
    auto eta = std::make_shared<EtaEngine>(store, cache, nullptr, EtaConfig{}, clock);
    auto hub = SubscriptionHub::create(std::make_shared<FakeTransport>(), cache);
    TrackingFacade facade{store, cache, trajectories, eta, hub, nullptr, FacadeConfig{}, clock};

    REQUIRE_THROWS_AS(facade.load_tracking("load-1"), std::logic_error);
    REQUIRE_THROWS_AS(facade.route_visualization("load-1"), std::logic_error);
    REQUIRE_THROWS_AS(TrackingFacade(store, cache, trajectories, eta, nullptr, nullptr, FacadeConfig{}, clock),
                      std::invalid_argument);
}

TEST_CASE("TrackingFacade batch ingest validates everything before writing") {
    FacadeFixture fixture;
    const TimePoint now = reference_time();

    std::vector<PositionSample> list_batch{make_sample("van-2", 40.0, -88.0, now - Milliseconds{2'000}),
                                           make_sample("van-2", 95.0, -88.0, now - Milliseconds{1'000})};
    REQUIRE_THROWS_AS(fixture.facade.ingest_batch(list_batch), ValidationError);
    REQUIRE(fixture.store->sample_count() == 0);

    list_batch[1].latitude_deg = 40.1;
    list_batch[0].source_log_id = "eld-1";
    list_batch[1].source_log_id = "eld-2";
    list_batch.push_back(list_batch[0]);
    const std::vector<PositionSample> stored = fixture.facade.ingest_batch(list_batch);
    REQUIRE(stored.size() == 2);
    REQUIRE(stored[1].latitude_deg == Approx(40.1));
    REQUIRE(fixture.store->sample_count() == 2);
    REQUIRE(fixture.facade.current_position("van-2", EntityType::Vehicle)->latitude_deg == Approx(40.1));
}

TEST_CASE("TrackingFacade finds nearby entities nearest first") {
    FacadeFixture fixture;
    fixture.drive_truck();
    fixture.facade.ingest(make_sample("drv-9", 41.0, -87.80, reference_time(), EntityType::Driver));
    fixture.facade.ingest(make_sample("far-1", 45.0, -80.0, reference_time()));

    NearbyQuery query{};
    query.center = GeodeticCoordinate{41.0, -87.85};
    query.radius_km = 10.0;

    const std::vector<NearbyEntity> all = fixture.facade.nearby_entities(query);
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].position.entity_id == "truck-1");
    REQUIRE(all[0].distance_km == Approx(0.0).margin(1e-9));
    REQUIRE(all[1].position.entity_id == "drv-9");
    REQUIRE(all[1].distance_km == Approx(haversine_distance_km({41.0, -87.85}, {41.0, -87.80})));

    query.entity_type = EntityType::Vehicle;
    REQUIRE(fixture.facade.nearby_entities(query).size() == 1);
    query.entity_type.reset();
    query.limit = 1;
    REQUIRE(fixture.facade.nearby_entities(query).front().position.entity_id == "truck-1");
    query.limit = 10;

    SECTION("a newer cached position wins over the stored one") {
        fixture.cache->put("truck-1",
                           EntityType::Vehicle,
                           make_sample("truck-1", 41.0, -87.0, reference_time() + Milliseconds{1'000}));
        const std::vector<NearbyEntity> moved = fixture.facade.nearby_entities(query);
        REQUIRE(moved.size() == 1);
        REQUIRE(moved[0].position.entity_id == "drv-9");
    }

    SECTION("invalid queries are rejected") {
        query.radius_km = 0.0;
        REQUIRE_THROWS_AS(fixture.facade.nearby_entities(query), ValidationError);
        query.radius_km = 5.0;
        query.center.latitude_deg = 91.0;
        REQUIRE_THROWS_AS(fixture.facade.nearby_entities(query), ValidationError);
    }
}

TEST_CASE("TrackingFacade distances between entities and points") {
    FacadeFixture fixture;
    fixture.drive_truck();
    fixture.facade.ingest(make_sample("drv-9", 41.0, -87.80, reference_time(), EntityType::Driver));
    const EntityKey truck{EntityType::Vehicle, "truck-1"};

    const auto between = fixture.facade.distance_between(truck, EntityKey{EntityType::Driver, "drv-9"});
    REQUIRE(between.has_value());
    REQUIRE(*between == Approx(haversine_distance_km({41.0, -87.85}, {41.0, -87.80})));
    REQUIRE_FALSE(fixture.facade.distance_between(truck, EntityKey{EntityType::Driver, "ghost"}).has_value());

    const auto to_point = fixture.facade.distance_to_point(truck, 41.0, -86.0);
    REQUIRE(to_point.has_value());
    REQUIRE(*to_point == Approx(haversine_distance_km({41.0, -87.85}, {41.0, -86.0})));
    REQUIRE_FALSE(fixture.facade.distance_to_point(EntityKey{EntityType::Vehicle, "ghost"}, 41.0, -86.0).has_value());
    REQUIRE_THROWS_AS(fixture.facade.distance_to_point(truck, 41.0, -181.0), ValidationError);
}

TEST_CASE("TrackingFacade distance travelled and average speed over a window") {
    FacadeFixture fixture;
    fixture.drive_truck();
    const TimePoint start = reference_time() - Milliseconds{30 * 60'000};
    const double leg_km = haversine_distance_km({41.0, -88.0}, {41.0, -87.95});

    REQUIRE(fixture.facade.distance_travelled("truck-1", EntityType::Vehicle, start, reference_time()) ==
            Approx(3.0 * leg_km));
    REQUIRE(fixture.facade.average_speed("truck-1", EntityType::Vehicle, start, reference_time()) ==
            Approx(6.0 * leg_km));
    REQUIRE(fixture.facade.distance_travelled("truck-1", EntityType::Vehicle, reference_time(), reference_time()) ==
            0.0);
    REQUIRE(fixture.facade.average_speed("truck-1", EntityType::Vehicle, reference_time(), reference_time()) == 0.0);
    REQUIRE_THROWS_AS(fixture.facade.distance_travelled("ghost", EntityType::Vehicle, start, reference_time()),
                      NotFoundError);
    REQUIRE_THROWS_AS(fixture.facade.average_speed("truck-1", EntityType::Vehicle, reference_time(), start),
                      ValidationError);
}

TEST_CASE("TrackingFacade estimates ETAs for several entities") {
    FacadeFixture fixture;
    fixture.drive_truck();
    fixture.facade.ingest(make_sample("truck-2", 41.0, -87.5, reference_time()));

    const std::vector<EntityEta> list_etas =
        fixture.facade.estimate_eta_many({"truck-1", "truck-2"}, EntityType::Vehicle, 41.0, -86.0);
    REQUIRE(list_etas.size() == 2);
    REQUIRE(list_etas[0].entity_id == "truck-1");
    REQUIRE(list_etas[1].entity_id == "truck-2");
    REQUIRE(list_etas[1].eta.remaining_distance_km < list_etas[0].eta.remaining_distance_km);

    REQUIRE_THROWS_AS(fixture.facade.estimate_eta_many({}, EntityType::Vehicle, 41.0, -86.0), ValidationError);
    REQUIRE_THROWS_AS(fixture.facade.estimate_eta_many({"truck-1", "ghost"}, EntityType::Vehicle, 41.0, -86.0),
                      TrackingError);
}
