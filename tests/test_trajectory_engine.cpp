#include <algorithm>
#include <chrono>
#include <memory>
#include <vector>

#include <catch2/catch.hpp>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/geo.hpp"
#include "freight_tracking/partitioned_position_store.hpp"
#include "freight_tracking/trajectory_engine.hpp"
#include "logging_test_fixture.hpp"
#include "tracking_fakes.hpp"

using namespace freight_tracking;
using freight_tracking::test::make_sample;
using freight_tracking::test::reference_time;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    freight_tracking::test::ensure_logger_initialized();
    return true;
}();

std::vector<GeodeticCoordinate> noisy_track() {
    // Eastbound along the equator with a small wobble and one real detour.
    return {
        {0.0, 0.000},   {0.00002, 0.001}, {-0.00003, 0.002}, {0.00001, 0.003}, {0.0050, 0.004},
        {0.00002, 0.005}, {-0.00001, 0.006}, {0.00003, 0.007}, {0.0, 0.008},
    };
}
}  // namespace

TEST_CASE("Douglas-Peucker keeps endpoints and drops collinear points") {
    const std::vector<GeodeticCoordinate> straight{{0.0, 0.0}, {0.0, 0.001}, {0.0, 0.002}, {0.0, 0.003}};
    REQUIRE(douglas_peucker_indices(straight, 0.0001) == std::vector<std::size_t>{0, 3});

    REQUIRE(douglas_peucker_indices({}, 0.0001).empty());
    REQUIRE(douglas_peucker_indices({{1.0, 1.0}}, 0.0001) == std::vector<std::size_t>{0});
    REQUIRE(douglas_peucker_indices({{1.0, 1.0}, {1.0, 1.0}}, 0.0001) == std::vector<std::size_t>{0, 1});
}

TEST_CASE("Douglas-Peucker dropped points stay within tolerance of the retained path") {
    const std::vector<GeodeticCoordinate> track = noisy_track();
    const double tolerance = 0.0001;
    const std::vector<std::size_t> kept = douglas_peucker_indices(track, tolerance);

    REQUIRE(kept.front() == 0);
    REQUIRE(kept.back() == track.size() - 1);
    REQUIRE(kept.size() < track.size());
    // The detour is well outside the tolerance and must survive.
    REQUIRE(std::find(kept.begin(), kept.end(), std::size_t{4}) != kept.end());

    for (std::size_t segment = 1; segment < kept.size(); ++segment) {
        for (std::size_t index = kept[segment - 1] + 1; index < kept[segment]; ++index) {
            const double deviation =
                planar_segment_distance_deg(track[index], track[kept[segment - 1]], track[kept[segment]]);
            REQUIRE(deviation <= tolerance);
        }
    }

    SECTION("zero tolerance keeps every non-collinear point") {
        REQUIRE(douglas_peucker_indices(track, 0.0).size() == track.size());
    }
}

TEST_CASE("TrajectoryEngine builds a simplified path from stored samples") {
    auto clock = std::make_shared<ManualClock>(reference_time());
    auto store = std::make_shared<PartitionedPositionStore>(PartitionedStoreConfig{}, clock);
    TrajectoryEngine engine{store, Milliseconds{60'000}, clock};

    const std::vector<GeodeticCoordinate> track = noisy_track();
    const TimePoint start = reference_time() - Milliseconds{600'000};
    for (std::size_t index = 0; index < track.size(); ++index) {
        store->append(make_sample("truck-1",
                                  track[index].latitude_deg,
                                  track[index].longitude_deg,
                                  start + Milliseconds{static_cast<long long>(index) * 60'000}));
    }

    const Trajectory trajectory = engine.build_trajectory(
        "truck-1", EntityType::Vehicle, start, reference_time(), 0.0001, deadline_after(Milliseconds{1'000}));
    REQUIRE(trajectory.raw_point_count == track.size());
    REQUIRE(trajectory.points.size() < track.size());
    REQUIRE(trajectory.points.front().recorded_at == start);
    REQUIRE(trajectory.points.back().longitude_deg == Approx(0.008));
    for (std::size_t index = 1; index < trajectory.points.size(); ++index) {
        REQUIRE(trajectory.points[index - 1].recorded_at < trajectory.points[index].recorded_at);
    }

    SECTION("an empty window yields an empty trajectory") {
        const Trajectory empty = engine.build_trajectory("truck-1",
                                                         EntityType::Vehicle,
                                                         reference_time() - Milliseconds{10 * 3'600'000LL},
                                                         reference_time() - Milliseconds{9 * 3'600'000LL},
                                                         0.0001,
                                                         deadline_after(Milliseconds{1'000}));
        REQUIRE(empty.empty());
        REQUIRE(empty.raw_point_count == 0);
    }

    SECTION("an unknown entity is reported") {
        REQUIRE_THROWS_AS(engine.build_trajectory("ghost",
                                                  EntityType::Vehicle,
                                                  start,
                                                  reference_time(),
                                                  0.0001,
                                                  deadline_after(Milliseconds{1'000})),
                          NotFoundError);
    }

    SECTION("a negative tolerance is rejected") {
        REQUIRE_THROWS_AS(engine.build_trajectory("truck-1",
                                                  EntityType::Vehicle,
                                                  start,
                                                  reference_time(),
                                                  -1.0,
                                                  deadline_after(Milliseconds{1'000})),
                          ValidationError);
    }
}

TEST_CASE("TrajectoryEngine caches per window until invalidated or expired") {
    auto clock = std::make_shared<ManualClock>(reference_time());
    auto store = std::make_shared<PartitionedPositionStore>(PartitionedStoreConfig{}, clock);
    TrajectoryEngine engine{store, Milliseconds{60'000}, clock};

    const TimePoint start = reference_time() - Milliseconds{3'600'000};
    store->append(make_sample("truck-1", 1.0, 1.0, start + Milliseconds{1'000}));
    store->append(make_sample("truck-1", 1.1, 1.1, start + Milliseconds{2'000}));

    const auto fetch = [&](bool bypass) {
        return engine.cached_trajectory(
            "truck-1", EntityType::Vehicle, start, reference_time(), 0.0001, deadline_after(Milliseconds{1'000}), bypass);
    };

    REQUIRE(fetch(false).raw_point_count == 2);
    store->append(make_sample("truck-1", 1.2, 1.3, start + Milliseconds{3'000}));
    REQUIRE(fetch(false).raw_point_count == 2);
    REQUIRE(fetch(true).raw_point_count == 3);

    store->append(make_sample("truck-1", 1.4, 1.2, start + Milliseconds{4'000}));
    REQUIRE(engine.invalidate(EntityKey{EntityType::Vehicle, "truck-1"}) == 1);
    REQUIRE(fetch(false).raw_point_count == 4);

    store->append(make_sample("truck-1", 1.5, 1.6, start + Milliseconds{5'000}));
    clock->advance(Milliseconds{60'000});
    REQUIRE(fetch(false).raw_point_count == 5);
}

TEST_CASE("TrajectoryEngine sweeps expired windows on every cache write") {
    auto clock = std::make_shared<ManualClock>(reference_time());
    auto store = std::make_shared<PartitionedPositionStore>(PartitionedStoreConfig{}, clock);
    TrajectoryEngine engine{store, Milliseconds{60'000}, clock};
    store->append(make_sample("truck-1", 1.0, 1.0, reference_time() - Milliseconds{1'000}));

    for (int step = 0; step < 50; ++step) {
        const TimePoint end = clock->now();
        (void)engine.cached_trajectory("truck-1",
                                       EntityType::Vehicle,
                                       end - Milliseconds{3'600'000},
                                       end,
                                       0.0001,
                                       deadline_after(Milliseconds{1'000}));
        clock->advance(Milliseconds{30'000});
    }
    REQUIRE(engine.cached_count() <= 2);

    clock->advance(Milliseconds{60'000});
    REQUIRE(engine.purge_expired() >= 1);
    REQUIRE(engine.cached_count() == 0);
}
