#include <cstdlib>
#include <filesystem>
#include <string>

#include <catch2/catch.hpp>

#include "freight_tracking/configuration.hpp"
#include "logging_test_fixture.hpp"

using namespace freight_tracking;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    freight_tracking::test::ensure_logger_initialized();
    return true;
}();

constexpr const char* k_variables[] = {
    "FREIGHT_TRACKING_LOG_LEVEL",
    "FREIGHT_TRACKING_UPSTREAM_URL",
    "FREIGHT_TRACKING_POSITION_TTL_S",
    "FREIGHT_TRACKING_TRAJECTORY_TTL_S",
    "FREIGHT_TRACKING_MAX_RECONNECT_ATTEMPTS",
    "FREIGHT_TRACKING_RECONNECT_BASE_MS",
    "FREIGHT_TRACKING_RECONNECT_CAP_MS",
    "FREIGHT_TRACKING_RETENTION_MONTHS",
    "FREIGHT_TRACKING_STORE_TIMEOUT_MS",
    "FREIGHT_TRACKING_MIN_SPEED_KMH",
    "FREIGHT_TRACKING_UNIQUE_SOURCE_LOG",
    "FREIGHT_TRACKING_WATCH",
};

/** @brief Clears the tracking variables on entry and exit. */
struct EnvironmentGuard {
    EnvironmentGuard() {
        clear();
        const auto log_dir = std::filesystem::temp_directory_path() / "freight_tracking_tests_logs";
        ::setenv("FREIGHT_TRACKING_LOG_DIR", log_dir.string().c_str(), 1);
    }
    ~EnvironmentGuard() { clear(); }

    static void clear() {
        for (const char* name : k_variables) {
            ::unsetenv(name);
        }
    }
};
}  // namespace

TEST_CASE("ConfigurationLoader applies defaults for an empty environment") {
    EnvironmentGuard guard;
    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.log_level == "info");
    REQUIRE(config.upstream_url == "ws://localhost:8080/tracking");
    REQUIRE(config.position_ttl == Milliseconds{30'000});
    REQUIRE(config.trajectory_ttl == Milliseconds{60'000});
    REQUIRE(config.hub.max_retries == 5);
    REQUIRE(config.hub.reconnect_base == Milliseconds{1'000});
    REQUIRE(config.hub.reconnect_cap == Milliseconds{5'000});
    REQUIRE(config.retention_months == 3);
    REQUIRE(config.store_timeout == Milliseconds{2'000});
    REQUIRE(config.min_speed_kmh == Approx(5.0));
    REQUIRE_FALSE(config.unique_source_log);
    REQUIRE(config.watched_entities.empty());
}

TEST_CASE("ConfigurationLoader reads overrides and ignores bad values") {
    EnvironmentGuard guard;
    ::setenv("FREIGHT_TRACKING_UPSTREAM_URL", "ws://tracking.internal:9000/push", 1);
    ::setenv("FREIGHT_TRACKING_POSITION_TTL_S", "10", 1);
    ::setenv("FREIGHT_TRACKING_TRAJECTORY_TTL_S", "-4", 1);
    ::setenv("FREIGHT_TRACKING_RETENTION_MONTHS", "six", 1);
    ::setenv("FREIGHT_TRACKING_MIN_SPEED_KMH", "12.5", 1);
    ::setenv("FREIGHT_TRACKING_UNIQUE_SOURCE_LOG", "Yes", 1);
    ::setenv("FREIGHT_TRACKING_RECONNECT_BASE_MS", "8000", 1);
    ::setenv("FREIGHT_TRACKING_WATCH", "VEHICLE:truck-1, SMART_HUB:hub_7", 1);

    const Configuration config = ConfigurationLoader::load();
    REQUIRE(config.upstream_url == "ws://tracking.internal:9000/push");
    REQUIRE(config.position_ttl == Milliseconds{10'000});
    REQUIRE(config.trajectory_ttl == Milliseconds{60'000});
    REQUIRE(config.retention_months == 3);
    REQUIRE(config.min_speed_kmh == Approx(12.5));
    REQUIRE(config.unique_source_log);
    REQUIRE(config.hub.reconnect_base == Milliseconds{8'000});
    REQUIRE(config.hub.reconnect_cap == Milliseconds{8'000});
    REQUIRE(config.watched_entities.size() == 2);
    REQUIRE(config.watched_entities[1] == EntityKey{EntityType::SmartHub, "hub_7"});
}

TEST_CASE("Watch lists skip malformed entries") {
    const auto list_entities = ConfigurationLoader::parse_watch_list("DRIVER:d-1,,TRAILER:t-9, VEHICLE:, nonsense ,LOAD:l-4");
    REQUIRE(list_entities.size() == 2);
    REQUIRE(list_entities[0] == EntityKey{EntityType::Driver, "d-1"});
    REQUIRE(list_entities[1] == EntityKey{EntityType::Load, "l-4"});
}
