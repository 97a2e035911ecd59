// === Tracking Facade =========================================================
//
// Public entry point of the tracking core. Combines the position store and
// cache, the trajectory and ETA engines, the subscription hub, and the load
// service into entity-centric and load-centric operations.

#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "freight_tracking/clock.hpp"
#include "freight_tracking/eta_engine.hpp"
#include "freight_tracking/load_service.hpp"
#include "freight_tracking/logging.hpp"
#include "freight_tracking/position_cache.hpp"
#include "freight_tracking/position_store.hpp"
#include "freight_tracking/subscription_hub.hpp"
#include "freight_tracking/trajectory_engine.hpp"

namespace freight_tracking {

/** @brief Facade defaults. */
struct FacadeConfig final {
    Milliseconds store_timeout{2'000};
    std::chrono::hours default_trajectory_window{24};
    int retention_months{3};
};

/** @brief Comprehensive tracking view of a load; every field is independently optional. */
struct LoadTracking final {
    std::string load_id{};
    LoadStatus status{LoadStatus::Created};
    std::optional<LoadAssignment> assignment{};
    std::optional<PositionSample> position{};
    std::optional<EtaResult> eta{};
    std::optional<Trajectory> route{};
};

enum class MarkerKind {
    Vehicle,
    Pickup,
    Delivery,
    Stop
};

struct RouteMarker final {
    MarkerKind kind{MarkerKind::Stop};
    GeodeticCoordinate coordinates{};
    std::string label{};
};

/** @brief Map-ready route of a load. */
struct RouteVisualization final {
    std::string load_id{};
    std::vector<GeodeticCoordinate> path{};  /**< Vehicle trajectory, or pickup-to-delivery line. */
    bool path_from_trajectory{false};
    std::optional<Trajectory> trajectory{};
    std::vector<RouteMarker> markers{};
};

/** @brief Entities whose latest position lies within @p radius_km of @p center. */
struct NearbyQuery final {
    GeodeticCoordinate center{};
    double radius_km{};
    std::optional<EntityType> entity_type{};
    std::size_t limit{std::numeric_limits<std::size_t>::max()};
};

struct NearbyEntity final {
    PositionSample position{};
    double distance_km{};
};

struct EntityEta final {
    std::string entity_id{};
    EtaResult eta{};
};

struct PartitionMaintenanceReport final {
    std::size_t created{};
    std::size_t dropped{};
};

class TrackingFacade final {
  public:
    TrackingFacade(PositionStorePtr store,
                   std::shared_ptr<PositionCache> cache,
                   std::shared_ptr<TrajectoryEngine> trajectories,
                   std::shared_ptr<EtaEngine> eta,
                   SubscriptionHubPtr hub,
                   LoadServicePtr loads,
                   FacadeConfig config = {},
                   ClockPtr clock = default_clock());

    /**
     * @brief Persist a sample, refresh the cache, and drop stale trajectories.
     *
     * A duplicate under the uniqueness constraint is a no-op returning
     * nothing; validation errors propagate.
     */
    std::optional<PositionSample> ingest(const PositionSample& sample);

    /**
     * @brief Persist several samples.
     *
     * Every sample is validated before any is written, so one malformed
     * sample rejects the whole batch with ValidationError. Duplicates are
     * skipped. Returns the stored records in input order.
     */
    std::vector<PositionSample> ingest_batch(const std::vector<PositionSample>& samples);

    /** @brief Cached position, falling back to the store. */
    [[nodiscard]] std::optional<PositionSample> current_position(const std::string& entity_id,
                                                                 EntityType entity_type,
                                                                 bool bypass_cache = false);

    [[nodiscard]] std::vector<PositionSample> position_history(const std::string& entity_id,
                                                               EntityType entity_type,
                                                               const RangeQuery& query) const;

    /** @brief Simplified path; the window defaults to the 24 hours up to the next whole minute. */
    [[nodiscard]] Trajectory trajectory(const std::string& entity_id,
                                        EntityType entity_type,
                                        std::optional<TimePoint> start = std::nullopt,
                                        std::optional<TimePoint> end = std::nullopt,
                                        double tolerance_deg = k_default_simplification_tolerance_deg,
                                        bool bypass_cache = false);

    [[nodiscard]] EtaResult estimate_eta(const std::string& entity_id,
                                         EntityType entity_type,
                                         double destination_latitude_deg,
                                         double destination_longitude_deg,
                                         const EtaOptions& options = {}) const;

    [[nodiscard]] double remaining_distance(const std::string& entity_id,
                                            EntityType entity_type,
                                            double destination_latitude_deg,
                                            double destination_longitude_deg,
                                            bool consider_traffic = true) const;

    /** @brief Same destination for several entities; any entity's failure propagates. */
    [[nodiscard]] std::vector<EntityEta> estimate_eta_many(const std::vector<std::string>& entity_ids,
                                                           EntityType entity_type,
                                                           double destination_latitude_deg,
                                                           double destination_longitude_deg,
                                                           const EtaOptions& options = {}) const;

    /** @brief Latest positions within the radius, nearest first. */
    [[nodiscard]] std::vector<NearbyEntity> nearby_entities(const NearbyQuery& query);

    /** @brief Great-circle km between two entities' current positions; empty when either is unknown. */
    [[nodiscard]] std::optional<double> distance_between(const EntityKey& from, const EntityKey& to);
    [[nodiscard]] std::optional<double> distance_to_point(const EntityKey& from,
                                                          double latitude_deg,
                                                          double longitude_deg);

    /** @brief Kilometres covered by consecutive samples in `[start, end]`. */
    [[nodiscard]] double distance_travelled(const std::string& entity_id,
                                            EntityType entity_type,
                                            TimePoint start,
                                            TimePoint end) const;

    /** @brief distance_travelled() over the window length, in km/h; zero for an empty window. */
    [[nodiscard]] double average_speed(const std::string& entity_id,
                                       EntityType entity_type,
                                       TimePoint start,
                                       TimePoint end) const;

    [[nodiscard]] Unsubscribe subscribe(const std::string& entity_id,
                                        EntityType entity_type,
                                        PositionListener on_update,
                                        ErrorListener on_error = {});

    /**
     * @brief Follow a load: its active vehicle's positions plus its status.
     *
     * A failed load lookup is reported through @p on_error and yields a no-op
     * unsubscribe.
     */
    [[nodiscard]] Unsubscribe subscribe_load_updates(const std::string& load_id,
                                                     PositionListener on_position,
                                                     LoadStatusListener on_status,
                                                     ErrorListener on_error = {});

    /** @brief Position, ETA to delivery, and route of the load's active vehicle. Throws NotFoundError for unknown loads. */
    [[nodiscard]] LoadTracking load_tracking(const std::string& load_id);

    /** @brief Route and markers for a map. Throws ValidationError when pickup or delivery is missing. */
    [[nodiscard]] RouteVisualization route_visualization(const std::string& load_id,
                                                         bool include_stops = false,
                                                         double tolerance_deg = k_default_simplification_tolerance_deg);

    void clear_position_cache(const EntityKey& entity);
    std::size_t clear_trajectory_cache(const EntityKey& entity);

    /** @brief Create next month's partition and prune beyond the retention window. */
    PartitionMaintenanceReport run_partition_maintenance(TimePoint now, std::optional<int> retention_months = std::nullopt);

  private:
    [[nodiscard]] std::optional<Trajectory> try_recent_trajectory(const std::string& vehicle_id,
                                                                  double tolerance_deg,
                                                                  std::string_view purpose);

    PositionStorePtr store_;
    std::shared_ptr<PositionCache> cache_;
    std::shared_ptr<TrajectoryEngine> trajectories_;
    std::shared_ptr<EtaEngine> eta_;
    SubscriptionHubPtr hub_;
    LoadServicePtr loads_;
    FacadeConfig config_;
    ClockPtr clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace freight_tracking
