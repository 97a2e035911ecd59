#include "freight_tracking/tracking_facade.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/geo.hpp"

namespace freight_tracking {

namespace {

EtaOptions load_eta_options(LoadStatus status) {
    EtaOptions options{};
    options.consider_traffic = true;
    options.consider_weather = true;
    options.consider_hos = true;
    options.load_status = status;
    return options;
}

}  // namespace

TrackingFacade::TrackingFacade(PositionStorePtr store,
                               std::shared_ptr<PositionCache> cache,
                               std::shared_ptr<TrajectoryEngine> trajectories,
                               std::shared_ptr<EtaEngine> eta,
                               SubscriptionHubPtr hub,
                               LoadServicePtr loads,
                               FacadeConfig config,
                               ClockPtr clock)
    : store_(std::move(store)),
      cache_(std::move(cache)),
      trajectories_(std::move(trajectories)),
      eta_(std::move(eta)),
      hub_(std::move(hub)),
      loads_(std::move(loads)),
      config_(config),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (store_ == nullptr || cache_ == nullptr || trajectories_ == nullptr || eta_ == nullptr) {
        throw std::invalid_argument("TrackingFacade requires store, cache, trajectory and ETA engines");
    }
    if (hub_ == nullptr) {
        throw std::invalid_argument("TrackingFacade requires a subscription hub");
    }
    if (clock_ == nullptr) {
        throw std::invalid_argument("TrackingFacade requires a clock");
    }
}

std::optional<PositionSample> TrackingFacade::ingest(const PositionSample& sample) {
    PositionSample stored;
    try {
        stored = store_->append(sample);
    } catch (const ConflictError& error) {
        logger_->debug(R"({{"component":"tracking_facade","event":"duplicate_ignored","error":"{}"}})", error.what());
        return std::nullopt;
    }

    // Only replace the cached position with a newer observation.
    const std::optional<PositionSample> cached = cache_->get(stored.entity_id, stored.entity_type);
    if (!cached.has_value() || cached->recorded_at <= stored.recorded_at) {
        cache_->put(stored.entity_id, stored.entity_type, stored);
    }
    trajectories_->invalidate(stored.key());
    return stored;
}

std::vector<PositionSample> TrackingFacade::ingest_batch(const std::vector<PositionSample>& samples) {
    const TimePoint now = clock_->now();
    for (std::size_t index = 0; index < samples.size(); ++index) {
        PositionSample candidate = normalize_position_sample(samples[index]);
        candidate.created_at = now;
        try {
            validate_position_sample(candidate);
        } catch (const ValidationError& error) {
            throw ValidationError(fmt::format("Batch sample {} rejected: {}", index, error.what()));
        }
    }

    std::vector<PositionSample> list_stored;
    list_stored.reserve(samples.size());
    for (const PositionSample& sample : samples) {
        if (std::optional<PositionSample> stored = ingest(sample); stored.has_value()) {
            list_stored.push_back(std::move(*stored));
        }
    }
    logger_->info(R"({{"component":"tracking_facade","event":"batch_ingested","received":{},"stored":{}}})",
                  samples.size(),
                  list_stored.size());
    return list_stored;
}

std::optional<PositionSample> TrackingFacade::current_position(const std::string& entity_id,
                                                               EntityType entity_type,
                                                               bool bypass_cache) {
    return read_through(*cache_, *store_, entity_id, entity_type, deadline_after(config_.store_timeout), bypass_cache);
}

std::vector<PositionSample> TrackingFacade::position_history(const std::string& entity_id,
                                                             EntityType entity_type,
                                                             const RangeQuery& query) const {
    return store_->query_range(entity_id, entity_type, query, deadline_after(config_.store_timeout));
}

Trajectory TrackingFacade::trajectory(const std::string& entity_id,
                                      EntityType entity_type,
                                      std::optional<TimePoint> start,
                                      std::optional<TimePoint> end,
                                      double tolerance_deg,
                                      bool bypass_cache) {
    // Default windows end on the next whole minute so repeated calls share a cache key.
    const TimePoint window_end =
        end.value_or(std::chrono::time_point_cast<Milliseconds>(std::chrono::ceil<std::chrono::minutes>(clock_->now())));
    const TimePoint window_start =
        start.value_or(window_end - std::chrono::duration_cast<Milliseconds>(config_.default_trajectory_window));
    return trajectories_->cached_trajectory(entity_id,
                                            entity_type,
                                            window_start,
                                            window_end,
                                            tolerance_deg,
                                            deadline_after(config_.store_timeout),
                                            bypass_cache);
}

EtaResult TrackingFacade::estimate_eta(const std::string& entity_id,
                                       EntityType entity_type,
                                       double destination_latitude_deg,
                                       double destination_longitude_deg,
                                       const EtaOptions& options) const {
    return eta_->estimate(entity_id, entity_type, destination_latitude_deg, destination_longitude_deg, options);
}

double TrackingFacade::remaining_distance(const std::string& entity_id,
                                          EntityType entity_type,
                                          double destination_latitude_deg,
                                          double destination_longitude_deg,
                                          bool consider_traffic) const {
    return eta_->remaining_distance(entity_id,
                                    entity_type,
                                    destination_latitude_deg,
                                    destination_longitude_deg,
                                    consider_traffic);
}

std::vector<EntityEta> TrackingFacade::estimate_eta_many(const std::vector<std::string>& entity_ids,
                                                        EntityType entity_type,
                                                        double destination_latitude_deg,
                                                        double destination_longitude_deg,
                                                        const EtaOptions& options) const {
    if (entity_ids.empty()) {
        throw ValidationError("At least one entity id is required");
    }
    std::vector<EntityEta> list_etas;
    list_etas.reserve(entity_ids.size());
    for (const std::string& entity_id : entity_ids) {
        list_etas.push_back(EntityEta{
            entity_id,
            eta_->estimate(entity_id, entity_type, destination_latitude_deg, destination_longitude_deg, options)});
    }
    logger_->debug("Estimated {} ETAs to [{}, {}]", list_etas.size(), destination_latitude_deg, destination_longitude_deg);
    return list_etas;
}

std::vector<NearbyEntity> TrackingFacade::nearby_entities(const NearbyQuery& query) {
    if (!is_valid_latitude(query.center.latitude_deg) || !is_valid_longitude(query.center.longitude_deg)) {
        throw ValidationError("Nearby query center is out of range");
    }
    if (!std::isfinite(query.radius_km) || query.radius_km <= 0.0) {
        throw ValidationError("Nearby query radius must be a positive number of kilometres");
    }

    std::vector<NearbyEntity> list_nearby;
    for (PositionSample& position : store_->latest_positions(query.entity_type, deadline_after(config_.store_timeout))) {
        // A pushed position may be newer than the stored one.
        if (auto cached = cache_->get(position.entity_id, position.entity_type);
            cached.has_value() && cached->recorded_at > position.recorded_at) {
            position = std::move(*cached);
        }
        const double distance_km = haversine_distance_km(query.center, position.coordinate());
        if (distance_km <= query.radius_km) {
            list_nearby.push_back(NearbyEntity{std::move(position), distance_km});
        }
    }
    std::sort(list_nearby.begin(), list_nearby.end(), [](const NearbyEntity& left, const NearbyEntity& right) {
        return left.distance_km < right.distance_km;
    });
    if (list_nearby.size() > query.limit) {
        list_nearby.resize(query.limit);
    }
    logger_->debug("Found {} entities within {} km of [{}, {}]",
                   list_nearby.size(),
                   query.radius_km,
                   query.center.latitude_deg,
                   query.center.longitude_deg);
    return list_nearby;
}

std::optional<double> TrackingFacade::distance_between(const EntityKey& from, const EntityKey& to) {
    const std::optional<PositionSample> from_position = current_position(from.entity_id, from.entity_type);
    const std::optional<PositionSample> to_position = current_position(to.entity_id, to.entity_type);
    if (!from_position.has_value() || !to_position.has_value()) {
        logger_->warn("No distance between {} and {}: position unknown",
                      to_subscription_key(from),
                      to_subscription_key(to));
        return std::nullopt;
    }
    return haversine_distance_km(from_position->coordinate(), to_position->coordinate());
}

std::optional<double> TrackingFacade::distance_to_point(const EntityKey& from, double latitude_deg, double longitude_deg) {
    if (!is_valid_latitude(latitude_deg) || !is_valid_longitude(longitude_deg)) {
        throw ValidationError(fmt::format("Point [{}, {}] is out of range", latitude_deg, longitude_deg));
    }
    const std::optional<PositionSample> from_position = current_position(from.entity_id, from.entity_type);
    if (!from_position.has_value()) {
        logger_->warn("No distance from {}: position unknown", to_subscription_key(from));
        return std::nullopt;
    }
    return haversine_distance_km(from_position->coordinate(), GeodeticCoordinate{latitude_deg, longitude_deg});
}

double TrackingFacade::distance_travelled(const std::string& entity_id,
                                          EntityType entity_type,
                                          TimePoint start,
                                          TimePoint end) const {
    RangeQuery query{};
    query.start = start;
    query.end = end;
    const std::vector<PositionSample> list_samples =
        store_->query_range(entity_id, entity_type, query, deadline_after(config_.store_timeout));

    std::vector<GeodeticCoordinate> list_path;
    list_path.reserve(list_samples.size());
    for (const PositionSample& sample : list_samples) {
        list_path.push_back(sample.coordinate());
    }
    return path_length_km(list_path);
}

double TrackingFacade::average_speed(const std::string& entity_id,
                                     EntityType entity_type,
                                     TimePoint start,
                                     TimePoint end) const {
    const double distance_km = distance_travelled(entity_id, entity_type, start, end);
    const std::chrono::duration<double, std::ratio<3600>> window_hours = end - start;
    if (window_hours.count() <= 0.0) {
        return 0.0;
    }
    return distance_km / window_hours.count();
}

Unsubscribe TrackingFacade::subscribe(const std::string& entity_id,
                                      EntityType entity_type,
                                      PositionListener on_update,
                                      ErrorListener on_error) {
    return hub_->subscribe(entity_id, entity_type, std::move(on_update), std::move(on_error));
}

Unsubscribe TrackingFacade::subscribe_load_updates(const std::string& load_id,
                                                   PositionListener on_position,
                                                   LoadStatusListener on_status,
                                                   ErrorListener on_error) {
    if (loads_ == nullptr) {
        throw std::logic_error("TrackingFacade has no load service");
    }

    LoadWithAssignments load;
    try {
        load = loads_->get_load_by_id(load_id);
    } catch (const TrackingError& error) {
        logger_->error(R"({{"component":"tracking_facade","event":"load_lookup_failed","load_id":"{}","error":"{}"}})",
                       load_id,
                       error.what());
        if (on_error) {
            on_error(error);
        }
        return [] {};
    }

    Unsubscribe unsubscribe_position;
    if (const std::optional<LoadAssignment> assignment = load.active_assignment(); assignment.has_value()) {
        unsubscribe_position = hub_->subscribe(assignment->vehicle_id, EntityType::Vehicle, std::move(on_position), on_error);
    }
    Unsubscribe unsubscribe_status = hub_->subscribe_load_status(load_id, std::move(on_status), std::move(on_error));

    auto flag_released = std::make_shared<std::atomic<bool>>(false);
    return [flag_released, unsubscribe_position = std::move(unsubscribe_position),
            unsubscribe_status = std::move(unsubscribe_status)]() {
        if (flag_released->exchange(true)) {
            return;
        }
        if (unsubscribe_position) {
            unsubscribe_position();
        }
        unsubscribe_status();
    };
}

LoadTracking TrackingFacade::load_tracking(const std::string& load_id) {
    if (loads_ == nullptr) {
        throw std::logic_error("TrackingFacade has no load service");
    }
    const LoadWithAssignments load = loads_->get_load_by_id(load_id);

    LoadTracking tracking{};
    tracking.load_id = load.load_id.empty() ? load_id : load.load_id;
    tracking.status = load.status;
    if (!load.is_trackable()) {
        return tracking;
    }
    tracking.assignment = load.active_assignment();
    if (!tracking.assignment.has_value()) {
        return tracking;
    }
    const std::string& vehicle_id = tracking.assignment->vehicle_id;

    try {
        tracking.position = current_position(vehicle_id, EntityType::Vehicle);
    } catch (const TrackingError& error) {
        logger_->warn(R"({{"component":"tracking_facade","event":"position_unavailable","load_id":"{}","error":"{}"}})",
                      load_id,
                      error.what());
    }

    const std::optional<LoadLocation> delivery = load.first_location(LocationType::Delivery);
    if (tracking.position.has_value() && delivery.has_value()) {
        try {
            tracking.eta = eta_->estimate(vehicle_id,
                                          EntityType::Vehicle,
                                          delivery->coordinates.latitude_deg,
                                          delivery->coordinates.longitude_deg,
                                          load_eta_options(load.status));
        } catch (const TrackingError& error) {
            logger_->warn(R"({{"component":"tracking_facade","event":"eta_unavailable","load_id":"{}","error":"{}"}})",
                          load_id,
                          error.what());
        }
    }

    tracking.route = try_recent_trajectory(vehicle_id, k_default_simplification_tolerance_deg, "load_tracking");
    return tracking;
}

RouteVisualization TrackingFacade::route_visualization(const std::string& load_id,
                                                       bool include_stops,
                                                       double tolerance_deg) {
    if (loads_ == nullptr) {
        throw std::logic_error("TrackingFacade has no load service");
    }
    const LoadWithAssignments load = loads_->get_load_by_id(load_id);
    const std::optional<LoadLocation> pickup = load.first_location(LocationType::Pickup);
    const std::optional<LoadLocation> delivery = load.first_location(LocationType::Delivery);
    if (!pickup.has_value() || !delivery.has_value()) {
        throw ValidationError(fmt::format("Load {} is missing its pickup or delivery location", load_id));
    }

    RouteVisualization visualization{};
    visualization.load_id = load_id;

    if (const std::optional<LoadAssignment> assignment = load.active_assignment(); assignment.has_value()) {
        try {
            if (const auto position = current_position(assignment->vehicle_id, EntityType::Vehicle);
                position.has_value()) {
                visualization.markers.push_back(
                    RouteMarker{MarkerKind::Vehicle, position->coordinate(), assignment->vehicle_id});
            }
        } catch (const TrackingError& error) {
            logger_->warn(
                R"({{"component":"tracking_facade","event":"position_unavailable","load_id":"{}","error":"{}"}})",
                load_id,
                error.what());
        }
        visualization.trajectory = try_recent_trajectory(assignment->vehicle_id, tolerance_deg, "route_visualization");
    }

    if (visualization.trajectory.has_value() && !visualization.trajectory->empty()) {
        for (const PositionSample& point : visualization.trajectory->points) {
            visualization.path.push_back(point.coordinate());
        }
        visualization.path_from_trajectory = true;
    } else {
        visualization.path = {pickup->coordinates, delivery->coordinates};
    }

    visualization.markers.push_back(RouteMarker{MarkerKind::Pickup, pickup->coordinates, pickup->facility_name});
    visualization.markers.push_back(RouteMarker{MarkerKind::Delivery, delivery->coordinates, delivery->facility_name});
    if (include_stops) {
        for (const LoadLocation& location : load.locations) {
            if (location.location_type == LocationType::Stop) {
                visualization.markers.push_back(
                    RouteMarker{MarkerKind::Stop, location.coordinates, location.facility_name});
            }
        }
    }
    return visualization;
}

void TrackingFacade::clear_position_cache(const EntityKey& entity) {
    cache_->invalidate(entity.entity_id, entity.entity_type);
}

std::size_t TrackingFacade::clear_trajectory_cache(const EntityKey& entity) {
    return trajectories_->invalidate(entity);
}

PartitionMaintenanceReport TrackingFacade::run_partition_maintenance(TimePoint now, std::optional<int> retention_months) {
    PartitionMaintenanceReport report{};
    report.created = store_->ensure_upcoming_partition(now);
    report.dropped = store_->prune_old_partitions(now, retention_months.value_or(config_.retention_months));
    logger_->info(R"({{"component":"tracking_facade","event":"partition_maintenance","created":{},"dropped":{}}})",
                  report.created,
                  report.dropped);
    return report;
}

std::optional<Trajectory> TrackingFacade::try_recent_trajectory(const std::string& vehicle_id,
                                                                double tolerance_deg,
                                                                std::string_view purpose) {
    try {
        return trajectory(vehicle_id, EntityType::Vehicle, std::nullopt, std::nullopt, tolerance_deg);
    } catch (const TrackingError& error) {
        logger_->warn(R"({{"component":"tracking_facade","event":"trajectory_unavailable","purpose":"{}","vehicle_id":"{}","error":"{}"}})",
                      purpose,
                      vehicle_id,
                      error.what());
        return std::nullopt;
    }
}

}  // namespace freight_tracking
