// === ETA Engine ==============================================================
//
// Estimates arrival time and remaining distance from an entity's current
// position. Speed blends the reported current speed with the entity's recent
// history; optional modifiers account for traffic, weather, driver habits,
// and hours-of-service breaks.

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "freight_tracking/clock.hpp"
#include "freight_tracking/load_service.hpp"
#include "freight_tracking/logging.hpp"
#include "freight_tracking/position_cache.hpp"
#include "freight_tracking/position_store.hpp"
#include "freight_tracking/routing_service.hpp"

namespace freight_tracking {

inline constexpr double k_default_speed_kmh{65.0};
inline constexpr double k_default_min_speed_kmh{5.0};

/** @brief Which modifiers an estimate should apply. */
struct EtaOptions final {
    bool consider_traffic{true};
    bool consider_weather{false};
    bool consider_hos{false};
    bool consider_driver_patterns{true};
    bool use_historical_data{true};
    std::optional<LoadStatus> load_status{};  /**< Adjusts confidence only. */
};

/** @brief Inputs that shaped an estimate; absent when not applied. */
struct EtaFactors final {
    std::optional<double> current_speed_kmh{};
    std::optional<double> historical_speed_kmh{};
    std::optional<double> traffic_factor{};
    std::optional<double> weather_factor{};
    std::optional<double> driver_factor{};
    double effective_speed_kmh{};
    double hos_delay_min{};
};

/** @brief Outcome of one ETA computation. */
struct EtaResult final {
    TimePoint arrival_time{};
    double remaining_distance_km{};
    double estimated_duration_min{};
    double confidence{};             /**< In [0.5, 0.95]. */
    EtaFactors factors{};
    bool used_route_data{false};     /**< Distance came from the routing service. */
};

/** @brief Tunables of the ETA engine. */
struct EtaConfig final {
    double min_speed_kmh{k_default_min_speed_kmh};
    std::size_t trailing_samples{10};
    std::chrono::hours history_window{24 * 30};
    Milliseconds store_timeout{2'000};
};

/** @brief Driver-habit multiplier on travel time, in [0.9, 1.09]. */
[[nodiscard]] double driver_pattern_factor(const std::string& entity_id) noexcept;

/** @brief Extra minutes of mandatory rest for @p driving_hours of driving. */
[[nodiscard]] double hours_of_service_delay_min(double driving_hours) noexcept;

class EtaEngine final {
  public:
    EtaEngine(PositionStorePtr store,
              std::shared_ptr<PositionCache> cache,
              RoutingServicePtr routing = nullptr,
              EtaConfig config = {},
              ClockPtr clock = default_clock());

    /**
     * @brief Estimate arrival at the destination.
     *
     * Throws ValidationError for out-of-range destination coordinates and
     * PositionUnavailableError when the entity has no known position. Routing
     * and history failures degrade the estimate instead of failing it.
     */
    [[nodiscard]] EtaResult estimate(const std::string& entity_id,
                                     EntityType entity_type,
                                     double destination_latitude_deg,
                                     double destination_longitude_deg,
                                     const EtaOptions& options = {}) const;

    /** @brief Distance component of estimate() alone, in kilometres. */
    [[nodiscard]] double remaining_distance(const std::string& entity_id,
                                            EntityType entity_type,
                                            double destination_latitude_deg,
                                            double destination_longitude_deg,
                                            bool consider_traffic = true) const;

    [[nodiscard]] const EtaConfig& config() const noexcept { return config_; }

  private:
    [[nodiscard]] PositionSample require_position(const std::string& entity_id, EntityType entity_type) const;
    [[nodiscard]] std::optional<double> historical_speed_kmh(const std::string& entity_id,
                                                             EntityType entity_type) const;
    [[nodiscard]] std::optional<RouteEstimate> try_route(const GeodeticCoordinate& origin,
                                                         const GeodeticCoordinate& destination) const;

    PositionStorePtr store_;
    std::shared_ptr<PositionCache> cache_;
    RoutingServicePtr routing_;
    EtaConfig config_;
    ClockPtr clock_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace freight_tracking
