// === Routing Service =========================================================
//
// Optional collaborator supplying road distance and travel time. When none is
// configured the ETA engine falls back to great-circle distance.

#pragma once

#include <memory>
#include <optional>

#include "freight_tracking/types.hpp"

namespace freight_tracking {

/** @brief Road-network answer for one origin/destination pair. */
struct RouteEstimate final {
    double distance_km{};                   /**< Driving distance. */
    double duration_min{};                  /**< Free-flow driving time. */
    std::optional<double> duration_in_traffic_min{};  /**< Driving time under current traffic, when known. */
};

/** @brief Road routing provider. Implementations may block on network I/O. */
class RoutingService {
  public:
    virtual ~RoutingService() = default;

    /**
     * @brief Route between two coordinates.
     *
     * May throw TimeoutError or any TrackingError; the ETA engine then falls
     * back to great-circle distance.
     */
    [[nodiscard]] virtual RouteEstimate route_distance(const GeodeticCoordinate& origin,
                                                       const GeodeticCoordinate& destination) = 0;

    /** @brief Multiplicative delay for weather along the route; 1.0 when unknown. */
    [[nodiscard]] virtual double weather_delay_factor(const GeodeticCoordinate& origin,
                                                      const GeodeticCoordinate& destination) {
        (void)origin;
        (void)destination;
        return 1.0;
    }
};

using RoutingServicePtr = std::shared_ptr<RoutingService>;

}  // namespace freight_tracking
