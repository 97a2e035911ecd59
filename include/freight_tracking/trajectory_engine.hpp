// === Trajectory Engine =======================================================
//
// Builds simplified polylines from raw position history for map rendering.
// Simplification is Douglas-Peucker over longitude/latitude treated as planar
// axes, so the tolerance is expressed in degrees.

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "freight_tracking/clock.hpp"
#include "freight_tracking/logging.hpp"
#include "freight_tracking/position_store.hpp"
#include "freight_tracking/ttl_cache.hpp"

namespace freight_tracking {

inline constexpr double k_default_simplification_tolerance_deg{0.0001};
inline constexpr Milliseconds k_default_trajectory_ttl{60'000};

/** @brief Time-ordered, simplified path of one entity over a window. */
struct Trajectory final {
    EntityKey entity{};
    TimePoint window_start{};
    TimePoint window_end{};
    double tolerance_deg{};
    std::size_t raw_point_count{};          /**< Samples before simplification. */
    std::vector<PositionSample> points{};   /**< Retained samples, oldest first. */

    [[nodiscard]] bool empty() const noexcept { return points.empty(); }
};

/**
 * @brief Indices of the points Douglas-Peucker keeps at @p tolerance_deg.
 *
 * Always contains the first and last index for non-empty input; indices are
 * ascending. Every dropped point lies within @p tolerance_deg of the segment
 * joining its retained neighbours.
 */
[[nodiscard]] std::vector<std::size_t> douglas_peucker_indices(const std::vector<GeodeticCoordinate>& points,
                                                               double tolerance_deg);

/** @brief Subset of @p samples retained by Douglas-Peucker. */
[[nodiscard]] std::vector<PositionSample> simplify_samples(const std::vector<PositionSample>& samples,
                                                           double tolerance_deg);

/** @brief Trajectory builder with a short-lived result cache. */
class TrajectoryEngine final {
  public:
    TrajectoryEngine(PositionStorePtr store,
                     Milliseconds cache_ttl = k_default_trajectory_ttl,
                     ClockPtr clock = default_clock());

    /**
     * @brief Fetch `[start, end]` from the store and simplify it.
     *
     * A known entity with no samples in range yields an empty trajectory; an
     * entity never seen by the store throws NotFoundError. Throws
     * ValidationError for a negative tolerance or inverted window.
     */
    [[nodiscard]] Trajectory build_trajectory(const std::string& entity_id,
                                              EntityType entity_type,
                                              TimePoint start,
                                              TimePoint end,
                                              double tolerance_deg,
                                              Deadline deadline) const;

    /** @brief build_trajectory behind the trajectory cache. */
    [[nodiscard]] Trajectory cached_trajectory(const std::string& entity_id,
                                               EntityType entity_type,
                                               TimePoint start,
                                               TimePoint end,
                                               double tolerance_deg,
                                               Deadline deadline,
                                               bool bypass_cache = false);

    /** @brief Drop every cached trajectory of the entity; returns entries removed. */
    std::size_t invalidate(const EntityKey& entity);

    /** @brief Drop expired trajectories; also runs on every cache write. */
    std::size_t purge_expired();

    /** @brief Cached trajectories, expired ones included. */
    [[nodiscard]] std::size_t cached_count() const;

  private:
    struct CacheKey final {
        EntityKey entity{};
        TimePoint window_start{};
        TimePoint window_end{};
        double tolerance_deg{};

        friend bool operator==(const CacheKey&, const CacheKey&) = default;
    };

    struct CacheKeyHash final {
        std::size_t operator()(const CacheKey& key) const noexcept;
    };

    PositionStorePtr store_;
    TtlCache<CacheKey, Trajectory, CacheKeyHash> cache_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace freight_tracking
