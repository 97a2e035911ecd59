#include "freight_tracking/trajectory_engine.hpp"

#include <cmath>
#include <functional>
#include <stdexcept>
#include <utility>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/geo.hpp"

namespace freight_tracking {

std::vector<std::size_t> douglas_peucker_indices(const std::vector<GeodeticCoordinate>& points, double tolerance_deg) {
    if (points.empty()) {
        return {};
    }
    if (points.size() <= 2) {
        std::vector<std::size_t> list_indices;
        for (std::size_t index = 0; index < points.size(); ++index) {
            list_indices.push_back(index);
        }
        return list_indices;
    }

    std::vector<bool> flags_keep(points.size(), false);
    flags_keep.front() = true;
    flags_keep.back() = true;

    // Explicit stack of [first, last] spans; long tracks would overflow recursion.
    std::vector<std::pair<std::size_t, std::size_t>> stack_spans{{0, points.size() - 1}};
    while (!stack_spans.empty()) {
        const auto [first, last] = stack_spans.back();
        stack_spans.pop_back();
        if (last <= first + 1) {
            continue;
        }

        double max_distance = -1.0;
        std::size_t farthest = first;
        for (std::size_t index = first + 1; index < last; ++index) {
            const double distance = planar_segment_distance_deg(points[index], points[first], points[last]);
            if (distance > max_distance) {
                max_distance = distance;
                farthest = index;
            }
        }

        if (max_distance > tolerance_deg) {
            flags_keep[farthest] = true;
            stack_spans.emplace_back(farthest, last);
            stack_spans.emplace_back(first, farthest);
        }
    }

    std::vector<std::size_t> list_indices;
    for (std::size_t index = 0; index < flags_keep.size(); ++index) {
        if (flags_keep[index]) {
            list_indices.push_back(index);
        }
    }
    return list_indices;
}

std::vector<PositionSample> simplify_samples(const std::vector<PositionSample>& samples, double tolerance_deg) {
    std::vector<GeodeticCoordinate> list_coordinates;
    list_coordinates.reserve(samples.size());
    for (const PositionSample& sample : samples) {
        list_coordinates.push_back(sample.coordinate());
    }

    std::vector<PositionSample> list_retained;
    for (const std::size_t index : douglas_peucker_indices(list_coordinates, tolerance_deg)) {
        list_retained.push_back(samples[index]);
    }
    return list_retained;
}

TrajectoryEngine::TrajectoryEngine(PositionStorePtr store, Milliseconds cache_ttl, ClockPtr clock)
    : store_(std::move(store)),
      cache_(cache_ttl, std::move(clock)),
      logger_(get_logger()) {
    if (store_ == nullptr) {
        throw std::invalid_argument("TrajectoryEngine requires a position store");
    }
}

Trajectory TrajectoryEngine::build_trajectory(const std::string& entity_id,
                                              EntityType entity_type,
                                              TimePoint start,
                                              TimePoint end,
                                              double tolerance_deg,
                                              Deadline deadline) const {
    if (!std::isfinite(tolerance_deg) || tolerance_deg < 0.0) {
        throw ValidationError("Simplification tolerance must be a non-negative number of degrees");
    }

    RangeQuery query{};
    query.start = start;
    query.end = end;
    const std::vector<PositionSample> list_raw = store_->query_range(entity_id, entity_type, query, deadline);

    Trajectory trajectory{};
    trajectory.entity = EntityKey{entity_type, entity_id};
    trajectory.window_start = start;
    trajectory.window_end = end;
    trajectory.tolerance_deg = tolerance_deg;
    trajectory.raw_point_count = list_raw.size();
    trajectory.points = simplify_samples(list_raw, tolerance_deg);

    logger_->debug("Trajectory for {} {}: {} of {} points retained at tolerance {}",
                   to_string(entity_type),
                   entity_id,
                   trajectory.points.size(),
                   trajectory.raw_point_count,
                   tolerance_deg);
    return trajectory;
}

Trajectory TrajectoryEngine::cached_trajectory(const std::string& entity_id,
                                               EntityType entity_type,
                                               TimePoint start,
                                               TimePoint end,
                                               double tolerance_deg,
                                               Deadline deadline,
                                               bool bypass_cache) {
    const CacheKey key{EntityKey{entity_type, entity_id}, start, end, tolerance_deg};
    if (!bypass_cache) {
        if (auto cached = cache_.get(key); cached.has_value()) {
            return std::move(*cached);
        }
    }
    Trajectory trajectory = build_trajectory(entity_id, entity_type, start, end, tolerance_deg, deadline);
    cache_.purge_expired();
    cache_.put(key, trajectory);
    return trajectory;
}

std::size_t TrajectoryEngine::invalidate(const EntityKey& entity) {
    return cache_.invalidate_if([&entity](const CacheKey& key) { return key.entity == entity; });
}

std::size_t TrajectoryEngine::purge_expired() {
    return cache_.purge_expired();
}

std::size_t TrajectoryEngine::cached_count() const {
    return cache_.size();
}

std::size_t TrajectoryEngine::CacheKeyHash::operator()(const CacheKey& key) const noexcept {
    std::size_t seed = EntityKeyHash{}(key.entity);
    const auto combine = [&seed](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6U) + (seed >> 2U);
    };
    combine(std::hash<TimePoint::rep>{}(key.window_start.time_since_epoch().count()));
    combine(std::hash<TimePoint::rep>{}(key.window_end.time_since_epoch().count()));
    combine(std::hash<double>{}(key.tolerance_deg));
    return seed;
}

}  // namespace freight_tracking
