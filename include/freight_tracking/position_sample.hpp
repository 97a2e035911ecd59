// === Position Sample =========================================================
//
// Immutable record of one observed position plus the validation rules every
// sample must satisfy before it is persisted or cached.

#pragma once

#include <optional>
#include <string>

#include "freight_tracking/types.hpp"

namespace freight_tracking {

/**
 * @brief Captures where an entity was observed at a point in time.
 */
struct PositionSample final {
    std::string entity_id{};                            /**< Opaque entity identifier. */
    EntityType entity_type{EntityType::Vehicle};        /**< Kind of tracked entity. */
    double latitude_deg{};                              /**< Latitude, six-decimal precision. */
    double longitude_deg{};                             /**< Longitude, six-decimal precision. */
    std::optional<double> heading_deg{};                /**< Course over ground, [0, 360). */
    std::optional<double> speed_kmh{};                  /**< Ground speed in km/h. */
    std::optional<double> accuracy_m{};                 /**< Horizontal accuracy in metres. */
    PositionSource source{PositionSource::GpsDevice};   /**< Reporting channel. */
    TimePoint recorded_at{};                            /**< When the position was observed. */
    TimePoint created_at{};                             /**< When the record was persisted. */
    std::optional<std::string> source_log_id{};         /**< Upstream log row, for de-duplication. */

    [[nodiscard]] EntityKey key() const { return EntityKey{entity_type, entity_id}; }
    [[nodiscard]] GeodeticCoordinate coordinate() const noexcept { return GeodeticCoordinate{latitude_deg, longitude_deg}; }

    friend bool operator==(const PositionSample&, const PositionSample&) = default;
};

/**
 * @brief Reject samples violating range or ordering invariants.
 *
 * Throws ValidationError naming the first offending field.
 */
void validate_position_sample(const PositionSample& sample);

/** @brief Copy of @p sample with coordinates rounded to six decimals. */
[[nodiscard]] PositionSample normalize_position_sample(PositionSample sample);

}  // namespace freight_tracking
