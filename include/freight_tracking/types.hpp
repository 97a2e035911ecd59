// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the tracking core (time primitives, geodetic coordinates, entity identity).

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace freight_tracking {

/**
 * @brief Wall clock used for every persisted or exchanged timestamp.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for instants captured from the wall clock.
 */
using TimePoint = std::chrono::time_point<SystemClock, std::chrono::milliseconds>;

/**
 * @brief Alias for durations measured in milliseconds.
 */
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Kinds of objects whose positions are tracked.
 */
enum class EntityType {
    Driver,    /**< A driver carrying the mobile app. */
    Vehicle,   /**< A tractor or truck reporting through ELD/GPS. */
    Load,      /**< A shipment tracked directly. */
    SmartHub   /**< A fixed or semi-fixed transfer hub. */
};

/**
 * @brief Origin of a position report.
 */
enum class PositionSource {
    MobileApp,
    Eld,
    GpsDevice,
    Manual,
    System
};

/** @brief Identity of a tracked entity: `(entity_type, entity_id)`. */
struct EntityKey final {
    EntityType entity_type{EntityType::Vehicle};
    std::string entity_id{};

    friend bool operator==(const EntityKey&, const EntityKey&) = default;
};

/** @brief Hash functor so EntityKey can index unordered containers. */
struct EntityKeyHash final {
    std::size_t operator()(const EntityKey& key) const noexcept {
        const std::size_t type_hash = std::hash<int>{}(static_cast<int>(key.entity_type));
        return std::hash<std::string>{}(key.entity_id) ^ (type_hash + 0x9e3779b97f4a7c15ULL + (type_hash << 6U));
    }
};

/** @brief Upper-case wire name, e.g. `SMART_HUB`. */
[[nodiscard]] std::string_view to_string(EntityType entity_type) noexcept;
/** @brief Upper-case wire name, e.g. `GPS_DEVICE`. */
[[nodiscard]] std::string_view to_string(PositionSource source) noexcept;

/** @brief Parse a wire name; throws ValidationError for unknown names. */
[[nodiscard]] EntityType parse_entity_type(std::string_view text);
/** @brief Parse a wire name; throws ValidationError for unknown names. */
[[nodiscard]] PositionSource parse_position_source(std::string_view text);

/** @brief Subscription key in the `<ENTITY_TYPE>_<entityId>` form. */
[[nodiscard]] std::string to_subscription_key(const EntityKey& key);
/** @brief Inverse of to_subscription_key; throws ValidationError when malformed. */
[[nodiscard]] EntityKey parse_subscription_key(std::string_view text);

}  // namespace freight_tracking
