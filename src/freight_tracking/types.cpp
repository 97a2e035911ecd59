#include "freight_tracking/types.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"

namespace freight_tracking {

namespace {

// SMART_HUB precedes the shorter names so prefix matching on keys never
// stops at a partial type name.
constexpr std::array<std::pair<EntityType, std::string_view>, 4> k_entity_type_names{{
    {EntityType::SmartHub, "SMART_HUB"},
    {EntityType::Driver, "DRIVER"},
    {EntityType::Vehicle, "VEHICLE"},
    {EntityType::Load, "LOAD"},
}};

constexpr std::array<std::pair<PositionSource, std::string_view>, 5> k_source_names{{
    {PositionSource::MobileApp, "MOBILE_APP"},
    {PositionSource::Eld, "ELD"},
    {PositionSource::GpsDevice, "GPS_DEVICE"},
    {PositionSource::Manual, "MANUAL"},
    {PositionSource::System, "SYSTEM"},
}};

}  // namespace

std::string_view to_string(EntityType entity_type) noexcept {
    for (const auto& [value, name] : k_entity_type_names) {
        if (value == entity_type) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::string_view to_string(PositionSource source) noexcept {
    for (const auto& [value, name] : k_source_names) {
        if (value == source) {
            return name;
        }
    }
    return "UNKNOWN";
}

EntityType parse_entity_type(std::string_view text) {
    for (const auto& [value, name] : k_entity_type_names) {
        if (name == text) {
            return value;
        }
    }
    throw ValidationError(fmt::format("Unknown entity type '{}'", text));
}

PositionSource parse_position_source(std::string_view text) {
    for (const auto& [value, name] : k_source_names) {
        if (name == text) {
            return value;
        }
    }
    throw ValidationError(fmt::format("Unknown position source '{}'", text));
}

std::string to_subscription_key(const EntityKey& key) {
    return fmt::format("{}_{}", to_string(key.entity_type), key.entity_id);
}

EntityKey parse_subscription_key(std::string_view text) {
    for (const auto& [value, name] : k_entity_type_names) {
        if (text.size() > name.size() + 1 && text.substr(0, name.size()) == name && text[name.size()] == '_') {
            return EntityKey{value, std::string{text.substr(name.size() + 1)}};
        }
    }
    throw ValidationError(fmt::format("Malformed subscription key '{}'", text));
}

}  // namespace freight_tracking
