#include "freight_tracking/load_service.hpp"

#include <array>
#include <utility>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"

namespace freight_tracking {

namespace {

constexpr std::array<std::pair<LoadStatus, std::string_view>, 15> k_load_status_names{{
    {LoadStatus::Created, "created"},
    {LoadStatus::Pending, "pending"},
    {LoadStatus::Optimizing, "optimizing"},
    {LoadStatus::Available, "available"},
    {LoadStatus::Reserved, "reserved"},
    {LoadStatus::Assigned, "assigned"},
    {LoadStatus::AtPickup, "at_pickup"},
    {LoadStatus::Loaded, "loaded"},
    {LoadStatus::InTransit, "in_transit"},
    {LoadStatus::AtDropoff, "at_dropoff"},
    {LoadStatus::Delivered, "delivered"},
    {LoadStatus::Completed, "completed"},
    {LoadStatus::Cancelled, "cancelled"},
    {LoadStatus::Delayed, "delayed"},
    {LoadStatus::Exception, "exception"},
}};

}  // namespace

std::optional<LoadAssignment> LoadWithAssignments::active_assignment() const {
    for (const LoadAssignment& assignment : assignments) {
        if (assignment.is_active()) {
            return assignment;
        }
    }
    return std::nullopt;
}

std::optional<LoadLocation> LoadWithAssignments::first_location(LocationType location_type) const {
    for (const LoadLocation& location : locations) {
        if (location.location_type == location_type) {
            return location;
        }
    }
    return std::nullopt;
}

bool LoadWithAssignments::is_trackable() const noexcept {
    switch (status) {
        case LoadStatus::Assigned:
        case LoadStatus::InTransit:
        case LoadStatus::AtPickup:
        case LoadStatus::Loaded:
            return true;
        default:
            return false;
    }
}

std::string_view to_string(LoadStatus status) noexcept {
    for (const auto& [value, name] : k_load_status_names) {
        if (value == status) {
            return name;
        }
    }
    return "unknown";
}

LoadStatus parse_load_status(std::string_view text) {
    for (const auto& [value, name] : k_load_status_names) {
        if (name == text) {
            return value;
        }
    }
    throw ValidationError(fmt::format("Unknown load status '{}'", text));
}

}  // namespace freight_tracking
