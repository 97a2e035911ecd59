// === Load Service ============================================================
//
// Read-only view of loads, their carrier assignments, and their stops. The
// tracking core only resolves which vehicle carries a load and where it is
// headed; it never mutates load state.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "freight_tracking/types.hpp"

namespace freight_tracking {

/** @brief Lifecycle of a load as reported by the load service. */
enum class LoadStatus {
    Created,
    Pending,
    Optimizing,
    Available,
    Reserved,
    Assigned,
    AtPickup,
    Loaded,
    InTransit,
    AtDropoff,
    Delivered,
    Completed,
    Cancelled,
    Delayed,
    Exception
};

/** @brief Status of one carrier assignment against a load. */
enum class AssignmentStatus {
    Pending,
    Accepted,
    InProgress,
    Completed,
    Cancelled
};

/** @brief Role of a stop along the load's route. */
enum class LocationType {
    Pickup,
    Delivery,
    Stop
};

/** @brief Driver/vehicle pairing assigned to move a load. */
struct LoadAssignment final {
    std::string assignment_id{};
    std::string driver_id{};
    std::string vehicle_id{};
    AssignmentStatus status{AssignmentStatus::Pending};

    [[nodiscard]] bool is_active() const noexcept {
        return status != AssignmentStatus::Completed && status != AssignmentStatus::Cancelled;
    }
};

/** @brief A pickup, delivery, or intermediate stop. */
struct LoadLocation final {
    LocationType location_type{LocationType::Stop};
    std::string facility_name{};
    GeodeticCoordinate coordinates{};
};

/** @brief Load with its assignments and stops. */
struct LoadWithAssignments final {
    std::string load_id{};
    LoadStatus status{LoadStatus::Created};
    std::vector<LoadAssignment> assignments{};
    std::vector<LoadLocation> locations{};

    /** @brief First assignment that is neither completed nor cancelled. */
    [[nodiscard]] std::optional<LoadAssignment> active_assignment() const;
    /** @brief First location of @p location_type. */
    [[nodiscard]] std::optional<LoadLocation> first_location(LocationType location_type) const;
    /** @brief Whether the load is on the road or about to be (assigned through in transit). */
    [[nodiscard]] bool is_trackable() const noexcept;
};

/** @brief Source of load records. */
class LoadService {
  public:
    virtual ~LoadService() = default;

    /** @brief Load by id; throws NotFoundError when unknown. */
    [[nodiscard]] virtual LoadWithAssignments get_load_by_id(const std::string& load_id) = 0;
};

using LoadServicePtr = std::shared_ptr<LoadService>;

[[nodiscard]] std::string_view to_string(LoadStatus status) noexcept;
/** @brief Parse a lower-snake-case status; throws ValidationError for unknown names. */
[[nodiscard]] LoadStatus parse_load_status(std::string_view text);

}  // namespace freight_tracking
