// === Wire Codec ==============================================================
//
// JSON framing for the upstream push connection: outbound control messages,
// inbound position/load-status events, and the position sample payload shared
// by both directions. Timestamps travel as ISO-8601 UTC strings.

#pragma once

#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "freight_tracking/load_service.hpp"
#include "freight_tracking/position_sample.hpp"
#include "freight_tracking/trajectory_engine.hpp"

namespace freight_tracking {

/** @brief Direction of a control message. */
enum class ControlOp {
    Subscribe,
    Unsubscribe
};

/** @brief `{"event":"position_update",...}` frame. */
struct PositionUpdateEvent final {
    EntityKey entity{};
    PositionSample sample{};
};

/** @brief `{"event":"load_status",...}` frame. */
struct LoadStatusEvent final {
    std::string load_id{};
    LoadStatus status{LoadStatus::Created};
    nlohmann::json details{};
};

using InboundEvent = std::variant<PositionUpdateEvent, LoadStatusEvent>;

/** @brief `{"op":"subscribe","entityId":...,"entityType":...}` and its inverse. */
[[nodiscard]] std::string encode_subscription_control(ControlOp op, const EntityKey& entity);
/** @brief `{"op":"subscribe_load_status","loadId":...}` and its inverse. */
[[nodiscard]] std::string encode_load_status_control(ControlOp op, const std::string& load_id);

/**
 * @brief Decode one inbound frame.
 *
 * Throws ValidationError for malformed JSON, unknown events, a key that does
 * not match its payload, or a payload violating sample invariants.
 */
[[nodiscard]] InboundEvent decode_inbound(std::string_view frame);

[[nodiscard]] std::string encode_position_update(const PositionSample& sample);
[[nodiscard]] std::string encode_load_status_event(const LoadStatusEvent& event);

[[nodiscard]] nlohmann::json position_sample_to_json(const PositionSample& sample);
/** @brief Inverse of position_sample_to_json; `createdAt` defaults to `recordedAt`. */
[[nodiscard]] PositionSample position_sample_from_json(const nlohmann::json& document);

/** @brief GeoJSON Feature with a LineString geometry and per-vertex timestamps. */
[[nodiscard]] nlohmann::json trajectory_to_geojson(const Trajectory& trajectory);

}  // namespace freight_tracking
