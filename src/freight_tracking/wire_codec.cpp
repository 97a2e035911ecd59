#include "freight_tracking/wire_codec.hpp"

#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/time_format.hpp"

namespace freight_tracking {

namespace {

using json = nlohmann::json;

constexpr std::string_view k_event_position_update = "position_update";
constexpr std::string_view k_event_load_status = "load_status";

std::optional<double> optional_number(const json& document, const char* field) {
    const auto iterator = document.find(field);
    if (iterator == document.end() || iterator->is_null()) {
        return std::nullopt;
    }
    return iterator->get<double>();
}

std::string_view control_verb(ControlOp op) noexcept {
    return op == ControlOp::Subscribe ? "subscribe" : "unsubscribe";
}

PositionUpdateEvent decode_position_update(const json& document) {
    const EntityKey entity = parse_subscription_key(document.at("key").get<std::string>());

    json payload = document.at("payload");
    if (!payload.is_object()) {
        throw ValidationError("position_update payload must be an object");
    }
    if (!payload.contains("entityId")) {
        payload["entityId"] = entity.entity_id;
    }
    if (!payload.contains("entityType")) {
        payload["entityType"] = std::string(to_string(entity.entity_type));
    }

    PositionSample sample = normalize_position_sample(position_sample_from_json(payload));
    if (sample.key() != entity) {
        throw ValidationError(fmt::format("position_update key {} does not match payload {}",
                                          to_subscription_key(entity),
                                          to_subscription_key(sample.key())));
    }
    validate_position_sample(sample);
    return PositionUpdateEvent{entity, std::move(sample)};
}

LoadStatusEvent decode_load_status(const json& document) {
    LoadStatusEvent event{};
    event.load_id = document.at("loadId").get<std::string>();
    if (event.load_id.empty()) {
        throw ValidationError("load_status event without loadId");
    }
    event.status = parse_load_status(document.at("status").get<std::string>());
    if (const auto iterator = document.find("details"); iterator != document.end()) {
        event.details = *iterator;
    }
    return event;
}

}  // namespace

std::string encode_subscription_control(ControlOp op, const EntityKey& entity) {
    json document = {
        {"op", std::string(control_verb(op))},
        {"entityId", entity.entity_id},
        {"entityType", std::string(to_string(entity.entity_type))},
    };
    return document.dump();
}

std::string encode_load_status_control(ControlOp op, const std::string& load_id) {
    json document = {
        {"op", fmt::format("{}_load_status", control_verb(op))},
        {"loadId", load_id},
    };
    return document.dump();
}

InboundEvent decode_inbound(std::string_view frame) {
    try {
        const json document = json::parse(frame.begin(), frame.end());
        if (!document.is_object()) {
            throw ValidationError("Inbound frame is not a JSON object");
        }
        const std::string event = document.at("event").get<std::string>();
        if (event == k_event_position_update) {
            return decode_position_update(document);
        }
        if (event == k_event_load_status) {
            return decode_load_status(document);
        }
        throw ValidationError(fmt::format("Unknown inbound event '{}'", event));
    } catch (const json::exception& error) {
        throw ValidationError(fmt::format("Malformed inbound frame: {}", error.what()));
    }
}

std::string encode_position_update(const PositionSample& sample) {
    json document = {
        {"event", std::string(k_event_position_update)},
        {"key", to_subscription_key(sample.key())},
        {"payload", position_sample_to_json(sample)},
    };
    return document.dump();
}

std::string encode_load_status_event(const LoadStatusEvent& event) {
    json document = {
        {"event", std::string(k_event_load_status)},
        {"loadId", event.load_id},
        {"status", std::string(to_string(event.status))},
    };
    if (!event.details.is_null()) {
        document["details"] = event.details;
    }
    return document.dump();
}

json position_sample_to_json(const PositionSample& sample) {
    json document = {
        {"entityId", sample.entity_id},
        {"entityType", std::string(to_string(sample.entity_type))},
        {"latitude", sample.latitude_deg},
        {"longitude", sample.longitude_deg},
        {"source", std::string(to_string(sample.source))},
        {"recordedAt", format_iso8601(sample.recorded_at)},
        {"createdAt", format_iso8601(sample.created_at)},
    };
    if (sample.heading_deg.has_value()) {
        document["heading"] = *sample.heading_deg;
    }
    if (sample.speed_kmh.has_value()) {
        document["speed"] = *sample.speed_kmh;
    }
    if (sample.accuracy_m.has_value()) {
        document["accuracy"] = *sample.accuracy_m;
    }
    if (sample.source_log_id.has_value()) {
        document["sourceLogId"] = *sample.source_log_id;
    }
    return document;
}

PositionSample position_sample_from_json(const json& document) {
    try {
        PositionSample sample{};
        sample.entity_id = document.at("entityId").get<std::string>();
        sample.entity_type = parse_entity_type(document.at("entityType").get<std::string>());
        sample.latitude_deg = document.at("latitude").get<double>();
        sample.longitude_deg = document.at("longitude").get<double>();
        sample.heading_deg = optional_number(document, "heading");
        sample.speed_kmh = optional_number(document, "speed");
        sample.accuracy_m = optional_number(document, "accuracy");
        sample.source = document.contains("source") ? parse_position_source(document.at("source").get<std::string>())
                                                    : PositionSource::System;
        sample.recorded_at = parse_iso8601(document.at("recordedAt").get<std::string>());
        sample.created_at = document.contains("createdAt")
                                ? parse_iso8601(document.at("createdAt").get<std::string>())
                                : sample.recorded_at;
        if (const auto iterator = document.find("sourceLogId"); iterator != document.end() && !iterator->is_null()) {
            sample.source_log_id = iterator->get<std::string>();
        }
        return sample;
    } catch (const json::exception& error) {
        throw ValidationError(fmt::format("Malformed position sample: {}", error.what()));
    }
}

json trajectory_to_geojson(const Trajectory& trajectory) {
    json coordinates = json::array();
    json timestamps = json::array();
    for (const PositionSample& point : trajectory.points) {
        coordinates.push_back({point.longitude_deg, point.latitude_deg});
        timestamps.push_back(format_iso8601(point.recorded_at));
    }

    return json{
        {"type", "Feature"},
        {"geometry", {{"type", "LineString"}, {"coordinates", std::move(coordinates)}}},
        {"properties",
         {
             {"entityId", trajectory.entity.entity_id},
             {"entityType", std::string(to_string(trajectory.entity.entity_type))},
             {"startTime", format_iso8601(trajectory.window_start)},
             {"endTime", format_iso8601(trajectory.window_end)},
             {"tolerance", trajectory.tolerance_deg},
             {"rawPointCount", trajectory.raw_point_count},
             {"timestamps", std::move(timestamps)},
         }},
    };
}

}  // namespace freight_tracking
