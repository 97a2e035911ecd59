#include "freight_tracking/position_sample.hpp"

#include <cmath>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/geo.hpp"

namespace freight_tracking {

namespace {
constexpr double k_max_heading_deg{360.0};
}  // namespace

void validate_position_sample(const PositionSample& sample) {
    if (sample.entity_id.empty()) {
        throw ValidationError("Position sample requires an entity id");
    }
    if (!is_valid_latitude(sample.latitude_deg)) {
        throw ValidationError(fmt::format("Latitude {} outside [-90, 90]", sample.latitude_deg));
    }
    if (!is_valid_longitude(sample.longitude_deg)) {
        throw ValidationError(fmt::format("Longitude {} outside [-180, 180]", sample.longitude_deg));
    }
    if (sample.heading_deg.has_value()
        && (!std::isfinite(*sample.heading_deg) || *sample.heading_deg < 0.0 || *sample.heading_deg >= k_max_heading_deg)) {
        throw ValidationError(fmt::format("Heading {} outside [0, 360)", *sample.heading_deg));
    }
    if (sample.speed_kmh.has_value() && (!std::isfinite(*sample.speed_kmh) || *sample.speed_kmh < 0.0)) {
        throw ValidationError(fmt::format("Speed {} must be non-negative", *sample.speed_kmh));
    }
    if (sample.accuracy_m.has_value() && (!std::isfinite(*sample.accuracy_m) || *sample.accuracy_m < 0.0)) {
        throw ValidationError(fmt::format("Accuracy {} must be non-negative", *sample.accuracy_m));
    }
    if (sample.recorded_at > sample.created_at) {
        throw ValidationError(fmt::format("Sample for {} recorded after it was persisted", sample.entity_id));
    }
}

PositionSample normalize_position_sample(PositionSample sample) {
    sample.latitude_deg = round_to_microdegrees(sample.latitude_deg);
    sample.longitude_deg = round_to_microdegrees(sample.longitude_deg);
    return sample;
}

}  // namespace freight_tracking
