#include "freight_tracking/eta_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/geo.hpp"

namespace freight_tracking {

namespace {

constexpr double k_current_speed_weight = 0.3;
constexpr double k_historical_speed_weight = 0.4;
constexpr double k_min_traffic_factor = 0.5;
constexpr double k_max_traffic_factor = 2.0;
constexpr double k_max_weather_factor = 2.0;
constexpr double k_min_confidence = 0.5;
constexpr double k_max_confidence = 0.95;

constexpr double k_hos_break_interval_h = 8.0;
constexpr double k_hos_break_min = 30.0;
constexpr double k_hos_rest_interval_h = 11.0;
constexpr double k_hos_rest_min = 600.0;

struct ConfidenceInputs final {
    bool has_current_speed{false};
    bool has_historical_speed{false};
    bool has_traffic_data{false};
    bool has_driver_pattern{false};
    bool has_route_data{false};
    double distance_km{};
    std::optional<LoadStatus> load_status{};
};

double confidence_for(const ConfidenceInputs& inputs) {
    double confidence = k_min_confidence;
    if (inputs.has_current_speed) {
        confidence += 0.05;
    }
    if (inputs.has_historical_speed) {
        confidence += 0.1;
    }
    if (inputs.has_traffic_data) {
        confidence += 0.1;
    }
    if (inputs.has_driver_pattern) {
        confidence += 0.05;
    }
    if (inputs.has_route_data) {
        confidence += 0.1;
    }

    // Short hauls are more predictable than long ones.
    if (inputs.distance_km < 50.0) {
        confidence += 0.1;
    } else if (inputs.distance_km > 500.0) {
        confidence -= 0.1;
    }

    if (inputs.load_status.has_value()) {
        switch (*inputs.load_status) {
            case LoadStatus::InTransit:
            case LoadStatus::Loaded:
                confidence += 0.05;
                break;
            case LoadStatus::AtPickup:
            case LoadStatus::AtDropoff:
                confidence += 0.02;
                break;
            case LoadStatus::Delayed:
            case LoadStatus::Exception:
                confidence -= 0.1;
                break;
            default:
                break;
        }
    }
    return std::clamp(confidence, k_min_confidence, k_max_confidence);
}

void validate_destination(double latitude_deg, double longitude_deg) {
    if (!is_valid_latitude(latitude_deg) || !is_valid_longitude(longitude_deg)) {
        throw ValidationError(fmt::format("Invalid destination coordinates ({}, {})", latitude_deg, longitude_deg));
    }
}

}  // namespace

double driver_pattern_factor(const std::string& entity_id) noexcept {
    unsigned long sum = 0;
    for (const char character : entity_id) {
        sum += static_cast<unsigned char>(character);
    }
    return 0.9 + static_cast<double>(sum % 20U) / 100.0;
}

double hours_of_service_delay_min(double driving_hours) noexcept {
    if (!(driving_hours > 0.0)) {
        return 0.0;
    }
    const double breaks = std::floor(driving_hours / k_hos_break_interval_h);
    const double rests = std::floor(driving_hours / k_hos_rest_interval_h);
    return breaks * k_hos_break_min + rests * k_hos_rest_min;
}

EtaEngine::EtaEngine(PositionStorePtr store,
                     std::shared_ptr<PositionCache> cache,
                     RoutingServicePtr routing,
                     EtaConfig config,
                     ClockPtr clock)
    : store_(std::move(store)),
      cache_(std::move(cache)),
      routing_(std::move(routing)),
      config_(config),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (store_ == nullptr || cache_ == nullptr) {
        throw std::invalid_argument("EtaEngine requires a position store and cache");
    }
    if (clock_ == nullptr) {
        throw std::invalid_argument("EtaEngine requires a clock");
    }
    if (!(config_.min_speed_kmh > 0.0)) {
        throw std::invalid_argument("EtaEngine minimum speed must be positive");
    }
    if (config_.trailing_samples == 0) {
        throw std::invalid_argument("EtaEngine needs at least one trailing sample");
    }
}

EtaResult EtaEngine::estimate(const std::string& entity_id,
                              EntityType entity_type,
                              double destination_latitude_deg,
                              double destination_longitude_deg,
                              const EtaOptions& options) const {
    validate_destination(destination_latitude_deg, destination_longitude_deg);
    const PositionSample current = require_position(entity_id, entity_type);
    const GeodeticCoordinate origin = current.coordinate();
    const GeodeticCoordinate destination{destination_latitude_deg, destination_longitude_deg};

    EtaResult result{};
    EtaFactors& factors = result.factors;

    if (current.speed_kmh.has_value() && *current.speed_kmh > 0.0) {
        factors.current_speed_kmh = current.speed_kmh;
    }
    if (options.use_historical_data) {
        factors.historical_speed_kmh = historical_speed_kmh(entity_id, entity_type);
    }

    double weighted_numerator = 0.0;
    double weight_total = 0.0;
    if (factors.current_speed_kmh.has_value()) {
        weighted_numerator += k_current_speed_weight * *factors.current_speed_kmh;
        weight_total += k_current_speed_weight;
    }
    if (factors.historical_speed_kmh.has_value()) {
        weighted_numerator += k_historical_speed_weight * *factors.historical_speed_kmh;
        weight_total += k_historical_speed_weight;
    }
    const double weighted_speed = weight_total > 0.0 ? weighted_numerator / weight_total : k_default_speed_kmh;
    double effective_speed = weighted_speed;

    result.remaining_distance_km = haversine_distance_km(origin, destination);
    if (options.consider_traffic && routing_ != nullptr) {
        if (const std::optional<RouteEstimate> route = try_route(origin, destination); route.has_value()) {
            result.remaining_distance_km = route->distance_km;
            result.used_route_data = true;

            const double route_duration_min = route->duration_in_traffic_min.value_or(route->duration_min);
            const double baseline_min = route->distance_km / weighted_speed * 60.0;
            if (route_duration_min > 0.0 && baseline_min > 0.0) {
                factors.traffic_factor =
                    std::clamp(route_duration_min / baseline_min, k_min_traffic_factor, k_max_traffic_factor);
                effective_speed /= *factors.traffic_factor;
            }
        }
    }

    if (options.consider_weather && routing_ != nullptr) {
        try {
            factors.weather_factor =
                std::clamp(routing_->weather_delay_factor(origin, destination), 1.0, k_max_weather_factor);
            effective_speed /= *factors.weather_factor;
        } catch (const std::exception& error) {
            logger_->warn(R"({{"component":"eta_engine","event":"weather_unavailable","error":"{}"}})", error.what());
        }
    }

    if (options.consider_driver_patterns) {
        factors.driver_factor = driver_pattern_factor(entity_id);
        effective_speed /= *factors.driver_factor;
    }

    factors.effective_speed_kmh = std::max(effective_speed, config_.min_speed_kmh);
    const double driving_hours = result.remaining_distance_km / factors.effective_speed_kmh;
    if (options.consider_hos) {
        factors.hos_delay_min = hours_of_service_delay_min(driving_hours);
    }

    result.estimated_duration_min = driving_hours * 60.0 + factors.hos_delay_min;
    result.arrival_time = clock_->now() + std::chrono::duration_cast<Milliseconds>(
                                              std::chrono::duration<double, std::ratio<60>>(result.estimated_duration_min));

    ConfidenceInputs inputs{};
    inputs.has_current_speed = factors.current_speed_kmh.has_value();
    inputs.has_historical_speed = factors.historical_speed_kmh.has_value();
    inputs.has_traffic_data = factors.traffic_factor.has_value();
    inputs.has_driver_pattern = factors.driver_factor.has_value();
    inputs.has_route_data = result.used_route_data;
    inputs.distance_km = result.remaining_distance_km;
    inputs.load_status = options.load_status;
    result.confidence = confidence_for(inputs);

    logger_->debug(
        R"({{"component":"eta_engine","event":"estimate","entity":"{}","distance_km":{:.3f},"duration_min":{:.1f},"speed_kmh":{:.1f},"confidence":{:.2f}}})",
        to_subscription_key(current.key()),
        result.remaining_distance_km,
        result.estimated_duration_min,
        factors.effective_speed_kmh,
        result.confidence);
    return result;
}

double EtaEngine::remaining_distance(const std::string& entity_id,
                                     EntityType entity_type,
                                     double destination_latitude_deg,
                                     double destination_longitude_deg,
                                     bool consider_traffic) const {
    validate_destination(destination_latitude_deg, destination_longitude_deg);
    const PositionSample current = require_position(entity_id, entity_type);
    const GeodeticCoordinate destination{destination_latitude_deg, destination_longitude_deg};

    if (consider_traffic && routing_ != nullptr) {
        if (const std::optional<RouteEstimate> route = try_route(current.coordinate(), destination); route.has_value()) {
            return route->distance_km;
        }
    }
    return haversine_distance_km(current.coordinate(), destination);
}

PositionSample EtaEngine::require_position(const std::string& entity_id, EntityType entity_type) const {
    if (entity_id.empty()) {
        throw ValidationError("Entity id is required");
    }
    std::optional<PositionSample> current =
        read_through(*cache_, *store_, entity_id, entity_type, deadline_after(config_.store_timeout));
    if (!current.has_value()) {
        throw PositionUnavailableError(fmt::format("No position data for {} {}", to_string(entity_type), entity_id));
    }
    return std::move(*current);
}

std::optional<double> EtaEngine::historical_speed_kmh(const std::string& entity_id, EntityType entity_type) const {
    RangeQuery query{};
    query.end = clock_->now();
    query.start = query.end - std::chrono::duration_cast<Milliseconds>(config_.history_window);

    std::vector<PositionSample> list_samples;
    try {
        list_samples = store_->query_range(entity_id, entity_type, query, deadline_after(config_.store_timeout));
    } catch (const TrackingError& error) {
        logger_->warn(R"({{"component":"eta_engine","event":"history_unavailable","entity_id":"{}","error":"{}"}})",
                      entity_id,
                      error.what());
        return std::nullopt;
    }
    if (list_samples.size() > config_.trailing_samples) {
        list_samples.erase(list_samples.begin(),
                           list_samples.end() - static_cast<std::ptrdiff_t>(config_.trailing_samples));
    }

    double reported_sum = 0.0;
    std::size_t reported_count = 0;
    for (const PositionSample& sample : list_samples) {
        if (sample.speed_kmh.has_value()) {
            reported_sum += *sample.speed_kmh;
            ++reported_count;
        }
    }
    if (reported_count > 0) {
        const double average = reported_sum / static_cast<double>(reported_count);
        return average > 0.0 ? std::optional<double>(average) : std::nullopt;
    }

    if (list_samples.size() < 2) {
        return std::nullopt;
    }
    double travelled_km = 0.0;
    for (std::size_t index = 1; index < list_samples.size(); ++index) {
        travelled_km += haversine_distance_km(list_samples[index - 1].coordinate(), list_samples[index].coordinate());
    }
    const Duration elapsed = list_samples.back().recorded_at - list_samples.front().recorded_at;
    const double elapsed_hours = elapsed.count() / 3600.0;
    if (elapsed_hours <= 0.0 || travelled_km <= 0.0) {
        return std::nullopt;
    }
    return travelled_km / elapsed_hours;
}

std::optional<RouteEstimate> EtaEngine::try_route(const GeodeticCoordinate& origin,
                                                  const GeodeticCoordinate& destination) const {
    try {
        RouteEstimate route = routing_->route_distance(origin, destination);
        if (!(route.distance_km >= 0.0)) {
            logger_->warn(R"({{"component":"eta_engine","event":"route_rejected","distance_km":{}}})", route.distance_km);
            return std::nullopt;
        }
        return route;
    } catch (const std::exception& error) {
        logger_->warn(R"({{"component":"eta_engine","event":"routing_unavailable","error":"{}"}})", error.what());
        return std::nullopt;
    }
}

}  // namespace freight_tracking
