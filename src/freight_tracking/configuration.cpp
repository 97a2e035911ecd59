// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings for the
// tracking service. Unset values take their defaults; unparsable or
// non-positive numbers fall back to the default with a logged warning.
//
// Note: nothing is read from disk; callers populate the process environment
// ahead of time (systemd unit, container manifest, or a shell-sourced `.env`).

#include "freight_tracking/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <string>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/logging.hpp"

namespace freight_tracking {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_upstream_url{"ws://localhost:8080/tracking"};
constexpr int k_default_position_ttl_s{30};
constexpr int k_default_trajectory_ttl_s{60};
constexpr int k_default_max_retries{5};
constexpr int k_default_reconnect_base_ms{1'000};
constexpr int k_default_reconnect_cap_ms{5'000};
constexpr int k_default_retention_months{3};
constexpr int k_default_store_timeout_ms{2'000};
constexpr double k_default_min_speed_kmh{5.0};

std::string parse_string(const char* name, std::string_view fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

double parse_double(const char* name, double fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value <= 0.0) {
            get_logger()->warn("{} must be positive; using fallback {}", name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse double from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

int parse_int(const char* name, int fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value <= 0) {
            get_logger()->warn("{} must be positive; using fallback {}", name, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse integer from {}; using fallback {}", name, fallback);
        return fallback;
    }
}

bool parse_bool(const char* name, bool fallback) {
    const char* raw_value = std::getenv(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    std::string value{raw_value};
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse boolean from {}; using fallback {}", name, fallback);
    return fallback;
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("FREIGHT_TRACKING_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("FREIGHT_TRACKING_LOG_LEVEL", k_default_log_level);
    config.upstream_url = parse_string("FREIGHT_TRACKING_UPSTREAM_URL", k_default_upstream_url);
    config.position_ttl = std::chrono::seconds{parse_int("FREIGHT_TRACKING_POSITION_TTL_S", k_default_position_ttl_s)};
    config.trajectory_ttl =
        std::chrono::seconds{parse_int("FREIGHT_TRACKING_TRAJECTORY_TTL_S", k_default_trajectory_ttl_s)};
    config.hub = load_hub_config();
    config.retention_months = parse_int("FREIGHT_TRACKING_RETENTION_MONTHS", k_default_retention_months);
    config.store_timeout = Milliseconds{parse_int("FREIGHT_TRACKING_STORE_TIMEOUT_MS", k_default_store_timeout_ms)};
    config.min_speed_kmh = parse_double("FREIGHT_TRACKING_MIN_SPEED_KMH", k_default_min_speed_kmh);
    config.unique_source_log = parse_bool("FREIGHT_TRACKING_UNIQUE_SOURCE_LOG", false);
    config.watched_entities = parse_watch_list(parse_string("FREIGHT_TRACKING_WATCH", ""));

    logger->info("Configuration loaded: upstream={} position_ttl_s={} trajectory_ttl_s={} retention_months={} "
                 "max_retries={} watched={}",
                 config.upstream_url,
                 std::chrono::duration_cast<std::chrono::seconds>(config.position_ttl).count(),
                 std::chrono::duration_cast<std::chrono::seconds>(config.trajectory_ttl).count(),
                 config.retention_months,
                 config.hub.max_retries,
                 config.watched_entities.size());

    return config;
}

std::vector<EntityKey> ConfigurationLoader::parse_watch_list(std::string_view text) {
    std::vector<EntityKey> list_entities;
    while (!text.empty()) {
        const std::size_t comma = text.find(',');
        const std::string_view item = trim(text.substr(0, comma));
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
        if (item.empty()) {
            continue;
        }

        const std::size_t colon = item.find(':');
        if (colon == std::string_view::npos || colon + 1 >= item.size()) {
            get_logger()->warn("Ignoring watch entry '{}'; expected TYPE:id", item);
            continue;
        }
        try {
            EntityKey key{};
            key.entity_type = parse_entity_type(trim(item.substr(0, colon)));
            key.entity_id = std::string{trim(item.substr(colon + 1))};
            list_entities.push_back(std::move(key));
        } catch (const ValidationError& error) {
            get_logger()->warn("Ignoring watch entry '{}': {}", item, error.what());
        }
    }
    return list_entities;
}

HubConfig ConfigurationLoader::load_hub_config() {
    HubConfig hub{};
    hub.max_retries = parse_int("FREIGHT_TRACKING_MAX_RECONNECT_ATTEMPTS", k_default_max_retries);
    hub.reconnect_base = Milliseconds{parse_int("FREIGHT_TRACKING_RECONNECT_BASE_MS", k_default_reconnect_base_ms)};
    hub.reconnect_cap = Milliseconds{parse_int("FREIGHT_TRACKING_RECONNECT_CAP_MS", k_default_reconnect_cap_ms)};
    if (hub.reconnect_cap < hub.reconnect_base) {
        get_logger()->warn("Reconnect cap {}ms below base {}ms; raising cap to base",
                           hub.reconnect_cap.count(),
                           hub.reconnect_base.count());
        hub.reconnect_cap = hub.reconnect_base;
    }
    return hub;
}

}  // namespace freight_tracking
