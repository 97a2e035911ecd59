// === Configuration ===========================================================
//
// Strongly-typed runtime settings for the tracking service. The loader
// translates `FREIGHT_TRACKING_*` environment variables into this structure so
// downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "freight_tracking/subscription_hub.hpp"
#include "freight_tracking/types.hpp"

namespace freight_tracking {

/**
 * @brief Immutable bundle of runtime knobs for the tracking service.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative.
 */
struct Configuration final {
    std::string log_directory{};             /**< Destination directory for structured logs. */
    std::string log_level{};                 /**< spdlog level name. */
    std::string upstream_url{};              /**< `ws://` push endpoint. */
    Milliseconds position_ttl{};             /**< Position cache TTL. */
    Milliseconds trajectory_ttl{};           /**< Trajectory cache TTL. */
    HubConfig hub{};                         /**< Reconnect policy. */
    int retention_months{};                  /**< Partitions kept behind the current month. */
    Milliseconds store_timeout{};            /**< Default deadline for store reads. */
    double min_speed_kmh{};                  /**< ETA speed floor. */
    bool unique_source_log{};                /**< Enforce (entity, recorded_at, source_log_id) uniqueness. */
    std::vector<EntityKey> watched_entities{};  /**< Entities the daemon follows and persists. */
};

/** @brief Hydrates Configuration from environment variables. */
class ConfigurationLoader final {
  public:
    /** @brief Read the environment, initialize the logger, and return the settings. */
    static Configuration load();

    /** @brief Parse `TYPE:id,TYPE:id`; malformed entries are logged and skipped. */
    static std::vector<EntityKey> parse_watch_list(std::string_view text);

  private:
    static HubConfig load_hub_config();
};

}  // namespace freight_tracking
