// === Position Cache ==========================================================
//
// Short-lived "where is X now" cache in front of the position store. Filled
// on store reads and by the subscription hub on every push update.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "freight_tracking/clock.hpp"
#include "freight_tracking/position_sample.hpp"
#include "freight_tracking/position_store.hpp"
#include "freight_tracking/ttl_cache.hpp"

namespace freight_tracking {

inline constexpr Milliseconds k_default_position_ttl{30'000};

/** @brief TTL cache of the most recent sample per entity. */
class PositionCache final {
  public:
    explicit PositionCache(Milliseconds ttl = k_default_position_ttl, ClockPtr clock = default_clock());

    /** @brief Cached position, or nothing when absent or expired. */
    [[nodiscard]] std::optional<PositionSample> get(const std::string& entity_id, EntityType entity_type) const;
    /** @brief Overwrite the cached position with a fresh insertion time. */
    void put(const std::string& entity_id, EntityType entity_type, PositionSample position);
    /** @brief Force the next read for this entity to go to the store. */
    void invalidate(const std::string& entity_id, EntityType entity_type);
    /** @brief Remove expired entries; returns how many were dropped. */
    std::size_t purge_expired();

    [[nodiscard]] Milliseconds ttl() const noexcept;
    [[nodiscard]] std::size_t size() const;

  private:
    TtlCache<EntityKey, PositionSample, EntityKeyHash> cache_;
};

/**
 * @brief Current position via the cache, falling back to the store's latest
 *        sample and caching it on a hit.
 *
 * Store errors (TimeoutError) propagate; an unknown entity yields nothing.
 */
[[nodiscard]] std::optional<PositionSample> read_through(PositionCache& cache,
                                                         const PositionStore& store,
                                                         const std::string& entity_id,
                                                         EntityType entity_type,
                                                         Deadline deadline,
                                                         bool bypass_cache = false);

}  // namespace freight_tracking
