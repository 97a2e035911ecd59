#include "freight_tracking/position_cache.hpp"

#include <utility>

namespace freight_tracking {

PositionCache::PositionCache(Milliseconds ttl, ClockPtr clock)
    : cache_(ttl, std::move(clock)) {}

std::optional<PositionSample> PositionCache::get(const std::string& entity_id, EntityType entity_type) const {
    return cache_.get(EntityKey{entity_type, entity_id});
}

void PositionCache::put(const std::string& entity_id, EntityType entity_type, PositionSample position) {
    cache_.put(EntityKey{entity_type, entity_id}, std::move(position));
}

void PositionCache::invalidate(const std::string& entity_id, EntityType entity_type) {
    cache_.invalidate(EntityKey{entity_type, entity_id});
}

std::size_t PositionCache::purge_expired() {
    return cache_.purge_expired();
}

Milliseconds PositionCache::ttl() const noexcept {
    return cache_.ttl();
}

std::size_t PositionCache::size() const {
    return cache_.size();
}

std::optional<PositionSample> read_through(PositionCache& cache,
                                          const PositionStore& store,
                                          const std::string& entity_id,
                                          EntityType entity_type,
                                          Deadline deadline,
                                          bool bypass_cache) {
    if (!bypass_cache) {
        if (auto cached = cache.get(entity_id, entity_type); cached.has_value()) {
            return cached;
        }
    }
    std::optional<PositionSample> stored = store.latest(entity_id, entity_type, deadline);
    if (stored.has_value()) {
        cache.put(entity_id, entity_type, *stored);
    }
    return stored;
}

}  // namespace freight_tracking
