// === Position Store ==========================================================
//
// Contract for durable, month-partitioned position history. Writes are
// append-only; reads return samples in ascending `recorded_at` order and carry
// a caller deadline.

#pragma once

#include <chrono>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "freight_tracking/partition_calendar.hpp"
#include "freight_tracking/position_sample.hpp"

namespace freight_tracking {

/** @brief Monotonic instant after which a store call must give up. */
using Deadline = std::chrono::steady_clock::time_point;

/** @brief Deadline @p timeout from now. */
[[nodiscard]] inline Deadline deadline_after(Milliseconds timeout) {
    return std::chrono::steady_clock::now() + timeout;
}

/** @brief Window and paging for a history read; both bounds inclusive. */
struct RangeQuery final {
    TimePoint start{};
    TimePoint end{};
    std::size_t limit{std::numeric_limits<std::size_t>::max()};
    std::size_t offset{};
};

/** @brief Time-partitioned position history. */
class PositionStore {
  public:
    virtual ~PositionStore() = default;

    /**
     * @brief Validate, stamp `created_at`, and persist @p sample.
     *
     * Throws ValidationError for malformed samples and ConflictError for a
     * duplicate under the uniqueness constraint. Returns the stored record.
     */
    virtual PositionSample append(const PositionSample& sample) = 0;

    /**
     * @brief Samples of one entity within @p query, oldest first.
     *
     * Throws NotFoundError for an entity the store has never seen and
     * TimeoutError when @p deadline passes first.
     */
    [[nodiscard]] virtual std::vector<PositionSample> query_range(const std::string& entity_id,
                                                                  EntityType entity_type,
                                                                  const RangeQuery& query,
                                                                  Deadline deadline) const = 0;

    /** @brief Most recent sample of the entity, if any. */
    [[nodiscard]] virtual std::optional<PositionSample> latest(const std::string& entity_id,
                                                               EntityType entity_type,
                                                               Deadline deadline) const = 0;

    /**
     * @brief Most recent sample of every entity, optionally of one type.
     *
     * Entities without samples are omitted. Order is unspecified.
     */
    [[nodiscard]] virtual std::vector<PositionSample> latest_positions(std::optional<EntityType> entity_type,
                                                                       Deadline deadline) const = 0;

    /** @brief Make an entity known before it reports its first position. */
    virtual void register_entity(const EntityKey& key) = 0;

    /** @brief Create the partition for `now + 1 month` if absent; returns partitions created. */
    virtual std::size_t ensure_upcoming_partition(TimePoint now) = 0;
    /** @brief Drop partitions entirely older than the retention window; returns partitions dropped. */
    virtual std::size_t prune_old_partitions(TimePoint now, int retention_months) = 0;

    /** @brief Current partitions, oldest first. */
    [[nodiscard]] virtual std::vector<MonthPartition> partitions() const = 0;
};

using PositionStorePtr = std::shared_ptr<PositionStore>;

}  // namespace freight_tracking
