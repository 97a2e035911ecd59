// === Partitioned Position Store ==============================================
//
// In-process implementation of the position store contract. Samples live in
// one bucket per calendar month; each bucket keeps per-entity vectors sorted
// by `recorded_at`. A single timed mutex serializes access so reads can honour
// their deadlines while partition maintenance runs.

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "freight_tracking/clock.hpp"
#include "freight_tracking/logging.hpp"
#include "freight_tracking/position_store.hpp"

namespace freight_tracking {

/** @brief Behavioural switches fixed at construction. */
struct PartitionedStoreConfig final {
    bool unique_source_log{false};  /**< Enforce `(entity_id, recorded_at, source_log_id)` uniqueness. */
};

/** @brief Month-partitioned, in-memory position history. */
class PartitionedPositionStore final : public PositionStore {
  public:
    /**
     * @brief Build the store with partitions for the current and next month.
     */
    explicit PartitionedPositionStore(PartitionedStoreConfig config = {}, ClockPtr clock = default_clock());

    PositionSample append(const PositionSample& sample) override;

    [[nodiscard]] std::vector<PositionSample> query_range(const std::string& entity_id,
                                                          EntityType entity_type,
                                                          const RangeQuery& query,
                                                          Deadline deadline) const override;

    [[nodiscard]] std::optional<PositionSample> latest(const std::string& entity_id,
                                                       EntityType entity_type,
                                                       Deadline deadline) const override;

    [[nodiscard]] std::vector<PositionSample> latest_positions(std::optional<EntityType> entity_type,
                                                               Deadline deadline) const override;

    void register_entity(const EntityKey& key) override;

    std::size_t ensure_upcoming_partition(TimePoint now) override;
    std::size_t prune_old_partitions(TimePoint now, int retention_months) override;

    [[nodiscard]] std::vector<MonthPartition> partitions() const override;

    /** @brief Total stored samples across partitions. */
    [[nodiscard]] std::size_t sample_count() const;

  private:
    struct PartitionBucket final {
        MonthPartition descriptor;
        std::unordered_map<EntityKey, std::vector<PositionSample>, EntityKeyHash> map_samples;
    };

    using PartitionMap = std::map<TimePoint, PartitionBucket>;

    /** @brief Acquire the store lock before @p deadline or throw TimeoutError. */
    [[nodiscard]] std::unique_lock<std::timed_mutex> lock_until(Deadline deadline, const char* operation) const;
    /** @brief Append month partitions until one covers @p target; caller holds the lock. */
    std::size_t extend_through(TimePoint target);
    /** @brief Bucket whose range contains @p instant; caller holds the lock. */
    [[nodiscard]] PartitionBucket* find_bucket(TimePoint instant);

    PartitionedStoreConfig config_;
    ClockPtr clock_;
    mutable std::timed_mutex mutex_;
    PartitionMap map_partitions_;
    std::unordered_set<EntityKey, EntityKeyHash> set_known_entities_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace freight_tracking
