#include "freight_tracking/partitioned_position_store.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/time_format.hpp"

namespace freight_tracking {

PartitionedPositionStore::PartitionedPositionStore(PartitionedStoreConfig config, ClockPtr clock)
    : config_(config),
      clock_(std::move(clock)),
      logger_(get_logger()) {
    if (clock_ == nullptr) {
        throw std::invalid_argument("PartitionedPositionStore requires a clock");
    }
    const std::size_t created = ensure_upcoming_partition(clock_->now());
    logger_->info("Position store ready with {} partitions (unique_source_log={})", created, config_.unique_source_log);
}

PositionSample PartitionedPositionStore::append(const PositionSample& sample) {
    PositionSample stored = normalize_position_sample(sample);
    stored.created_at = clock_->now();
    validate_position_sample(stored);

    std::unique_lock lock(mutex_);

    PartitionBucket* bucket = find_bucket(stored.recorded_at);
    if (bucket == nullptr) {
        if (map_partitions_.empty() || stored.recorded_at >= map_partitions_.rbegin()->second.descriptor.range_end) {
            const std::size_t created = extend_through(stored.recorded_at);
            logger_->warn(
                R"({{"component":"position_store","event":"partition_on_demand","created":{},"recorded_at":"{}"}})",
                created,
                format_iso8601(stored.recorded_at));
            bucket = find_bucket(stored.recorded_at);
        }
    }
    if (bucket == nullptr) {
        throw ValidationError(fmt::format("Sample for {} at {} precedes the retention window",
                                          stored.entity_id,
                                          format_iso8601(stored.recorded_at)));
    }

    std::vector<PositionSample>& samples = bucket->map_samples[stored.key()];
    if (config_.unique_source_log && stored.source_log_id.has_value()) {
        const bool duplicate = std::any_of(samples.begin(), samples.end(), [&stored](const PositionSample& existing) {
            return existing.recorded_at == stored.recorded_at && existing.source_log_id == stored.source_log_id;
        });
        if (duplicate) {
            throw ConflictError(fmt::format("Duplicate sample for {} at {} (source log {})",
                                            stored.entity_id,
                                            format_iso8601(stored.recorded_at),
                                            *stored.source_log_id));
        }
    }

    const auto insert_at = std::upper_bound(
        samples.begin(), samples.end(), stored.recorded_at,
        [](TimePoint recorded_at, const PositionSample& existing) { return recorded_at < existing.recorded_at; });
    samples.insert(insert_at, stored);
    set_known_entities_.insert(stored.key());
    return stored;
}

std::vector<PositionSample> PartitionedPositionStore::query_range(const std::string& entity_id,
                                                                  EntityType entity_type,
                                                                  const RangeQuery& query,
                                                                  Deadline deadline) const {
    if (query.end < query.start) {
        throw ValidationError("Range query end precedes its start");
    }

    const EntityKey key{entity_type, entity_id};
    const auto lock = lock_until(deadline, "query_range");
    if (!set_known_entities_.contains(key)) {
        throw NotFoundError(fmt::format("Unknown {} {}", to_string(entity_type), entity_id));
    }

    std::vector<PositionSample> list_samples;
    std::size_t skipped = 0;
    for (const auto& [range_start, bucket] : map_partitions_) {
        if (bucket.descriptor.range_end <= query.start || range_start > query.end) {
            continue;
        }
        const auto iterator_entity = bucket.map_samples.find(key);
        if (iterator_entity == bucket.map_samples.end()) {
            continue;
        }
        for (const PositionSample& sample : iterator_entity->second) {
            if (sample.recorded_at < query.start || sample.recorded_at > query.end) {
                continue;
            }
            if (skipped < query.offset) {
                ++skipped;
                continue;
            }
            if (list_samples.size() >= query.limit) {
                return list_samples;
            }
            list_samples.push_back(sample);
        }
    }
    return list_samples;
}

std::optional<PositionSample> PartitionedPositionStore::latest(const std::string& entity_id,
                                                               EntityType entity_type,
                                                               Deadline deadline) const {
    const EntityKey key{entity_type, entity_id};
    const auto lock = lock_until(deadline, "latest");
    for (auto iterator_bucket = map_partitions_.rbegin(); iterator_bucket != map_partitions_.rend(); ++iterator_bucket) {
        const auto iterator_entity = iterator_bucket->second.map_samples.find(key);
        if (iterator_entity != iterator_bucket->second.map_samples.end() && !iterator_entity->second.empty()) {
            return iterator_entity->second.back();
        }
    }
    return std::nullopt;
}

std::vector<PositionSample> PartitionedPositionStore::latest_positions(std::optional<EntityType> entity_type,
                                                                      Deadline deadline) const {
    const auto lock = lock_until(deadline, "latest_positions");
    std::vector<PositionSample> list_latest;
    for (const EntityKey& key : set_known_entities_) {
        if (entity_type.has_value() && key.entity_type != *entity_type) {
            continue;
        }
        for (auto iterator_bucket = map_partitions_.rbegin(); iterator_bucket != map_partitions_.rend(); ++iterator_bucket) {
            const auto iterator_entity = iterator_bucket->second.map_samples.find(key);
            if (iterator_entity != iterator_bucket->second.map_samples.end() && !iterator_entity->second.empty()) {
                list_latest.push_back(iterator_entity->second.back());
                break;
            }
        }
    }
    return list_latest;
}

void PartitionedPositionStore::register_entity(const EntityKey& key) {
    if (key.entity_id.empty()) {
        throw ValidationError("Cannot register an entity without an id");
    }
    std::unique_lock lock(mutex_);
    set_known_entities_.insert(key);
}

std::size_t PartitionedPositionStore::ensure_upcoming_partition(TimePoint now) {
    std::unique_lock lock(mutex_);
    if (map_partitions_.empty()) {
        const MonthPartition current = make_month_partition(now);
        logger_->debug("{}", partition_ddl(current));
        map_partitions_.emplace(current.range_start, PartitionBucket{current, {}});
        return 1 + extend_through(add_months(month_start(now), 1));
    }
    return extend_through(add_months(month_start(now), 1));
}

std::size_t PartitionedPositionStore::prune_old_partitions(TimePoint now, int retention_months) {
    if (retention_months < 0) {
        throw std::invalid_argument("Retention must be a non-negative number of months");
    }
    const TimePoint cutoff = add_months(month_start(now), -retention_months);

    std::unique_lock lock(mutex_);
    std::size_t dropped = 0;
    while (!map_partitions_.empty() && map_partitions_.begin()->second.descriptor.range_end <= cutoff) {
        const MonthPartition& descriptor = map_partitions_.begin()->second.descriptor;
        logger_->info(R"({{"component":"position_store","event":"partition_dropped","partition":"{}"}})", descriptor.name);
        logger_->debug("{}", partition_drop_ddl(descriptor));
        map_partitions_.erase(map_partitions_.begin());
        ++dropped;
    }
    return dropped;
}

std::vector<MonthPartition> PartitionedPositionStore::partitions() const {
    std::unique_lock lock(mutex_);
    std::vector<MonthPartition> list_partitions;
    list_partitions.reserve(map_partitions_.size());
    for (const auto& [range_start, bucket] : map_partitions_) {
        list_partitions.push_back(bucket.descriptor);
    }
    return list_partitions;
}

std::size_t PartitionedPositionStore::sample_count() const {
    std::unique_lock lock(mutex_);
    std::size_t count = 0;
    for (const auto& [range_start, bucket] : map_partitions_) {
        for (const auto& [key, samples] : bucket.map_samples) {
            count += samples.size();
        }
    }
    return count;
}

std::unique_lock<std::timed_mutex> PartitionedPositionStore::lock_until(Deadline deadline, const char* operation) const {
    std::unique_lock lock(mutex_, std::defer_lock);
    if (std::chrono::steady_clock::now() >= deadline || !lock.try_lock_until(deadline)) {
        throw TimeoutError(fmt::format("Position store {} exceeded its deadline", operation));
    }
    return lock;
}

std::size_t PartitionedPositionStore::extend_through(TimePoint target) {
    std::size_t created = 0;
    while (map_partitions_.empty() || map_partitions_.rbegin()->second.descriptor.range_end <= target) {
        const TimePoint next_start = map_partitions_.empty() ? month_start(target)
                                                             : map_partitions_.rbegin()->second.descriptor.range_end;
        const MonthPartition partition = make_month_partition(next_start);
        logger_->info(R"({{"component":"position_store","event":"partition_created","partition":"{}"}})", partition.name);
        logger_->debug("{}", partition_ddl(partition));
        map_partitions_.emplace(partition.range_start, PartitionBucket{partition, {}});
        ++created;
    }
    return created;
}

PartitionedPositionStore::PartitionBucket* PartitionedPositionStore::find_bucket(TimePoint instant) {
    auto iterator_bucket = map_partitions_.upper_bound(instant);
    if (iterator_bucket == map_partitions_.begin()) {
        return nullptr;
    }
    --iterator_bucket;
    if (!iterator_bucket->second.descriptor.contains(instant)) {
        return nullptr;
    }
    return &iterator_bucket->second;
}

}  // namespace freight_tracking
