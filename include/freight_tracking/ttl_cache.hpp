// === TTL Cache ===============================================================
//
// Keyed in-memory store whose entries expire a fixed interval after they were
// written. One mutex guards the whole map so key insertion and removal are
// atomic with respect to readers.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "freight_tracking/clock.hpp"
#include "freight_tracking/types.hpp"

namespace freight_tracking {

/**
 * @brief Map from @p Key to @p Value with write-time expiry.
 *
 * An entry is valid while `now - inserted_at < ttl`. Expired entries are
 * reported as absent and are physically removed by the next `put` to the same
 * key or by `purge_expired`. Writes replace the whole entry; values are never
 * mutated in place.
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class TtlCache final {
  public:
    TtlCache(Milliseconds ttl, ClockPtr clock)
        : ttl_(ttl),
          clock_(std::move(clock)) {
        if (ttl_ <= Milliseconds::zero()) {
            throw std::invalid_argument("TtlCache requires a positive TTL");
        }
        if (clock_ == nullptr) {
            throw std::invalid_argument("TtlCache requires a clock");
        }
    }

    /** @brief Configured time-to-live. */
    [[nodiscard]] Milliseconds ttl() const noexcept { return ttl_; }

    /** @brief Value for @p key, or nothing when absent or expired. */
    [[nodiscard]] std::optional<Value> get(const Key& key) const {
        const TimePoint now = clock_->now();
        std::scoped_lock lock(mutex_);
        const auto iterator_entry = map_entries_.find(key);
        if (iterator_entry == map_entries_.end() || is_expired(iterator_entry->second, now)) {
            return std::nullopt;
        }
        return iterator_entry->second.value;
    }

    /** @brief Unconditionally replace the entry for @p key; last writer wins. */
    void put(const Key& key, Value value) {
        const TimePoint now = clock_->now();
        std::scoped_lock lock(mutex_);
        map_entries_.insert_or_assign(key, Entry{std::move(value), now});
    }

    /** @brief Drop the entry for @p key; returns whether one existed. */
    bool invalidate(const Key& key) {
        std::scoped_lock lock(mutex_);
        return map_entries_.erase(key) > 0;
    }

    /** @brief Drop every entry whose key satisfies @p predicate. */
    template <typename Predicate>
    std::size_t invalidate_if(Predicate predicate) {
        std::scoped_lock lock(mutex_);
        std::size_t removed = 0;
        for (auto iterator_entry = map_entries_.begin(); iterator_entry != map_entries_.end();) {
            if (predicate(iterator_entry->first)) {
                iterator_entry = map_entries_.erase(iterator_entry);
                ++removed;
            } else {
                ++iterator_entry;
            }
        }
        return removed;
    }

    /** @brief Memory hygiene sweep removing every expired entry. */
    std::size_t purge_expired() {
        const TimePoint now = clock_->now();
        std::scoped_lock lock(mutex_);
        std::size_t removed = 0;
        for (auto iterator_entry = map_entries_.begin(); iterator_entry != map_entries_.end();) {
            if (is_expired(iterator_entry->second, now)) {
                iterator_entry = map_entries_.erase(iterator_entry);
                ++removed;
            } else {
                ++iterator_entry;
            }
        }
        return removed;
    }

    /** @brief Number of stored entries, expired ones included. */
    [[nodiscard]] std::size_t size() const {
        std::scoped_lock lock(mutex_);
        return map_entries_.size();
    }

  private:
    struct Entry final {
        Value value;
        TimePoint inserted_at;
    };

    [[nodiscard]] bool is_expired(const Entry& entry, TimePoint now) const noexcept {
        return now - entry.inserted_at >= ttl_;
    }

    Milliseconds ttl_;
    ClockPtr clock_;
    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry, Hash> map_entries_;
};

}  // namespace freight_tracking
