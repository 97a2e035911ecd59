// === Listener Table ==========================================================
//
// Reference-counted fan-out map from a subscription key to its listeners.
// Not synchronized: the owning hub guards every table with its own mutex.

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace freight_tracking {

/** @brief One registered callback pair; deactivated exactly once on unsubscribe. */
template <typename Listener, typename ErrorListener>
struct ListenerEntry final {
    Listener on_event{};
    ErrorListener on_error{};
    std::atomic<bool> flag_active{true};
};

template <typename Key, typename Listener, typename ErrorListener, typename Hash = std::hash<Key>>
class ListenerTable final {
  public:
    using Entry = ListenerEntry<Listener, ErrorListener>;
    using EntryPtr = std::shared_ptr<Entry>;

    /** @brief Register @p entry; returns true when it is the first listener for @p key. */
    bool add(const Key& key, EntryPtr entry) {
        std::vector<EntryPtr>& list_entries = map_entries_[key];
        list_entries.push_back(std::move(entry));
        return list_entries.size() == 1;
    }

    /** @brief Remove @p entry; returns true when @p key has no listeners left. */
    bool remove(const Key& key, const EntryPtr& entry) {
        const auto iterator = map_entries_.find(key);
        if (iterator == map_entries_.end()) {
            return false;
        }
        std::vector<EntryPtr>& list_entries = iterator->second;
        const auto erased = std::remove(list_entries.begin(), list_entries.end(), entry);
        if (erased == list_entries.end()) {
            return false;
        }
        list_entries.erase(erased, list_entries.end());
        if (!list_entries.empty()) {
            return false;
        }
        map_entries_.erase(iterator);
        return true;
    }

    [[nodiscard]] std::vector<EntryPtr> snapshot(const Key& key) const {
        const auto iterator = map_entries_.find(key);
        return iterator == map_entries_.end() ? std::vector<EntryPtr>{} : iterator->second;
    }

    [[nodiscard]] std::vector<EntryPtr> all() const {
        std::vector<EntryPtr> list_entries;
        for (const auto& [key, entries] : map_entries_) {
            list_entries.insert(list_entries.end(), entries.begin(), entries.end());
        }
        return list_entries;
    }

    [[nodiscard]] std::vector<Key> keys() const {
        std::vector<Key> list_keys;
        list_keys.reserve(map_entries_.size());
        for (const auto& [key, entries] : map_entries_) {
            list_keys.push_back(key);
        }
        return list_keys;
    }

    [[nodiscard]] bool contains(const Key& key) const { return map_entries_.find(key) != map_entries_.end(); }

    [[nodiscard]] std::size_t count(const Key& key) const {
        const auto iterator = map_entries_.find(key);
        return iterator == map_entries_.end() ? 0 : iterator->second.size();
    }

    [[nodiscard]] bool empty() const noexcept { return map_entries_.empty(); }

  private:
    std::unordered_map<Key, std::vector<EntryPtr>, Hash> map_entries_;
};

}  // namespace freight_tracking
