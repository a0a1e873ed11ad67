#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace esmp {

/// Concurrent map from string keys to optional records with one reader/writer lock per key.
///
/// `modify` holds the key's exclusive lock for the whole callback, so everything a callback reads
/// and writes for that key is one atomic step; `read` holds the shared lock.  The map-wide mutex
/// is only held long enough to find or create a key's slot, so callbacks for different keys run in
/// parallel.  Slots are never removed: records are never deleted.
template <typename T>
class keyed_store {
  public:
    using record = std::optional<T>;

    /// Calls `f(record&)` with the key's exclusive lock held and returns whatever it returns.  The
    /// record is empty if the key has never been stored; the callback creates a record by
    /// assigning to it.  The record is modified in place: a callback that can throw must not touch
    /// the record until it can no longer fail.
    template <typename F>
    decltype(auto) modify(const std::string& key, F&& f) {
        auto s = slot_for(key, true);
        std::unique_lock lock{s->mutex};
        return f(s->value);
    }

    /// Like `modify`, for several keys at once: calls `f(std::vector<record*>&)` with the exclusive
    /// locks of all `keys` held, the records in the same (sorted) order as `keys`.  Locks are
    /// always taken in key order, so this never deadlocks against another `modify_all` or `modify`.
    template <typename F>
    decltype(auto) modify_all(const std::set<std::string>& keys, F&& f) {
        std::vector<std::shared_ptr<slot>> slots;
        for (const auto& k : keys)
            slots.push_back(slot_for(k, true));
        std::vector<std::unique_lock<std::shared_mutex>> locks;
        std::vector<record*> records;
        for (auto& s : slots) {
            locks.emplace_back(s->mutex);
            records.push_back(&s->value);
        }
        return f(records);
    }

    /// Calls `f(const record&)` with the key's shared lock held.
    template <typename F>
    decltype(auto) read(const std::string& key, F&& f) const {
        auto s = slot_for(key, false);
        if (!s) {
            const record none;
            return f(none);
        }
        std::shared_lock lock{s->mutex};
        return f(s->value);
    }

    /// Returns a copy of the record, if present.
    record get(const std::string& key) const {
        return read(key, [](const record& r) { return r; });
    }

    /// Returns the keys that currently hold a record.
    std::vector<std::string> keys() const {
        std::vector<std::pair<std::string, std::shared_ptr<slot>>> all;
        {
            std::lock_guard lock{map_mutex_};
            all.assign(slots_.begin(), slots_.end());
        }
        std::vector<std::string> out;
        for (auto& [k, s] : all) {
            std::shared_lock lock{s->mutex};
            if (s->value)
                out.push_back(k);
        }
        return out;
    }

  private:
    struct slot {
        mutable std::shared_mutex mutex;
        record value;
    };

    std::shared_ptr<slot> slot_for(const std::string& key, bool create) const {
        std::lock_guard lock{map_mutex_};
        auto it = slots_.find(key);
        if (it != slots_.end())
            return it->second;
        if (!create)
            return nullptr;
        return slots_.emplace(key, std::make_shared<slot>()).first->second;
    }

    mutable std::mutex map_mutex_;
    mutable std::unordered_map<std::string, std::shared_ptr<slot>> slots_;
};

}  // namespace esmp
