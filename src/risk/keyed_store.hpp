#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace riskwatch {

/// Map from entity key to state with one mutation lock per key
///
/// Keys are spread over shards guarded by shared mutexes that are only held
/// while looking up or inserting an entry. Each entry carries its own mutex,
/// so updates to different keys never contend and readers copy one entry at
/// a time. Entries are created lazily and never removed, which keeps entry
/// addresses stable once the shard lock is released.
template <typename Value, std::size_t ShardCount = 16>
class KeyedStore {
public:
    /// Builds the initial value for a key seen for the first time
    using Factory = std::function<Value(const std::string&)>;

    explicit KeyedStore(Factory factory = [](const std::string&) { return Value{}; })
        : factory_(std::move(factory))
    {}

    KeyedStore(const KeyedStore&) = delete;
    KeyedStore& operator=(const KeyedStore&) = delete;

    /// Run func on the entry for key under its lock, creating it if needed
    template <typename F>
    auto with_entry(const std::string& key, F&& func) -> std::invoke_result_t<F, Value&> {
        Entry& entry = acquire(key);
        std::lock_guard<std::mutex> lock(entry.mutex);
        return func(entry.value);
    }

    /// Copy of the entry for key, if present
    [[nodiscard]] std::optional<Value> find(const std::string& key) const {
        const Entry* entry = lookup(key);
        if (entry == nullptr) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(entry->mutex);
        return entry->value;
    }

    /// Replace (or create) the entry for key
    void insert_or_assign(const std::string& key, Value value) {
        with_entry(key, [&value](Value& current) { current = std::move(value); });
    }

    /// Visit every entry; each entry is locked only for the duration of its visit
    template <typename F>
    void for_each(F&& func) const {
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> shard_lock(shard.mutex);
            for (const auto& [key, entry] : shard.entries) {
                std::lock_guard<std::mutex> lock(entry->mutex);
                func(key, entry->value);
            }
        }
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return lookup(key) != nullptr;
    }

    [[nodiscard]] std::size_t size() const {
        std::size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            total += shard.entries.size();
        }
        return total;
    }

private:
    struct Entry {
        explicit Entry(Value v) : value(std::move(v)) {}

        mutable std::mutex mutex;
        Value value;
    };

    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::unique_ptr<Entry>> entries;
    };

    [[nodiscard]] std::size_t shard_index(const std::string& key) const noexcept {
        return std::hash<std::string>{}(key) % ShardCount;
    }

    [[nodiscard]] const Entry* lookup(const std::string& key) const {
        const Shard& shard = shards_[shard_index(key)];
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        return it != shard.entries.end() ? it->second.get() : nullptr;
    }

    Entry& acquire(const std::string& key) {
        Shard& shard = shards_[shard_index(key)];
        {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            auto it = shard.entries.find(key);
            if (it != shard.entries.end()) {
                return *it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it == shard.entries.end()) {
            it = shard.entries.emplace(key, std::make_unique<Entry>(factory_(key))).first;
        }
        return *it->second;
    }

    std::array<Shard, ShardCount> shards_;
    Factory factory_;
};

}  // namespace riskwatch
