#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <optional>
#include <functional>
#include <cstddef>

namespace parley {

// String-keyed map split into independently locked shards. Operations on
// keys in different shards never contend; every callback runs under the
// owning shard's lock, so a visitor sees either the whole value or nothing.
// Callbacks must not re-enter the same map.
template <typename V>
class ShardedMap {
public:
    explicit ShardedMap(size_t shard_count = 16)
        : shards_(shard_count == 0 ? 1 : shard_count) {}

    ShardedMap(const ShardedMap&) = delete;
    ShardedMap& operator=(const ShardedMap&) = delete;

    // Run fn(value, created) under the shard lock, default-inserting when absent.
    template <typename Fn>
    auto upsert(const std::string& key, Fn&& fn) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto [it, created] = shard.map.try_emplace(key);
        return fn(it->second, created);
    }

    // Run fn(value) under the shard lock if the key exists.
    template <typename Fn>
    bool visit(const std::string& key, Fn&& fn) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) return false;
        fn(it->second);
        return true;
    }

    template <typename Fn>
    bool visit(const std::string& key, Fn&& fn) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) return false;
        fn(it->second);
        return true;
    }

    std::optional<V> get(const std::string& key) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) return std::nullopt;
        return it->second;
    }

    bool contains(const std::string& key) const {
        const auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.map.count(key) > 0;
    }

    void put(const std::string& key, V value) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        shard.map[key] = std::move(value);
    }

    // Remove and return the value, if present.
    std::optional<V> take(const std::string& key) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.map.find(key);
        if (it == shard.map.end()) return std::nullopt;
        std::optional<V> out(std::move(it->second));
        shard.map.erase(it);
        return out;
    }

    bool erase(const std::string& key) {
        auto& shard = shard_for(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        return shard.map.erase(key) > 0;
    }

    // Remove every entry where pred(key, value) holds, one shard at a time.
    // Returns the removed entries.
    template <typename Pred>
    std::vector<std::pair<std::string, V>> erase_if(Pred&& pred) {
        std::vector<std::pair<std::string, V>> removed;
        for (auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (auto it = shard.map.begin(); it != shard.map.end(); ) {
                if (pred(it->first, it->second)) {
                    removed.emplace_back(it->first, std::move(it->second));
                    it = shard.map.erase(it);
                } else {
                    ++it;
                }
            }
        }
        return removed;
    }

    // Visit every entry, one shard at a time. Not a global snapshot.
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            for (const auto& [key, value] : shard.map) {
                fn(key, value);
            }
        }
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        for_each([&out](const std::string& key, const V&) { out.push_back(key); });
        return out;
    }

    size_t size() const {
        size_t n = 0;
        for (const auto& shard : shards_) {
            std::lock_guard<std::mutex> lock(shard.mutex);
            n += shard.map.size();
        }
        return n;
    }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, V> map;
    };

    Shard& shard_for(const std::string& key) {
        return shards_[std::hash<std::string>{}(key) % shards_.size()];
    }

    const Shard& shard_for(const std::string& key) const {
        return shards_[std::hash<std::string>{}(key) % shards_.size()];
    }

    std::vector<Shard> shards_;
};

} // namespace parley
