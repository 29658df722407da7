#pragma once

#include "types.hpp"
#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    size_t size = 0;
};

// Memoizes pillar scores keyed by (symbol, pillar, version). One slot is kept
// per (symbol, pillar); an entry for an older version counts as a miss and is
// overwritten by the next computation. Capacity is enforced per shard, LRU.
class ScoreCache {
public:
    using ComputeFn = std::function<PillarScore()>;

    explicit ScoreCache(size_t capacity, size_t shards = 16);

    // compute runs outside the shard lock; a throwing compute stores nothing
    PillarScore get_or_compute(const std::string& symbol, PillarId pillar,
                               uint64_t version, const ComputeFn& compute);

    bool contains(const std::string& symbol, PillarId pillar, uint64_t version) const;
    void invalidate(const std::string& symbol);
    void clear();

    CacheStats stats() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t shard_count() const { return shards_.size(); }

private:
    struct Key {
        std::string symbol;
        PillarId pillar;

        bool operator==(const Key& other) const {
            return pillar == other.pillar && symbol == other.symbol;
        }
    };

    struct KeyHash {
        size_t operator()(const Key& key) const {
            return std::hash<std::string>()(key.symbol) * 31 + pillar_index(key.pillar);
        }
    };

    struct Node {
        Key key;
        uint64_t version;
        PillarScore score;
    };

    struct Shard {
        mutable std::mutex mutex;
        std::list<Node> lru;  // front = most recently used
        std::unordered_map<Key, std::list<Node>::iterator, KeyHash> index;
    };

    Shard& shard_for(const std::string& symbol) const;
    void store(Shard& shard, const Key& key, uint64_t version, const PillarScore& score);

    size_t capacity_;
    size_t shard_capacity_;
    std::vector<std::unique_ptr<Shard>> shards_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};
