#include "score_cache.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

ScoreCache::ScoreCache(size_t capacity, size_t shards)
    : capacity_(capacity)
{
    // Each shard must hold one symbol's five scores and the shards together
    // must never exceed `capacity`, so small caches get fewer shards.
    size_t shard_count = std::max<size_t>(1, std::min(shards, capacity / kPillarCount));
    shard_capacity_ = std::max<size_t>(1, capacity / shard_count);

    shards_.reserve(shard_count);
    for (size_t i = 0; i < shard_count; i++) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

ScoreCache::Shard& ScoreCache::shard_for(const std::string& symbol) const {
    size_t idx = std::hash<std::string>()(symbol) % shards_.size();
    return *shards_[idx];
}

PillarScore ScoreCache::get_or_compute(const std::string& symbol, PillarId pillar,
                                       uint64_t version, const ComputeFn& compute) {
    Shard& shard = shard_for(symbol);
    Key key{symbol, pillar};

    {
        std::lock_guard<std::mutex> lock(shard.mutex);
        auto it = shard.index.find(key);
        if (it != shard.index.end() && it->second->version == version) {
            shard.lru.splice(shard.lru.begin(), shard.lru, it->second);
            hits_++;
            return it->second->score;
        }
    }

    misses_++;
    PillarScore score = compute();

    std::lock_guard<std::mutex> lock(shard.mutex);
    store(shard, key, version, score);
    return score;
}

void ScoreCache::store(Shard& shard, const Key& key, uint64_t version, const PillarScore& score) {
    auto it = shard.index.find(key);
    if (it != shard.index.end()) {
        // Never replace a newer version with an older one
        if (it->second->version > version) {
            return;
        }
        it->second->version = version;
        it->second->score = score;
        shard.lru.splice(shard.lru.begin(), shard.lru, it->second);
        return;
    }

    shard.lru.push_front(Node{key, version, score});
    shard.index[key] = shard.lru.begin();

    while (shard.lru.size() > shard_capacity_) {
        shard.index.erase(shard.lru.back().key);
        shard.lru.pop_back();
        evictions_++;
    }
}

bool ScoreCache::contains(const std::string& symbol, PillarId pillar, uint64_t version) const {
    Shard& shard = shard_for(symbol);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.index.find(Key{symbol, pillar});
    return it != shard.index.end() && it->second->version == version;
}

void ScoreCache::invalidate(const std::string& symbol) {
    Shard& shard = shard_for(symbol);
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (auto id : kAllPillars) {
        auto it = shard.index.find(Key{symbol, id});
        if (it != shard.index.end()) {
            shard.lru.erase(it->second);
            shard.index.erase(it);
        }
    }
    spdlog::debug("Score cache invalidated for {}", symbol);
}

void ScoreCache::clear() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->lru.clear();
        shard->index.clear();
    }
}

CacheStats ScoreCache::stats() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.evictions = evictions_.load();
    s.size = size();
    return s;
}

size_t ScoreCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->lru.size();
    }
    return total;
}
