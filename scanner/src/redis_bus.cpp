#include "redis_bus.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace {

using Attrs = std::unordered_map<std::string, std::string>;
using Item = std::pair<std::string, sw::redis::Optional<Attrs>>;
using ItemStream = std::vector<Item>;

}

RedisBus::RedisBus(const std::string& redis_url) {
    redis_ = std::make_shared<sw::redis::Redis>(redis_url);
    spdlog::info("Connected to Redis: {}", redis_url);
}

std::vector<std::pair<std::string, std::string>>
RedisBus::read_stream(const std::string& stream, const std::string& last_id,
                      long long count, std::chrono::milliseconds block) {
    std::unordered_map<std::string, ItemStream> items;
    if (block.count() > 0) {
        redis_->xread(stream, last_id, block, count, std::inserter(items, items.end()));
    } else {
        // BLOCK 0 would wait forever
        redis_->xread(stream, last_id, count, std::inserter(items, items.end()));
    }

    std::vector<std::pair<std::string, std::string>> results;
    for (const auto& [_, item_stream] : items) {
        for (const auto& item : item_stream) {
            if (!item.second) continue;
            auto it = item.second->find("data");
            if (it != item.second->end()) {
                results.emplace_back(item.first, it->second);
            } else {
                spdlog::debug("Stream entry {} has no data field", item.first);
            }
        }
    }
    return results;
}

void RedisBus::publish(const std::string& stream, const nlohmann::json& data, long long maxlen) {
    try {
        std::unordered_map<std::string, std::string> fields;
        fields["data"] = data.dump();
        redis_->xadd(stream, "*", fields.begin(), fields.end(), maxlen, true);
    } catch (const std::exception& e) {
        spdlog::error("Failed to publish to {}: {}", stream, e.what());
    }
}

bool RedisBus::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Redis ping failed: {}", e.what());
        return false;
    }
}
