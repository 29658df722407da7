#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include <sw/redis++/redis++.h>

class RedisBus {
public:
    explicit RedisBus(const std::string& redis_url);

    // XREAD entries after `last_id`, returning (id, "data" field) pairs.
    // Blocks up to `block` when positive. Throws sw::redis::Error.
    std::vector<std::pair<std::string, std::string>>
        read_stream(const std::string& stream, const std::string& last_id,
                    long long count, std::chrono::milliseconds block);

    // XADD with an approximate MAXLEN trim
    void publish(const std::string& stream, const nlohmann::json& data, long long maxlen = 10000);
    bool ping();

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};
