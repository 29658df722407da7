#include "provider_factory.hpp"
#include "errors.hpp"
#include "redis_provider.hpp"
#include "replay_provider.hpp"
#include <fmt/format.h>
#include <spdlog/spdlog.h>

std::unique_ptr<Provider> make_provider(const Config& config, std::shared_ptr<RedisBus> redis) {
    if (config.provider == "redis") {
        if (!redis) {
            throw ConfigError("redis provider needs a Redis connection");
        }
        return std::make_unique<RedisProvider>(redis, config.stream_ticks);
    }
    if (config.provider == "replay") {
        return std::make_unique<ReplayProvider>(config.replay_file,
                                                static_cast<size_t>(config.replay_batch));
    }
    throw ConfigError(fmt::format("unknown provider type '{}'", config.provider));
}
