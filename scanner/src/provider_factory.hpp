#pragma once

#include "config.hpp"
#include "provider.hpp"
#include "redis_bus.hpp"
#include <memory>

// Builds the Provider named by config.provider. `redis` is required for the
// redis provider. Throws ConfigError for an unknown provider type.
std::unique_ptr<Provider> make_provider(const Config& config, std::shared_ptr<RedisBus> redis);
