#include "scanner_config.hpp"
#include "errors.hpp"
#include <cmath>
#include <fmt/format.h>

bool PillarConfig::enabled(PillarId id) const {
    switch (id) {
        case PillarId::Price: return price.enabled;
        case PillarId::Momentum: return momentum.enabled;
        case PillarId::Volume: return volume.enabled;
        case PillarId::Catalyst: return catalyst.enabled;
        case PillarId::Float: return float_size.enabled;
    }
    return false;
}

double PillarWeights::get(PillarId id) const {
    switch (id) {
        case PillarId::Price: return price;
        case PillarId::Momentum: return momentum;
        case PillarId::Volume: return volume;
        case PillarId::Catalyst: return catalyst;
        case PillarId::Float: return float_size;
    }
    return 0.0;
}

void PillarWeights::set(PillarId id, double weight) {
    switch (id) {
        case PillarId::Price: price = weight; break;
        case PillarId::Momentum: momentum = weight; break;
        case PillarId::Volume: volume = weight; break;
        case PillarId::Catalyst: catalyst = weight; break;
        case PillarId::Float: float_size = weight; break;
    }
}

double ScannerConfig::effective_weight(PillarId id) const {
    return pillars.enabled(id) ? weights.get(id) : 0.0;
}

void ScannerConfig::validate() const {
    double weight_sum = 0.0;
    for (auto id : kAllPillars) {
        double w = weights.get(id);
        if (!std::isfinite(w) || w < 0.0) {
            throw ConfigError(fmt::format("weight for pillar {} must be >= 0, got {}",
                                          pillar_name(id), w));
        }
        weight_sum += effective_weight(id);
    }
    if (!std::isfinite(weight_sum)) {
        throw ConfigError("pillar weights overflow when summed");
    }
    if (weight_sum <= 0.0) {
        throw ConfigError("at least one enabled pillar must carry a positive weight");
    }

    if (price_window < 2) {
        throw ConfigError("price_window must hold at least 2 points");
    }
    if (volume_window < 2) {
        throw ConfigError("volume_window must hold at least 2 points");
    }
    if (pillars.price.min > pillars.price.max) {
        throw ConfigError("price band min exceeds max");
    }
    if (pillars.momentum.lookback < 2) {
        throw ConfigError("momentum lookback must be at least 2 ticks");
    }
    if (pillars.momentum.lookback > price_window) {
        throw ConfigError(fmt::format("momentum lookback {} exceeds price_window {}",
                                      pillars.momentum.lookback, price_window));
    }
    if (pillars.momentum.full_scale_pct <= 0.0) {
        throw ConfigError("momentum full_scale_pct must be positive");
    }
    if (pillars.volume.recent_ticks == 0 || pillars.volume.recent_ticks >= volume_window) {
        throw ConfigError("volume recent_ticks must be in [1, volume_window)");
    }
    if (pillars.volume.target_rvol <= 0.0) {
        throw ConfigError("volume target_rvol must be positive");
    }
    if (pillars.catalyst.retention_ms <= 0 || pillars.catalyst.fresh_ms < 0) {
        throw ConfigError("catalyst retention must be positive and fresh window non-negative");
    }
    if (!(pillars.float_size.small_max <= pillars.float_size.max_shares &&
          pillars.float_size.max_shares <= pillars.float_size.large_max)) {
        throw ConfigError("float bands must satisfy small_max <= max_shares <= large_max");
    }

    if (cycle_interval_ms <= 0 || cycle_deadline_ms <= 0) {
        throw ConfigError("cycle interval and deadline must be positive");
    }
    if (ingest_budget_ms <= 0 || ingest_budget_ms >= cycle_deadline_ms) {
        throw ConfigError("ingest budget must be positive and below the cycle deadline");
    }
    if (cache_capacity < kPillarCount) {
        throw ConfigError("cache_capacity must hold at least one symbol's scores");
    }
    if (cache_shards == 0) {
        throw ConfigError("cache_shards must be positive");
    }
    if (worker_threads == 0) {
        throw ConfigError("worker_threads must be positive");
    }
}
