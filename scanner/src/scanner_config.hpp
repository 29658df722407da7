#pragma once

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

struct PriceBands {
    bool enabled = true;
    double min = 2.0;
    double max = 20.0;
    size_t min_points = 2;
};

struct MomentumBands {
    bool enabled = true;
    size_t lookback = 10;          // ticks
    double full_scale_pct = 10.0;  // ROC mapped to score 100 (or 0 when negative)
    double min_pct_move = 10.0;
};

struct VolumeBands {
    bool enabled = true;
    size_t recent_ticks = 5;
    size_t min_baseline_points = 1;
    double target_rvol = 5.0;      // rvol mapped to score 100
    double min_rvol = 5.0;
};

struct CatalystBands {
    bool enabled = true;
    int64_t retention_ms = 24LL * 3600 * 1000;
    int64_t fresh_ms = 3600LL * 1000;
    bool require_news = true;
    size_t max_tags = 16;
    std::vector<std::string> allowed = {"earnings", "fda", "mna", "contracts", "guidance"};
    std::vector<std::string> excluded = {"rumor", "sympathy", "social", "technical"};
};

struct FloatBands {
    bool enabled = true;
    int64_t small_max = 10000000;
    int64_t max_shares = 20000000;
    int64_t large_max = 100000000;
};

struct PillarConfig {
    PriceBands price;
    MomentumBands momentum;
    VolumeBands volume;
    CatalystBands catalyst;
    FloatBands float_size;

    bool enabled(PillarId id) const;
};

// Equal weighting by default; normalised by their sum at aggregation time.
struct PillarWeights {
    double price = 1.0;
    double momentum = 1.0;
    double volume = 1.0;
    double catalyst = 1.0;
    double float_size = 1.0;

    double get(PillarId id) const;
    void set(PillarId id, double weight);
};

struct ScannerConfig {
    PillarConfig pillars;
    PillarWeights weights;

    // SymbolState windows
    size_t price_window = 256;
    size_t volume_window = 256;

    // Cycle timing
    int cycle_interval_ms = 1000;
    int cycle_deadline_ms = 500;
    int ingest_budget_ms = 100;

    // Score cache
    size_t cache_capacity = 4096;
    size_t cache_shards = 16;

    size_t worker_threads = 4;

    // Weight actually applied: zero for disabled pillars.
    double effective_weight(PillarId id) const;

    void validate() const;
};
