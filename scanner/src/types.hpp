#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// The five scoring dimensions. Order is the evaluation and reporting order.
enum class PillarId {
    Price = 0,
    Momentum = 1,
    Volume = 2,
    Catalyst = 3,
    Float = 4
};

constexpr size_t kPillarCount = 5;

constexpr std::array<PillarId, kPillarCount> kAllPillars = {
    PillarId::Price,
    PillarId::Momentum,
    PillarId::Volume,
    PillarId::Catalyst,
    PillarId::Float
};

inline size_t pillar_index(PillarId id) {
    return static_cast<size_t>(id);
}

const char* pillar_name(PillarId id);

struct CatalystTag {
    std::string category;  // earnings, fda, mna, contracts, guidance, ...
    std::string headline;
    int64_t ts_ms = 0;     // 0 = stamped with the carrying tick's time
};

// One market-data update for one symbol, as emitted by a Provider.
struct Tick {
    std::string symbol;
    int64_t ts_ms = 0;
    double price = 0.0;
    double volume = 0.0;   // volume traded since the previous tick
    uint64_t seq = 0;      // provider sequence number, 0 = unsequenced
    std::optional<int64_t> float_shares;
    std::optional<CatalystTag> catalyst;
};

struct PillarScore {
    std::string symbol;
    PillarId pillar = PillarId::Price;
    uint64_t version = 0;       // SymbolState version the score was derived from
    double score = 0.0;         // 0..100
    double value = 0.0;         // measured input (price, % move, rvol, tier, shares)
    bool passed = false;
    bool insufficient_data = false;
    std::string reason;
};

bool operator==(const PillarScore& a, const PillarScore& b);
bool operator!=(const PillarScore& a, const PillarScore& b);

using PillarSet = std::array<PillarScore, kPillarCount>;

struct CompositeScore {
    std::string symbol;
    uint64_t version = 0;
    PillarSet pillars;
    double composite = 0.0;
    int rank = 0;

    bool passed_all = false;
    std::vector<std::string> passed_pillars;
    std::vector<std::string> failed_pillars;

    // Display summary
    double last_price = 0.0;
    double pct_change = 0.0;
    double relative_volume = 0.0;
    std::optional<int64_t> float_shares;
    std::string catalyst;
};

enum class CycleStatus {
    Ok,
    Degraded
};

enum class CyclePhase {
    Idle,
    Ingesting,
    Evaluating,
    Aggregating,
    Emitted
};

const char* to_string(CycleStatus status);
const char* to_string(CyclePhase phase);

struct ScanResult {
    uint64_t cycle_id = 0;
    int64_t started_at_ms = 0;
    int64_t duration_us = 0;
    CycleStatus status = CycleStatus::Ok;
    std::vector<std::string> degraded_reasons;

    std::vector<CompositeScore> entries;    // ranked, best first
    std::vector<std::string> skipped_symbols;
    std::vector<std::string> failed_symbols;

    size_t ticks_ingested = 0;
    size_t ticks_rejected = 0;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;

    bool degraded() const { return status == CycleStatus::Degraded; }
};
