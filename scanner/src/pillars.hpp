#pragma once

#include "scanner_config.hpp"
#include "symbol_store.hpp"
#include "types.hpp"

constexpr double kInsufficientDataScore = 0.0;
constexpr double kMaxPillarScore = 100.0;
constexpr double kMomentumNeutralScore = 50.0;

// Discrete catalyst tiers; the enum value is the pillar score.
enum class CatalystTier {
    None = 0,
    Excluded = 10,
    Unclassified = 30,
    Aging = 60,
    Fresh = 100
};

// Pure scoring functions over an immutable SymbolState. Every function is
// total: missing or boundary data yields a defined fallback score.
class PillarEvaluator {
public:
    explicit PillarEvaluator(const PillarConfig& config);

    PillarScore evaluate(PillarId pillar, const SymbolState& state) const;
    PillarSet evaluate_all(const SymbolState& state) const;

    // Price: position within the window's high/low, gated by the price band
    static PillarScore evaluate_price(const SymbolState& state, const PriceBands& bands);

    // Momentum: rate of change over the lookback, 50 = flat
    static PillarScore evaluate_momentum(const SymbolState& state, const MomentumBands& bands);

    // Volume: recent average vs trailing baseline
    static PillarScore evaluate_volume(const SymbolState& state, const VolumeBands& bands);

    // Catalyst: best tier among active tags
    static PillarScore evaluate_catalyst(const SymbolState& state, const CatalystBands& bands);
    static CatalystTier classify_catalyst(const CatalystTag& tag, int64_t now_ms,
                                          const CatalystBands& bands);

    // Float: small/medium/large bands
    static PillarScore evaluate_float(const SymbolState& state, const FloatBands& bands);

private:
    PillarConfig config_;

    static PillarScore base_score(const SymbolState& state, PillarId pillar);
    static PillarScore insufficient(const SymbolState& state, PillarId pillar,
                                    const char* reason);
    static PillarScore disabled(const SymbolState& state, PillarId pillar);
};
