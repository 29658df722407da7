#include "pillars.hpp"
#include <algorithm>
#include <fmt/format.h>

PillarScore PillarEvaluator::evaluate_momentum(const SymbolState& state, const MomentumBands& bands) {
    size_t required = std::max<size_t>(2, bands.lookback);
    if (state.prices.size() < required) {
        return insufficient(state, PillarId::Momentum, "lookback window not yet filled");
    }

    // Oldest point of the last `lookback` ticks
    double reference = state.prices[state.prices.size() - required].price;
    double last = state.prices.back().price;
    if (reference <= 0.0) {
        return insufficient(state, PillarId::Momentum, "reference price is zero");
    }

    double roc_pct = ((last - reference) / reference) * 100.0;
    double normalized = std::clamp(roc_pct / bands.full_scale_pct, -1.0, 1.0);

    PillarScore result = base_score(state, PillarId::Momentum);
    result.value = roc_pct;
    result.score = std::clamp(kMomentumNeutralScore + kMomentumNeutralScore * normalized,
                              0.0, kMaxPillarScore);
    result.passed = roc_pct >= bands.min_pct_move;
    result.reason = fmt::format("{:+.1f}% over {} ticks (threshold {:.1f}%)",
                                roc_pct, required, bands.min_pct_move);
    return result;
}
