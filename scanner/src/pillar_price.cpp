#include "pillars.hpp"
#include <algorithm>
#include <fmt/format.h>

PillarScore PillarEvaluator::evaluate_price(const SymbolState& state, const PriceBands& bands) {
    if (state.prices.empty() || state.prices.size() < bands.min_points) {
        return insufficient(state, PillarId::Price, "not enough price history");
    }

    double last = state.prices.back().price;
    double high = last;
    double low = last;
    for (const auto& p : state.prices) {
        high = std::max(high, p.price);
        low = std::min(low, p.price);
    }

    // 1.0 at the window high, 0.0 at the low
    double position = 0.5;
    if (high > low) {
        position = (last - low) / (high - low);
    }

    bool in_band = last >= bands.min && last <= bands.max;

    PillarScore result = base_score(state, PillarId::Price);
    result.value = last;
    result.passed = in_band;
    if (in_band) {
        result.score = 50.0 + 50.0 * position;
        result.reason = fmt::format("${:.2f} within ${:.2f}-${:.2f}", last, bands.min, bands.max);
    } else {
        result.score = 25.0 * position;
        result.reason = fmt::format("${:.2f} {} ${:.2f}", last,
                                    last < bands.min ? "below minimum" : "above maximum",
                                    last < bands.min ? bands.min : bands.max);
    }
    result.score = std::clamp(result.score, 0.0, kMaxPillarScore);
    return result;
}
