#include "pillars.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace {

bool contains(const std::vector<std::string>& list, const std::string& value) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

const char* tier_name(CatalystTier tier) {
    switch (tier) {
        case CatalystTier::None: return "none";
        case CatalystTier::Excluded: return "excluded";
        case CatalystTier::Unclassified: return "unclassified";
        case CatalystTier::Aging: return "aging";
        case CatalystTier::Fresh: return "fresh";
    }
    return "none";
}

} // namespace

CatalystTier PillarEvaluator::classify_catalyst(const CatalystTag& tag, int64_t now_ms,
                                                const CatalystBands& bands) {
    if (contains(bands.excluded, tag.category)) {
        return CatalystTier::Excluded;
    }
    if (!contains(bands.allowed, tag.category)) {
        return CatalystTier::Unclassified;
    }
    if (now_ms - tag.ts_ms <= bands.fresh_ms) {
        return CatalystTier::Fresh;
    }
    return CatalystTier::Aging;
}

PillarScore PillarEvaluator::evaluate_catalyst(const SymbolState& state, const CatalystBands& bands) {
    CatalystTier best = CatalystTier::None;
    const CatalystTag* best_tag = nullptr;

    for (const auto& tag : state.catalysts) {
        CatalystTier tier = classify_catalyst(tag, state.last_ts_ms, bands);
        if (static_cast<int>(tier) > static_cast<int>(best)) {
            best = tier;
            best_tag = &tag;
        }
    }

    PillarScore result = base_score(state, PillarId::Catalyst);
    result.value = static_cast<double>(best);
    result.score = static_cast<double>(best);
    result.passed = !bands.require_news || static_cast<int>(best) >= static_cast<int>(CatalystTier::Aging);

    if (best_tag) {
        result.reason = fmt::format("{} catalyst '{}': {}", tier_name(best),
                                    best_tag->category, best_tag->headline.substr(0, 50));
    } else {
        result.reason = "no catalyst within retention";
    }
    return result;
}
