#include "pillars.hpp"
#include <fmt/format.h>

namespace {

std::string format_shares(int64_t shares) {
    if (shares >= 1000000000) return fmt::format("{:.1f}B", shares / 1e9);
    if (shares >= 1000000) return fmt::format("{:.1f}M", shares / 1e6);
    if (shares >= 1000) return fmt::format("{:.0f}K", shares / 1e3);
    return std::to_string(shares);
}

} // namespace

PillarScore PillarEvaluator::evaluate_float(const SymbolState& state, const FloatBands& bands) {
    if (!state.float_shares || *state.float_shares <= 0) {
        return insufficient(state, PillarId::Float, "float unknown");
    }

    int64_t shares = *state.float_shares;

    PillarScore result = base_score(state, PillarId::Float);
    result.value = static_cast<double>(shares);
    result.passed = shares <= bands.max_shares;

    if (shares <= bands.small_max) {
        result.score = 100.0;
    } else if (shares <= bands.max_shares) {
        result.score = 70.0;
    } else if (shares <= bands.large_max) {
        result.score = 35.0;
    } else {
        result.score = 10.0;
    }

    result.reason = fmt::format("float {} {} {}", format_shares(shares),
                                result.passed ? "within" : "exceeds",
                                format_shares(bands.max_shares));
    return result;
}
