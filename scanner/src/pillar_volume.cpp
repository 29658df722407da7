#include "pillars.hpp"
#include <algorithm>
#include <fmt/format.h>

PillarScore PillarEvaluator::evaluate_volume(const SymbolState& state, const VolumeBands& bands) {
    const auto& volumes = state.volumes;
    size_t recent_count = std::min(bands.recent_ticks, volumes.size());
    size_t baseline_count = volumes.size() - recent_count;
    if (recent_count == 0) {
        return insufficient(state, PillarId::Volume, "no volume yet");
    }

    double recent_sum = 0.0;
    for (size_t i = baseline_count; i < volumes.size(); i++) {
        recent_sum += volumes[i].volume;
    }

    // A historical baseline from reference data wins over the trailing window
    double baseline_avg = 0.0;
    if (state.baseline_volume) {
        baseline_avg = *state.baseline_volume;
    } else {
        if (baseline_count == 0 || baseline_count < bands.min_baseline_points) {
            return insufficient(state, PillarId::Volume, "no trailing volume baseline");
        }
        double baseline_sum = 0.0;
        for (size_t i = 0; i < baseline_count; i++) {
            baseline_sum += volumes[i].volume;
        }
        baseline_avg = baseline_sum / static_cast<double>(baseline_count);
    }
    if (baseline_avg <= 0.0) {
        return insufficient(state, PillarId::Volume, "zero baseline volume");
    }

    double recent_avg = recent_sum / static_cast<double>(recent_count);
    double rvol = recent_avg / baseline_avg;

    PillarScore result = base_score(state, PillarId::Volume);
    result.value = rvol;
    result.score = kMaxPillarScore * std::min(1.0, rvol / bands.target_rvol);
    result.passed = rvol >= bands.min_rvol;
    result.reason = fmt::format("RVol {:.1f}x vs threshold {:.1f}x", rvol, bands.min_rvol);
    return result;
}
