#include "aggregator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

Aggregator::Aggregator(const ScannerConfig& config)
    : weights_(config.weights)
    , pillars_(config.pillars)
    , weight_sum_(0.0)
{
    for (auto id : kAllPillars) {
        weight_sum_ += config.effective_weight(id);
    }
    if (!std::isfinite(weight_sum_) || weight_sum_ <= 0.0) {
        throw ConfigError(fmt::format("aggregator needs a positive finite total weight, got {}",
                                      weight_sum_));
    }
}

CompositeScore Aggregator::aggregate(const std::string& symbol,
                                     const std::vector<PillarScore>& scores,
                                     uint64_t current_version) const {
    if (scores.size() != kPillarCount) {
        throw IncompleteScoreSetError(fmt::format("{}: expected {} pillar scores, got {}",
                                                  symbol, kPillarCount, scores.size()));
    }

    CompositeScore result;
    result.symbol = symbol;
    result.version = current_version;

    std::array<bool, kPillarCount> seen{};
    for (const auto& score : scores) {
        size_t idx = pillar_index(score.pillar);
        if (seen[idx]) {
            throw IncompleteScoreSetError(fmt::format("{}: pillar {} supplied twice",
                                                      symbol, pillar_name(score.pillar)));
        }
        if (score.symbol != symbol) {
            throw IncompleteScoreSetError(fmt::format("{}: score for {} belongs to {}",
                                                      symbol, pillar_name(score.pillar), score.symbol));
        }
        if (score.version != current_version) {
            throw IncompleteScoreSetError(fmt::format("{}: {} score is stale (v{} vs v{})",
                                                      symbol, pillar_name(score.pillar),
                                                      score.version, current_version));
        }
        seen[idx] = true;
        result.pillars[idx] = score;
    }

    // Weighted mean over the fixed pillar order so the sum is reproducible
    double weighted = 0.0;
    result.passed_all = true;
    for (auto id : kAllPillars) {
        const auto& score = result.pillars[pillar_index(id)];
        double w = pillars_.enabled(id) ? weights_.get(id) : 0.0;
        weighted += (w / weight_sum_) * score.score;

        if (!pillars_.enabled(id)) continue;
        if (score.passed) {
            result.passed_pillars.push_back(pillar_name(id));
        } else {
            result.failed_pillars.push_back(pillar_name(id));
            result.passed_all = false;
        }
    }
    result.composite = weighted;
    return result;
}

bool Aggregator::ranks_before(const CompositeScore& a, const CompositeScore& b) {
    // NaN ranks after every number
    bool a_nan = std::isnan(a.composite);
    bool b_nan = std::isnan(b.composite);
    if (a_nan != b_nan) {
        return b_nan;
    }
    if (!a_nan && a.composite != b.composite) {
        return a.composite > b.composite;
    }
    return a.symbol < b.symbol;
}

void Aggregator::rank(std::vector<CompositeScore>& entries) {
    std::sort(entries.begin(), entries.end(), ranks_before);
    for (size_t i = 0; i < entries.size(); i++) {
        entries[i].rank = static_cast<int>(i + 1);
    }
}
