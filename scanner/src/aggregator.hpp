#pragma once

#include "scanner_config.hpp"
#include "types.hpp"
#include <string>
#include <vector>

class Aggregator {
public:
    explicit Aggregator(const ScannerConfig& config);

    // Throws IncompleteScoreSetError unless all five pillars are present,
    // belong to `symbol` and carry `current_version`.
    CompositeScore aggregate(const std::string& symbol,
                             const std::vector<PillarScore>& scores,
                             uint64_t current_version) const;

    // Sorts best first and assigns 1-based ranks.
    static void rank(std::vector<CompositeScore>& entries);

    // Composite descending (NaN last), then symbol ascending.
    static bool ranks_before(const CompositeScore& a, const CompositeScore& b);

private:
    PillarWeights weights_;
    PillarConfig pillars_;
    double weight_sum_;
};
