#include "pillars.hpp"

PillarEvaluator::PillarEvaluator(const PillarConfig& config)
    : config_(config) {}

PillarScore PillarEvaluator::evaluate(PillarId pillar, const SymbolState& state) const {
    if (!config_.enabled(pillar)) {
        return disabled(state, pillar);
    }

    switch (pillar) {
        case PillarId::Price: return evaluate_price(state, config_.price);
        case PillarId::Momentum: return evaluate_momentum(state, config_.momentum);
        case PillarId::Volume: return evaluate_volume(state, config_.volume);
        case PillarId::Catalyst: return evaluate_catalyst(state, config_.catalyst);
        case PillarId::Float: return evaluate_float(state, config_.float_size);
    }
    return insufficient(state, pillar, "unknown pillar");
}

PillarSet PillarEvaluator::evaluate_all(const SymbolState& state) const {
    PillarSet scores;
    for (auto id : kAllPillars) {
        scores[pillar_index(id)] = evaluate(id, state);
    }
    return scores;
}

PillarScore PillarEvaluator::base_score(const SymbolState& state, PillarId pillar) {
    PillarScore score;
    score.symbol = state.symbol;
    score.pillar = pillar;
    score.version = state.version;
    return score;
}

PillarScore PillarEvaluator::insufficient(const SymbolState& state, PillarId pillar,
                                          const char* reason) {
    PillarScore score = base_score(state, pillar);
    score.score = kInsufficientDataScore;
    score.insufficient_data = true;
    score.passed = false;
    score.reason = reason;
    return score;
}

PillarScore PillarEvaluator::disabled(const SymbolState& state, PillarId pillar) {
    PillarScore score = base_score(state, pillar);
    score.score = kInsufficientDataScore;
    score.passed = true;
    score.reason = "disabled";
    return score;
}
