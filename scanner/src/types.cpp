#include "types.hpp"

const char* pillar_name(PillarId id) {
    switch (id) {
        case PillarId::Price: return "price";
        case PillarId::Momentum: return "momentum";
        case PillarId::Volume: return "volume";
        case PillarId::Catalyst: return "catalyst";
        case PillarId::Float: return "float";
    }
    return "unknown";
}

bool operator==(const PillarScore& a, const PillarScore& b) {
    return a.symbol == b.symbol &&
           a.pillar == b.pillar &&
           a.version == b.version &&
           a.score == b.score &&
           a.value == b.value &&
           a.passed == b.passed &&
           a.insufficient_data == b.insufficient_data &&
           a.reason == b.reason;
}

bool operator!=(const PillarScore& a, const PillarScore& b) {
    return !(a == b);
}

const char* to_string(CycleStatus status) {
    switch (status) {
        case CycleStatus::Ok: return "ok";
        case CycleStatus::Degraded: return "degraded";
    }
    return "unknown";
}

const char* to_string(CyclePhase phase) {
    switch (phase) {
        case CyclePhase::Idle: return "idle";
        case CyclePhase::Ingesting: return "ingesting";
        case CyclePhase::Evaluating: return "evaluating";
        case CyclePhase::Aggregating: return "aggregating";
        case CyclePhase::Emitted: return "emitted";
    }
    return "unknown";
}
