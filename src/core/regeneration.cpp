#include "regeneration.h"

namespace tessera::core {

RegenerationDecision decide_regeneration(const RegenerationState& state) {
    if (!state.has_atlas) {
        return RegenerationDecision::FULL;
    }
    if (state.atlas_invalidated) {
        return RegenerationDecision::FULL;
    }
    if (state.visible_set_changed || state.lod_boundary_crossed) {
        return RegenerationDecision::FULL;
    }
    if (state.focus_changed) {
        return RegenerationDecision::SELECTIVE;
    }
    return RegenerationDecision::NONE;
}

const char* decision_name(RegenerationDecision decision) {
    switch (decision) {
        case RegenerationDecision::FULL: return "full";
        case RegenerationDecision::SELECTIVE: return "selective";
        case RegenerationDecision::NONE: return "none";
    }
    return "unknown";
}

} // namespace tessera::core
