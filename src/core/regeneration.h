#pragma once

namespace tessera::core {

enum class RegenerationDecision { FULL, SELECTIVE, NONE };

struct RegenerationState {
    bool has_atlas = false;
    bool visible_set_changed = false;
    bool lod_boundary_crossed = false;
    bool atlas_invalidated = false;
    bool focus_changed = false;
};

// First matching rule wins: missing atlas, invalidation, then visible set or level
// change all force FULL; a focus change alone is SELECTIVE.
RegenerationDecision decide_regeneration(const RegenerationState& state);

const char* decision_name(RegenerationDecision decision);

} // namespace tessera::core
