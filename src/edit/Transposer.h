#pragma once

#include "CursorModel.h"
#include "../model/TabSession.h"
#include <array>

namespace edit {

enum class OctaveDirection
{
    Up,
    Down
};

class Transposer
{
public:
    using StringDeltas = std::array<int, model::Tuning::NUM_STRINGS>;

    // Shifts every note in the inclusive cell range by its string's delta
    static model::EditResult transpose(model::TabSession& session, const TabContext& begin,
                                       const TabContext& end, const StringDeltas& deltas);
    static model::EditResult transposeUniform(model::TabSession& session, const TabContext& begin,
                                              const TabContext& end, int semitones);

    // Copies the source staff into the session tuning, keeping the sound
    static model::EditResult copyRetune(model::TabSession& session, const TabContext& source);

    // Out-of-range shifts are silently ignored
    static model::EditResult octaveShift(model::TabSession& session, const TabContext& ctx, OctaveDirection direction);

    // Shortest move from one open string pitch to another, in (-6, 6]
    static int nearestInterval(int fromPitch, int toPitch);
};

} // namespace edit
