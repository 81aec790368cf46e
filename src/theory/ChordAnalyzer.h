#pragma once

#include "ChordTable.h"
#include "../edit/CursorModel.h"
#include "../model/ChordAnalysis.h"
#include "../model/TabSession.h"
#include <array>
#include <string>

namespace theory {

class ChordAnalyzer
{
public:
    static constexpr int NO_NOTE = -1;
    using Frets = std::array<int, model::Tuning::NUM_STRINGS>;   // NO_NOTE for a muted string

    // Names the chord in ctx's column. Repeating the call on the same column
    // right after an analysis moves the root to the next string with a note.
    // The result is kept on the session for labelChord.
    static model::EditResult analyze(model::TabSession& session, const edit::TabContext& ctx);

    // Writes the pending chord name above its root column
    static model::EditResult labelChord(model::TabSession& session, const edit::TabContext& ctx);

    // Pitch analysis of one column, without session state
    static model::ChordAnalysis analyzeFrets(const Frets& frets, const model::Tuning& tuning,
                                             int rootString, bool twelveToneSpelling);

    // "Am7,no5  rt b3 5 ..." for the host's message line
    static std::string describe(const model::ChordAnalysis& chord);
};

} // namespace theory
