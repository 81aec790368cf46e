#pragma once

#include "CursorModel.h"
#include "../model/TabSession.h"

namespace edit {

// Structural edits on a staff. Every edit touches all six strings together
// (except the note-level ones) and keeps each string line at its width.
class StaffEditor
{
public:
    // New staff below the nearest staff above pos, or three lines below pos
    static model::EditResult makeStaff(model::TabSession& session, const model::Position& pos);
    static model::EditResult makeStaff(model::TabSession& session, const model::Position& pos, int width);

    // Fixed width: whatever is pushed past the right edge is dropped
    static model::EditResult insertColumns(model::TabSession& session, const TabContext& ctx, int count);
    static model::EditResult deleteCells(model::TabSession& session, const TabContext& ctx, int count, Direction direction);

    static model::EditResult toggleBarline(model::TabSession& session, const TabContext& ctx, bool advanceCursor);

    // Inclusive cell range between begin and end, which must share a staff
    static model::EditResult killRegion(model::TabSession& session, const TabContext& begin,
                                        const TabContext& end, bool deleteSource);
    static model::EditResult yank(model::TabSession& session, const TabContext& ctx);

    // Note-level edits on the cursor string
    static model::EditResult placeNote(model::TabSession& session, const TabContext& ctx, int fret, bool advanceCursor);
    static model::EditResult toggleEmbellishment(model::TabSession& session, const TabContext& ctx, model::EmbKind kind);
    static model::EditResult deleteNote(model::TabSession& session, const TabContext& ctx);

    // Writes ch on the label line above the staff at pos.column
    static model::EditResult typeLyric(model::TabSession& session, const model::Position& pos, char ch);

    // Line above the staff's first string, inserted if the staff has none.
    // Returns the label line index; the staff may have moved down by one.
    static int ensureLabelLine(model::TabDocument& doc, int staffIndex);

    static std::string makeStringLine(const std::string& prefix, int width);
};

} // namespace edit
