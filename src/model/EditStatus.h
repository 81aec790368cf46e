#pragma once

#include <cstdint>

namespace model {

struct Position
{
    int line = 0;
    int column = 0;

    bool operator==(const Position& other) const { return line == other.line && column == other.column; }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

enum class EditStatus : uint8_t
{
    Ok,
    NotInTabContext,            // Caller falls back to inserting the key literally
    RegionSpansMultipleStaves,
    InvalidTuningName,
    NoNotesInChord,
    ChordLabelOutOfSequence,
    ClipboardEmpty,
    NoNoteAtCursor
};

inline const char* toString(EditStatus status)
{
    switch (status)
    {
        case EditStatus::Ok: return "ok";
        case EditStatus::NotInTabContext: return "not in tab";
        case EditStatus::RegionSpansMultipleStaves: return "region spans multiple staves";
        case EditStatus::InvalidTuningName: return "invalid tuning name";
        case EditStatus::NoNotesInChord: return "no notes in chord";
        case EditStatus::ChordLabelOutOfSequence: return "no chord analysed to label";
        case EditStatus::ClipboardEmpty: return "nothing to yank";
        case EditStatus::NoNoteAtCursor: return "no note at cursor";
    }
    return "";
}

// Every editing operation reports its outcome and where the host should put
// the cursor afterwards. On failure the cursor is the one passed in.
struct EditResult
{
    EditStatus status = EditStatus::Ok;
    Position cursor;

    bool ok() const { return status == EditStatus::Ok; }

    static EditResult success(Position cursor) { return {EditStatus::Ok, cursor}; }
    static EditResult failure(EditStatus status, Position cursor) { return {status, cursor}; }
};

} // namespace model
