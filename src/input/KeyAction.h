#pragma once

#include "../model/EditStatus.h"
#include <string>

namespace input {

// A key as delivered by the host: the character it produces plus modifiers.
// Control characters are reported as the letter with ctrl set.
struct KeyEvent
{
    char ch = 0;
    bool ctrl = false;
    bool alt = false;

    KeyEvent() = default;
    explicit KeyEvent(char c) : ch(c) {}
    KeyEvent(char c, bool ctrlDown, bool altDown) : ch(c), ctrl(ctrlDown), alt(altDown) {}

    static KeyEvent withCtrl(char c) { return KeyEvent(c, true, false); }
    static KeyEvent withAlt(char c) { return KeyEvent(c, false, true); }
};

// Semantic commands a key translates to inside tab
enum class TabCommand {
    None,

    // Note entry
    Fret,               // fret number in commandData
    Embellish,          // EmbKind in commandData
    DeleteNote,         // ctrl+k

    // Navigation
    CellForward,        // space, ctrl+f
    CellBackward,       // ctrl+b
    StringUp,           // k
    StringDown,         // j
    StaffUp,            // K
    StaffDown,          // J

    // Columns
    Barline,            // |
    InsertColumn,       // i
    DeleteForward,      // x
    DeleteBackward,     // backspace

    // Octave
    OctaveUp,           // +
    OctaveDown,         // _

    // Chords
    AnalyzeChord,       // ?
    LabelChord,         // !

    // Modes
    ToggleChordMode,    // ctrl+c
    ToggleLyricMode,    // ctrl+l
    LyricChar,          // printable key in lyric mode
};

// What the host should do after a key or command
enum class KeyAction {
    None,           // Key consumed, nothing to do (unbound key inside tab)
    InsertLiteral,  // Not in tab: insert charData as ordinary text
    Applied,        // Buffer and/or cursor changed; take cursor from result
    Rejected,       // Command failed; status says why, buffer untouched
};

struct KeyActionResult {
    KeyAction action = KeyAction::None;
    char charData = 0;                              // For InsertLiteral
    model::EditStatus status = model::EditStatus::Ok;
    model::Position cursor;
    std::string message;                            // Echo-area text, e.g. a chord name

    KeyActionResult() = default;
    explicit KeyActionResult(KeyAction a) : action(a) {}

    static KeyActionResult literal(char c) {
        KeyActionResult r(KeyAction::InsertLiteral);
        r.charData = c;
        r.status = model::EditStatus::NotInTabContext;
        return r;
    }

    static KeyActionResult fromEdit(const model::EditResult& edit) {
        KeyActionResult r(edit.ok() ? KeyAction::Applied : KeyAction::Rejected);
        r.status = edit.status;
        r.cursor = edit.cursor;
        if (!edit.ok()) r.message = model::toString(edit.status);
        return r;
    }

    bool isLiteral() const { return action == KeyAction::InsertLiteral; }
    bool isApplied() const { return action == KeyAction::Applied; }
};

} // namespace input
