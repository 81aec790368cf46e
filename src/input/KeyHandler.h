#pragma once

#include "KeyAction.h"
#include "ModeManager.h"
#include "../edit/CursorModel.h"
#include "../model/TabSession.h"
#include <string>

namespace input {

// Turns host key presses and prompted commands into editing operations.
// Outside tab every key comes back as InsertLiteral.
class KeyHandler
{
public:
    KeyHandler(ModeManager& modeManager);

    KeyActionResult handleKey(model::TabSession& session, int rawOffset, const KeyEvent& key);

    // Commands the host collects through a prompt:
    //   staff [width], learn, retune <note>, transpose <semitones>,
    //   copy-retune, kill, copy, yank, spelling
    // Region commands use the span between rawOffset and markOffset.
    KeyActionResult executeCommand(model::TabSession& session, int rawOffset, int markOffset,
                                   const std::string& command);

    // commandData receives the fret number or EmbKind where relevant
    static TabCommand translate(const KeyEvent& key, int& commandData);

private:
    KeyActionResult executeTabCommand(model::TabSession& session, const edit::TabContext& ctx,
                                      TabCommand command, int commandData);
    KeyActionResult navigate(model::TabSession& session, const edit::TabContext& ctx,
                             const std::optional<edit::TabContext>& target);

    ModeManager& modeManager_;
};

} // namespace input
