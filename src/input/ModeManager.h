#pragma once

#include <functional>
#include <string>

namespace input {

enum class Mode
{
    Tab,    // Cursor advances after each fret
    Chord,  // Cursor stays in the column to stack a chord
    Lyric   // Printable keys go to the label line above the staff
};

class ModeManager
{
public:
    ModeManager();

    Mode getMode() const { return currentMode_; }
    void setMode(Mode mode);

    // Toggling a mode that is already active returns to Tab
    void toggleMode(Mode mode);

    std::string getModeString() const;

    // Callback when mode changes
    std::function<void(Mode)> onModeChanged;

private:
    Mode currentMode_ = Mode::Tab;
};

} // namespace input
