#include "ModeManager.h"

namespace input {

ModeManager::ModeManager() {}

void ModeManager::setMode(Mode mode)
{
    if (mode != currentMode_)
    {
        currentMode_ = mode;
        if (onModeChanged)
        {
            onModeChanged(mode);
        }
    }
}

void ModeManager::toggleMode(Mode mode)
{
    setMode(currentMode_ == mode ? Mode::Tab : mode);
}

std::string ModeManager::getModeString() const
{
    switch (currentMode_)
    {
        case Mode::Tab: return "TAB";
        case Mode::Chord: return "CHORD";
        case Mode::Lyric: return "LYRIC";
    }
    return "";
}

} // namespace input
