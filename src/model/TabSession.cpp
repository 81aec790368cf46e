#include "TabSession.h"

namespace model {

TabSession::TabSession() : TabSession("") {}

TabSession::TabSession(const std::string& text) : TabSession(text, SessionSettings()) {}

TabSession::TabSession(const std::string& text, const SessionSettings& settings)
    : document_(text)
{
    applySettings(settings);
}

void TabSession::setLastCommand(SessionCommand command)
{
    lastCommand_ = command;
    if (command != SessionCommand::AnalyzeChord)
        pendingChord_.reset();
}

void TabSession::applySettings(const SessionSettings& settings)
{
    settings_ = settings;
    Tuning tuning;
    if (tuning.setFromNames(settings.tuning))
        tuning_ = tuning;
}

} // namespace model
