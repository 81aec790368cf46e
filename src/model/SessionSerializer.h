#pragma once

#include "SessionSettings.h"
#include <juce_core/juce_core.h>

namespace model {

class SessionSerializer
{
public:
    static bool save(const SessionSettings& settings, const juce::File& file);
    static bool load(SessionSettings& settings, const juce::File& file);

    static juce::String toJson(const SessionSettings& settings);
    static bool fromJson(SessionSettings& settings, const juce::String& json);

    // <user app data>/TabMode/settings.json
    static juce::File getDefaultSettingsFile();

private:
    static juce::var tuningToVar(const SessionSettings& settings);
    static bool varToTuning(SessionSettings& settings, const juce::var& v);
};

} // namespace model
