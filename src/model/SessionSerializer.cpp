#include "SessionSerializer.h"

namespace model {

bool SessionSerializer::save(const SessionSettings& settings, const juce::File& file)
{
    auto result = file.getParentDirectory().createDirectory();
    if (result.failed())
    {
        DBG("Cannot create settings directory: " << result.getErrorMessage());
        return false;
    }
    return file.replaceWithText(toJson(settings));
}

bool SessionSerializer::load(SessionSettings& settings, const juce::File& file)
{
    if (!file.existsAsFile()) return false;

    auto json = file.loadFileAsString();
    return fromJson(settings, json);
}

juce::String SessionSerializer::toJson(const SessionSettings& settings)
{
    juce::DynamicObject::Ptr root = new juce::DynamicObject();

    root->setProperty("version", "1.0");
    root->setProperty("staffWidth", settings.staffWidth);
    root->setProperty("twelveToneSpelling", settings.twelveToneSpelling);
    root->setProperty("advanceAfterNote", settings.advanceAfterNote);
    root->setProperty("tuning", tuningToVar(settings));

    return juce::JSON::toString(juce::var(root.get()));
}

bool SessionSerializer::fromJson(SessionSettings& settings, const juce::String& json)
{
    auto parsed = juce::JSON::parse(json);
    if (!parsed.isObject()) return false;

    auto* obj = parsed.getDynamicObject();
    if (!obj) return false;

    if (obj->hasProperty("staffWidth"))
    {
        int width = static_cast<int>(obj->getProperty("staffWidth"));
        if (width >= SessionSettings::MIN_STAFF_WIDTH && width <= SessionSettings::MAX_STAFF_WIDTH)
            settings.staffWidth = width;
        else
            DBG("Ignoring staff width out of range: " << width);
    }

    if (obj->hasProperty("twelveToneSpelling"))
        settings.twelveToneSpelling = static_cast<bool>(obj->getProperty("twelveToneSpelling"));

    if (obj->hasProperty("advanceAfterNote"))
        settings.advanceAfterNote = static_cast<bool>(obj->getProperty("advanceAfterNote"));

    if (obj->hasProperty("tuning") && !varToTuning(settings, obj->getProperty("tuning")))
        DBG("Ignoring invalid tuning in settings");

    return true;
}

juce::File SessionSerializer::getDefaultSettingsFile()
{
    return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
        .getChildFile("TabMode")
        .getChildFile("settings.json");
}

juce::var SessionSerializer::tuningToVar(const SessionSettings& settings)
{
    juce::Array<juce::var> names;
    for (const auto& name : settings.tuning)
        names.add(juce::String(name));
    return names;
}

bool SessionSerializer::varToTuning(SessionSettings& settings, const juce::var& v)
{
    auto* names = v.getArray();
    if (!names || names->size() != Tuning::NUM_STRINGS) return false;

    std::array<std::string, Tuning::NUM_STRINGS> tuning;
    for (int i = 0; i < Tuning::NUM_STRINGS; ++i)
    {
        tuning[static_cast<size_t>(i)] = (*names)[i].toString().toStdString();
        if (!isValidNoteName(tuning[static_cast<size_t>(i)])) return false;
    }

    settings.tuning = tuning;
    return true;
}

} // namespace model
