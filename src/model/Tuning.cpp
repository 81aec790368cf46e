#include "Tuning.h"
#include <cctype>

namespace model {

namespace {

const char* noteNames[] = {"E", "F", "F#", "G", "G#", "A", "A#", "B", "C", "C#", "D", "D#"};

int letterPitch(char letter)
{
    switch (std::toupper(static_cast<unsigned char>(letter)))
    {
        case 'E': return 0;
        case 'F': return 1;
        case 'G': return 3;
        case 'A': return 5;
        case 'B': return 7;
        case 'C': return 8;
        case 'D': return 10;
    }
    return -1;
}

int accidentalOffset(char c)
{
    if (c == '#') return 1;
    if (c == 'b') return -1;
    return 0;
}

} // anonymous namespace

bool isNoteLetter(char c)
{
    return letterPitch(c) >= 0;
}

bool isValidNoteName(const std::string& name)
{
    if (name.empty() || name.size() > 2) return false;
    if (!isNoteLetter(name[0])) return false;
    return name.size() == 1 || name[1] == '#' || name[1] == 'b';
}

int pitchClassOf(const std::string& name)
{
    if (!isValidNoteName(name)) return -1;
    int pitch = letterPitch(name[0]);
    if (name.size() > 1)
        pitch += accidentalOffset(name[1]);
    return wrapPitch(pitch);
}

int pitchClassOfPrefix(const std::string& prefix)
{
    if (prefix.empty() || !isNoteLetter(prefix[0])) return -1;
    int pitch = letterPitch(prefix[0]);
    if (prefix.size() > 1)
        pitch += accidentalOffset(prefix[1]);
    return wrapPitch(pitch);
}

std::string makePrefix(const std::string& noteName)
{
    std::string prefix;
    prefix += noteName[0];
    prefix += noteName.size() > 1 ? noteName[1] : '-';
    prefix += '|';
    return prefix;
}

std::string makeUniquePrefix(const std::string& noteName,
                             const std::array<std::string, Tuning::NUM_STRINGS>& prefixes, int stringIndex)
{
    auto taken = [&](const std::string& candidate)
    {
        for (int s = 0; s < Tuning::NUM_STRINGS; ++s)
        {
            if (s != stringIndex && prefixes[static_cast<size_t>(s)] == candidate) return true;
        }
        return false;
    };

    auto prefix = makePrefix(noteName);
    if (!taken(prefix)) return prefix;

    auto letter = static_cast<unsigned char>(prefix[0]);
    prefix[0] = static_cast<char>(std::isupper(letter) ? std::tolower(letter) : std::toupper(letter));
    return taken(prefix) ? std::string() : prefix;
}

const char* noteName(int pitchClass)
{
    return noteNames[wrapPitch(pitchClass)];
}

bool isStringLine(const std::string& line)
{
    if (line.size() < static_cast<size_t>(Tuning::PREFIX_WIDTH)) return false;
    if (!isNoteLetter(line[0])) return false;
    if (line[1] != '#' && line[1] != 'b' && line[1] != '-') return false;
    return line[2] == '|';
}

bool Tuning::setFromNames(const std::array<std::string, NUM_STRINGS>& names)
{
    for (const auto& name : names)
    {
        if (!isValidNoteName(name)) return false;
    }

    std::array<std::string, NUM_STRINGS> prefixes;
    for (int i = 0; i < NUM_STRINGS; ++i)
    {
        prefixes[static_cast<size_t>(i)] = makeUniquePrefix(names[static_cast<size_t>(i)], prefixes, i);
        if (prefixes[static_cast<size_t>(i)].empty()) return false;
    }

    for (int i = 0; i < NUM_STRINGS; ++i)
        pitch[static_cast<size_t>(i)] = pitchClassOf(names[static_cast<size_t>(i)]);
    prefix = prefixes;
    return true;
}

std::array<std::string, Tuning::NUM_STRINGS> Tuning::getNames() const
{
    std::array<std::string, NUM_STRINGS> names;
    for (size_t i = 0; i < names.size(); ++i)
    {
        names[i] = prefix[i].substr(0, 1);
        if (prefix[i].size() > 1 && prefix[i][1] != '-')
            names[i] += prefix[i][1];
    }
    return names;
}

} // namespace model
