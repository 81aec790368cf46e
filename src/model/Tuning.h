#pragma once

#include <array>
#include <string>

namespace model {

// Pitch classes are counted from E (E = 0) so that standard tuning reads
// naturally from the string prefixes.
struct Tuning
{
    static constexpr int NUM_STRINGS = 6;
    static constexpr int PREFIX_WIDTH = 3;

    std::array<int, NUM_STRINGS> pitch = {0, 7, 3, 10, 5, 0};   // index 0 = high e
    std::array<std::string, NUM_STRINGS> prefix = {"e-|", "B-|", "G-|", "D-|", "A-|", "E-|"};

    static Tuning standard() { return Tuning(); }

    // Builds a tuning from six note names, high string first. Returns false
    // and leaves the tuning untouched if any name is invalid or no distinct
    // prefix can be found for it.
    bool setFromNames(const std::array<std::string, NUM_STRINGS>& names);
    std::array<std::string, NUM_STRINGS> getNames() const;

    bool operator==(const Tuning& other) const { return pitch == other.pitch && prefix == other.prefix; }
    bool operator!=(const Tuning& other) const { return !(*this == other); }
};

bool isNoteLetter(char c);
bool isValidNoteName(const std::string& name);

// Pitch class of a note name ("E", "f#", "Bb"...), or -1 if invalid
int pitchClassOf(const std::string& name);

// Pitch class of a string-line prefix, read from its first two characters
int pitchClassOfPrefix(const std::string& prefix);

// "F#" -> "F#|", "a" -> "a-|"
std::string makePrefix(const std::string& noteName);

// Prefix for stringIndex that differs from every other string's prefix.
// A name already taken is written with the other letter case, as the high
// and low E strings are. Empty if both spellings are taken.
std::string makeUniquePrefix(const std::string& noteName,
                             const std::array<std::string, Tuning::NUM_STRINGS>& prefixes, int stringIndex);

// Note name of a pitch class, sharps only
const char* noteName(int pitchClass);

// A tab line starts with <letter><#|b|-><|>
bool isStringLine(const std::string& line);

inline int wrapPitch(int value) { return ((value % 12) + 12) % 12; }

} // namespace model
