#pragma once

#include "Tuning.h"
#include <array>
#include <string>

namespace model {

struct SessionSettings
{
    static constexpr int MIN_STAFF_WIDTH = 8;
    static constexpr int MAX_STAFF_WIDTH = 512;
    static constexpr int DEFAULT_STAFF_WIDTH = 77;

    int staffWidth = DEFAULT_STAFF_WIDTH;   // Columns, including the string prefix
    bool twelveToneSpelling = false;        // Append "(x 0 7 ...)" to chord spellings
    bool advanceAfterNote = true;           // Move one cell right after entering a fret
    std::array<std::string, Tuning::NUM_STRINGS> tuning = {"e", "B", "G", "D", "A", "E"};
};

} // namespace model
