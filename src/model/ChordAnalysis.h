#pragma once

#include <string>
#include <vector>

namespace model {

// Result of the last chord analysis, kept on the session until it is either
// written above the staff or superseded by another command.
struct ChordAnalysis
{
    int staffIndex = -1;
    int cellIndex = -1;
    int rootString = -1;
    int rootPitch = 0;
    int bassPitch = 0;
    int count = 0;                  // Distinct pitch classes, root included
    std::vector<int> intervals;     // Ascending, root excluded
    std::string chordName;          // Root name + quality, e.g. "Am7" or "C/G"
    std::string disclaimer;         // e.g. ",no5"
    std::string spelling;           // Degree per string, high to low
};

} // namespace model
