#pragma once

#include <string>
#include <utility>
#include <vector>

namespace theory {

// One recognisable chord shape. Intervals are semitones above the root,
// ascending and distinct, root excluded. An empty interval list matches any
// chord of its note count.
struct ChordPattern
{
    std::vector<int> intervals;
    std::vector<std::pair<int, std::string>> degreeOverrides;  // interval -> label
    std::string name;
    std::string disclaimer;     // Omitted tones, e.g. ",no5"

    const char* degreeLabel(int interval) const;
};

class ChordTable
{
public:
    static constexpr int MIN_NOTES = 1;
    static constexpr int MAX_NOTES = 6;

    // Patterns for a note count, in priority order
    static const std::vector<ChordPattern>& getPatterns(int noteCount);

    // First pattern, in table order, whose intervals equal the given ones
    static const ChordPattern* match(const std::vector<int>& intervals, int noteCount);

    // rt b2 2 b3 3 4 b5 5 b6 6 7 maj7
    static const char* degreeLabel(int interval);
};

} // namespace theory
