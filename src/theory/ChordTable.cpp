#include "ChordTable.h"
#include <array>

namespace theory {

namespace {

const char* degreeLabels[] = {"rt", "b2", "2", "b3", "3", "4", "b5", "5", "b6", "6", "7", "maj7"};

// Order matters: the first exact match wins, so a later entry with the same
// intervals as an earlier one is never reported.
const std::array<std::vector<ChordPattern>, ChordTable::MAX_NOTES + 1> kChordPatterns = {{
    // 0 notes
    {},

    // 1 note
    {
        {{}, {}, "", ",no3,no5"},
    },

    // 2 notes
    {
        {{7},  {},            "5",    ""},
        {{4},  {},            "",     ",no5"},
        {{3},  {},            "m",    ",no5"},
        {{5},  {},            "sus4", ",no5"},
        {{2},  {},            "sus2", ",no5"},
        {{10}, {},            "7",    ",no3,no5"},
        {{11}, {},            "maj7", ",no3,no5"},
        {{9},  {},            "6",    ",no3,no5"},
        {{6},  {},            "b5",   "no3"},
        {{8},  {},            "+",    ",no3"},
        {{1},  {{1, "b9"}},   "b9",   ",no3,no5"},
    },

    // 3 notes
    {
        {{4, 7},  {},            "",      ""},
        {{3, 7},  {},            "m",     ""},
        {{5, 7},  {},            "sus4",  ""},
        {{2, 7},  {},            "sus2",  ""},
        {{3, 6},  {},            "dim",   ""},
        {{4, 8},  {},            "+",     ""},
        {{4, 10}, {},            "7",     ",no5"},
        {{3, 10}, {},            "m7",    ",no5"},
        {{4, 11}, {},            "maj7",  ",no5"},
        {{3, 11}, {},            "m(maj7)", ",no5"},
        {{7, 10}, {},            "7",     "no3"},
        {{7, 11}, {},            "maj7",  ",no3"},
        {{4, 9},  {},            "6",     ",no5"},
        {{3, 9},  {},            "m6",    ",no5"},
        {{2, 4},  {{2, "9"}},    "add9",  ",no5"},
        {{2, 3},  {{2, "9"}},    "m(add9)", ",no5"},
        {{5, 10}, {},            "7sus4", ",no5"},
        {{5, 10}, {{5, "11"}},   "11",    ",no3,no5,no9"},
        {{2, 10}, {{2, "9"}},    "9",     ",no3,no5"},
        {{4, 6},  {},            "b5",    ""},
        {{6, 10}, {},            "m7b5",  ",no3"},
    },

    // 4 notes
    {
        {{4, 7, 10}, {},                 "7",       ""},
        {{4, 7, 11}, {},                 "maj7",    ""},
        {{3, 7, 10}, {},                 "m7",      ""},
        {{3, 6, 10}, {},                 "m7b5",    ""},
        {{3, 6, 9},  {{9, "bb7"}},       "dim7",    ""},
        {{4, 8, 10}, {{8, "#5"}},        "7#5",     ""},
        {{4, 6, 10}, {},                 "7b5",     ""},
        {{3, 7, 11}, {},                 "m(maj7)", ""},
        {{4, 7, 9},  {},                 "6",       ""},
        {{3, 7, 9},  {},                 "m6",      ""},
        {{2, 4, 7},  {{2, "9"}},         "add9",    ""},
        {{2, 3, 7},  {{2, "9"}},         "m(add9)", ""},
        {{5, 7, 10}, {},                 "7sus4",   ""},
        {{5, 7, 10}, {{5, "11"}},        "11",      ",no3,no9"},
        {{2, 7, 10}, {{2, "9"}},         "9sus2",   ",no3"},
        {{2, 4, 10}, {{2, "9"}},         "9",       ",no5"},
        {{2, 3, 10}, {{2, "9"}},         "m9",      ",no5"},
        {{2, 4, 11}, {{2, "9"}},         "maj9",    ",no5"},
        {{1, 4, 10}, {{1, "b9"}},        "7b9",     ",no5"},
        {{3, 4, 10}, {{3, "#9"}},        "7#9",     ",no5"},
        {{4, 9, 10}, {{9, "13"}},        "13",      ",no5,no9"},
        {{2, 5, 7},  {{2, "9"}},         "sus4(add9)", ""},
    },

    // 5 notes
    {
        {{2, 4, 7, 10}, {{2, "9"}},              "9",     ""},
        {{2, 4, 7, 11}, {{2, "9"}},              "maj9",  ""},
        {{2, 3, 7, 10}, {{2, "9"}},              "m9",    ""},
        {{2, 4, 7, 9},  {{2, "9"}},              "6/9",   ""},
        {{1, 4, 7, 10}, {{1, "b9"}},             "7b9",   ""},
        {{3, 4, 7, 10}, {{3, "#9"}},             "7#9",   ""},
        {{4, 5, 7, 10}, {{5, "11"}},             "11",    ",no9"},
        {{2, 5, 7, 10}, {{2, "9"}, {5, "11"}},   "11",    ",no3"},
        {{4, 7, 9, 10}, {{9, "13"}},             "13",    ",no9"},
        {{2, 4, 9, 10}, {{2, "9"}, {9, "13"}},   "13",    ",no5"},
        {{3, 5, 7, 10}, {{5, "11"}},             "m11",   ",no9"},
    },

    // 6 notes
    {
        {{2, 4, 5, 7, 10}, {{2, "9"}, {5, "11"}},   "11",    ""},
        {{2, 3, 5, 7, 10}, {{2, "9"}, {5, "11"}},   "m11",   ""},
        {{2, 4, 7, 9, 10}, {{2, "9"}, {9, "13"}},   "13",    ",no11"},
        {{2, 4, 7, 9, 11}, {{2, "9"}, {9, "13"}},   "maj13", ",no11"},
    },
}};

} // anonymous namespace

const char* ChordPattern::degreeLabel(int interval) const
{
    int wrapped = ((interval % 12) + 12) % 12;
    for (const auto& [degree, label] : degreeOverrides)
    {
        if (degree == wrapped) return label.c_str();
    }
    return ChordTable::degreeLabel(interval);
}

const std::vector<ChordPattern>& ChordTable::getPatterns(int noteCount)
{
    if (noteCount < MIN_NOTES || noteCount > MAX_NOTES) return kChordPatterns[0];
    return kChordPatterns[static_cast<size_t>(noteCount)];
}

const ChordPattern* ChordTable::match(const std::vector<int>& intervals, int noteCount)
{
    for (const auto& pattern : getPatterns(noteCount))
    {
        if (pattern.intervals.empty() || pattern.intervals == intervals)
            return &pattern;
    }
    return nullptr;
}

const char* ChordTable::degreeLabel(int interval)
{
    return degreeLabels[((interval % 12) + 12) % 12];
}

} // namespace theory
