#pragma once

#include "Cell.h"
#include "EditStatus.h"
#include "Tuning.h"
#include <string>
#include <vector>

namespace model {

// Six consecutive string lines. Lines are addressed by document line number.
struct StaffSpan
{
    int firstLine = 0;
    int width = 0;

    int lastLine() const { return firstLine + Tuning::NUM_STRINGS - 1; }
    bool containsLine(int line) const { return line >= firstLine && line <= lastLine(); }
};

// The text buffer handed over by the host, seen as lines. Staves are not
// stored separately: they are recognised from the string-line prefixes, so
// the text always stays the single source of truth and round-trips exactly.
class TabDocument
{
public:
    static constexpr int NUM_STRINGS = Tuning::NUM_STRINGS;
    static constexpr int MARGIN_WIDTH = 2;
    static constexpr int FIRST_CELL_COLUMN = Tuning::PREFIX_WIDTH + MARGIN_WIDTH;

    TabDocument();
    explicit TabDocument(const std::string& text);

    void setText(const std::string& text);
    std::string toText() const;

    int getLineCount() const { return static_cast<int>(lines_.size()); }
    const std::string& getLine(int index) const;
    void setLine(int index, const std::string& text);
    void insertLines(int index, const std::vector<std::string>& lines);
    void ensureLineCount(int count);
    bool isBlankLine(int index) const;

    // Raw character offsets as used by the host, '\n' counting as one
    Position positionOf(int offset) const;
    int offsetOf(const Position& pos) const;

    // Staves
    std::vector<StaffSpan> getStaves() const;
    int getStaffCount() const { return static_cast<int>(getStaves().size()); }
    int findStaffAtLine(int line) const;    // -1 if the line is not in a staff
    int findStaffAbove(int line) const;     // nearest staff starting at or before line, -1 if none
    StaffSpan getStaff(int staffIndex) const;

    // Whole cells available on every string of the staff
    int getCellCount(int staffIndex) const;
    static int cellColumn(int cell) { return FIRST_CELL_COLUMN + cell * Cell::WIDTH; }

    Cell getCell(int staffIndex, int string, int cell) const;
    void setCell(int staffIndex, int string, int cell, const Cell& value);

    // Equal string lengths and barlines spanning all six strings
    bool checkStaffInvariants(int staffIndex) const;

private:
    bool hasDistinctPrefixes(int firstLine) const;

    std::vector<std::string> lines_;
};

} // namespace model
