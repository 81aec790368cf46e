#include "TabDocument.h"
#include <algorithm>

namespace model {

TabDocument::TabDocument()
{
    lines_.emplace_back();
}

TabDocument::TabDocument(const std::string& text)
{
    setText(text);
}

void TabDocument::setText(const std::string& text)
{
    lines_.clear();
    size_t start = 0;
    while (true)
    {
        auto end = text.find('\n', start);
        if (end == std::string::npos)
        {
            lines_.push_back(text.substr(start));
            break;
        }
        lines_.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

std::string TabDocument::toText() const
{
    std::string text;
    for (size_t i = 0; i < lines_.size(); ++i)
    {
        if (i > 0) text += '\n';
        text += lines_[i];
    }
    return text;
}

const std::string& TabDocument::getLine(int index) const
{
    return lines_[static_cast<size_t>(index)];
}

void TabDocument::setLine(int index, const std::string& text)
{
    lines_[static_cast<size_t>(index)] = text;
}

void TabDocument::insertLines(int index, const std::vector<std::string>& lines)
{
    index = std::clamp(index, 0, getLineCount());
    lines_.insert(lines_.begin() + index, lines.begin(), lines.end());
}

void TabDocument::ensureLineCount(int count)
{
    while (getLineCount() < count)
        lines_.emplace_back();
}

bool TabDocument::isBlankLine(int index) const
{
    const auto& line = getLine(index);
    return std::all_of(line.begin(), line.end(), [](char c) { return c == ' ' || c == '\t'; });
}

Position TabDocument::positionOf(int offset) const
{
    Position pos;
    offset = std::max(0, offset);
    for (int i = 0; i < getLineCount(); ++i)
    {
        int length = static_cast<int>(lines_[static_cast<size_t>(i)].size());
        if (offset <= length || i == getLineCount() - 1)
        {
            pos.line = i;
            pos.column = std::min(offset, length);
            return pos;
        }
        offset -= length + 1;
    }
    return pos;
}

int TabDocument::offsetOf(const Position& pos) const
{
    int offset = 0;
    int line = std::clamp(pos.line, 0, getLineCount() - 1);
    for (int i = 0; i < line; ++i)
        offset += static_cast<int>(lines_[static_cast<size_t>(i)].size()) + 1;
    return offset + pos.column;
}

std::vector<StaffSpan> TabDocument::getStaves() const
{
    std::vector<StaffSpan> staves;
    int runStart = -1;

    for (int i = 0; i <= getLineCount(); ++i)
    {
        bool tabLine = i < getLineCount() && isStringLine(lines_[static_cast<size_t>(i)]);
        if (tabLine)
        {
            if (runStart < 0) runStart = i;
            continue;
        }
        if (runStart >= 0)
        {
            // Split long runs into back-to-back staves. A line that would repeat
            // a prefix inside a staff is stray text and the framing moves past it.
            int first = runStart;
            while (first + NUM_STRINGS <= i)
            {
                if (!hasDistinctPrefixes(first))
                {
                    ++first;
                    continue;
                }
                StaffSpan staff;
                staff.firstLine = first;
                staff.width = static_cast<int>(lines_[static_cast<size_t>(first)].size());
                staves.push_back(staff);
                first += NUM_STRINGS;
            }
            runStart = -1;
        }
    }
    return staves;
}

bool TabDocument::hasDistinctPrefixes(int firstLine) const
{
    for (int a = 0; a < NUM_STRINGS; ++a)
    {
        auto prefix = getLine(firstLine + a).substr(0, Tuning::PREFIX_WIDTH);
        for (int b = a + 1; b < NUM_STRINGS; ++b)
        {
            if (getLine(firstLine + b).compare(0, Tuning::PREFIX_WIDTH, prefix) == 0) return false;
        }
    }
    return true;
}

int TabDocument::findStaffAtLine(int line) const
{
    auto staves = getStaves();
    for (size_t i = 0; i < staves.size(); ++i)
    {
        if (staves[i].containsLine(line)) return static_cast<int>(i);
    }
    return -1;
}

int TabDocument::findStaffAbove(int line) const
{
    auto staves = getStaves();
    int found = -1;
    for (size_t i = 0; i < staves.size(); ++i)
    {
        if (staves[i].firstLine <= line) found = static_cast<int>(i);
    }
    return found;
}

StaffSpan TabDocument::getStaff(int staffIndex) const
{
    auto staves = getStaves();
    if (staffIndex < 0 || staffIndex >= static_cast<int>(staves.size())) return StaffSpan();
    return staves[static_cast<size_t>(staffIndex)];
}

int TabDocument::getCellCount(int staffIndex) const
{
    auto staff = getStaff(staffIndex);
    int shortest = staff.width;
    for (int s = 0; s < NUM_STRINGS; ++s)
        shortest = std::min(shortest, static_cast<int>(getLine(staff.firstLine + s).size()));
    return std::max(0, (shortest - FIRST_CELL_COLUMN) / Cell::WIDTH);
}

Cell TabDocument::getCell(int staffIndex, int string, int cell) const
{
    auto staff = getStaff(staffIndex);
    const auto& line = getLine(staff.firstLine + string);
    auto column = static_cast<size_t>(cellColumn(cell));
    if (column >= line.size()) return Cell::blank();
    return Cell::parse(std::string_view(line).substr(column, Cell::WIDTH));
}

void TabDocument::setCell(int staffIndex, int string, int cell, const Cell& value)
{
    auto staff = getStaff(staffIndex);
    auto& line = lines_[static_cast<size_t>(staff.firstLine + string)];
    auto column = static_cast<size_t>(cellColumn(cell));
    if (line.size() < column + Cell::WIDTH)
        line.resize(column + Cell::WIDTH, '-');
    line.replace(column, Cell::WIDTH, value.toString());
}

bool TabDocument::checkStaffInvariants(int staffIndex) const
{
    auto staff = getStaff(staffIndex);
    for (int s = 1; s < NUM_STRINGS; ++s)
    {
        if (static_cast<int>(getLine(staff.firstLine + s).size()) != staff.width) return false;
    }

    int cells = getCellCount(staffIndex);
    for (int c = 0; c < cells; ++c)
    {
        bool first = getCell(staffIndex, 0, c).isBarline();
        for (int s = 1; s < NUM_STRINGS; ++s)
        {
            if (getCell(staffIndex, s, c).isBarline() != first) return false;
        }
    }
    return true;
}

} // namespace model
