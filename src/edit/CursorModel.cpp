#include "CursorModel.h"
#include <algorithm>

using model::TabDocument;

namespace edit {

std::optional<TabContext> CursorModel::resolve(const TabDocument& doc, const model::Position& pos)
{
    if (pos.line < 0 || pos.line >= doc.getLineCount()) return std::nullopt;

    int staffIndex = doc.findStaffAtLine(pos.line);
    if (staffIndex < 0) return std::nullopt;

    int cells = doc.getCellCount(staffIndex);
    if (cells == 0) return std::nullopt;

    auto staff = doc.getStaff(staffIndex);

    TabContext ctx;
    ctx.staffIndex = staffIndex;
    ctx.firstLine = staff.firstLine;
    ctx.stringIndex = pos.line - staff.firstLine;

    // Snap back to the start of the cell, into the cell range
    int cell = (pos.column - TabDocument::FIRST_CELL_COLUMN) / model::Cell::WIDTH;
    if (pos.column < TabDocument::FIRST_CELL_COLUMN) cell = 0;
    ctx.cellIndex = std::clamp(cell, 0, cells - 1);
    return ctx;
}

std::optional<TabContext> CursorModel::resolve(const TabDocument& doc, int rawOffset)
{
    return resolve(doc, doc.positionOf(rawOffset));
}

std::optional<TabContext> CursorModel::at(const TabDocument& doc, int staffIndex, int stringIndex, int cellIndex)
{
    if (staffIndex < 0 || staffIndex >= doc.getStaffCount()) return std::nullopt;
    if (stringIndex < 0 || stringIndex >= TabDocument::NUM_STRINGS) return std::nullopt;
    if (cellIndex < 0 || cellIndex >= doc.getCellCount(staffIndex)) return std::nullopt;

    TabContext ctx;
    ctx.staffIndex = staffIndex;
    ctx.stringIndex = stringIndex;
    ctx.cellIndex = cellIndex;
    ctx.firstLine = doc.getStaff(staffIndex).firstLine;
    return ctx;
}

std::optional<TabContext> CursorModel::advance(const TabDocument& doc, const TabContext& ctx, int deltaCells)
{
    int cell = ctx.cellIndex + deltaCells;
    if (cell < 0 || cell >= doc.getCellCount(ctx.staffIndex)) return std::nullopt;

    TabContext moved = ctx;
    moved.cellIndex = cell;
    return moved;
}

std::optional<TabContext> CursorModel::moveStrings(const TabContext& ctx, int deltaStrings)
{
    int string = ctx.stringIndex + deltaStrings;
    if (string < 0 || string >= TabDocument::NUM_STRINGS) return std::nullopt;

    TabContext moved = ctx;
    moved.stringIndex = string;
    return moved;
}

TabContext CursorModel::cycleString(const TabContext& ctx, int deltaStrings)
{
    TabContext moved = ctx;
    moved.stringIndex = ((ctx.stringIndex + deltaStrings) % TabDocument::NUM_STRINGS
                         + TabDocument::NUM_STRINGS) % TabDocument::NUM_STRINGS;
    return moved;
}

std::optional<TabContext> CursorModel::moveStaff(const TabDocument& doc, const TabContext& ctx, Direction direction)
{
    int staffCount = doc.getStaffCount();
    int step = direction == Direction::Forward ? 1 : -1;

    // Skip staves too narrow to hold a cell
    for (int staff = ctx.staffIndex + step; staff >= 0 && staff < staffCount; staff += step)
    {
        int cells = doc.getCellCount(staff);
        if (cells == 0) continue;
        return at(doc, staff, 0, std::min(ctx.cellIndex, cells - 1));
    }
    return std::nullopt;
}

} // namespace edit
