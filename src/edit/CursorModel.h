#pragma once

#include "../model/EditStatus.h"
#include "../model/TabDocument.h"
#include <optional>

namespace edit {

// A validated cursor inside a staff, always on a cell boundary
struct TabContext
{
    int staffIndex = 0;
    int stringIndex = 0;    // 0 = highest string
    int cellIndex = 0;
    int firstLine = 0;      // Document line of string 0

    int line() const { return firstLine + stringIndex; }
    int column() const { return model::TabDocument::cellColumn(cellIndex); }
    model::Position position() const { return {line(), column()}; }

    bool operator==(const TabContext& other) const {
        return staffIndex == other.staffIndex && stringIndex == other.stringIndex
            && cellIndex == other.cellIndex && firstLine == other.firstLine;
    }
    bool operator!=(const TabContext& other) const { return !(*this == other); }
};

enum class Direction
{
    Forward,
    Backward
};

class CursorModel
{
public:
    // nullopt means "not in tab": the caller inserts the key as plain text
    static std::optional<TabContext> resolve(const model::TabDocument& doc, const model::Position& pos);
    static std::optional<TabContext> resolve(const model::TabDocument& doc, int rawOffset);

    static std::optional<TabContext> at(const model::TabDocument& doc, int staffIndex, int stringIndex, int cellIndex);

    // Cell movement along the current string; nullopt past either end
    static std::optional<TabContext> advance(const model::TabDocument& doc, const TabContext& ctx, int deltaCells);

    // String movement within the staff; nullopt past string 0 or 5
    static std::optional<TabContext> moveStrings(const TabContext& ctx, int deltaStrings);

    // String movement wrapping around the six strings
    static TabContext cycleString(const TabContext& ctx, int deltaStrings);

    // First string of the next or previous staff, same cell where it fits
    static std::optional<TabContext> moveStaff(const model::TabDocument& doc, const TabContext& ctx, Direction direction);
};

} // namespace edit
