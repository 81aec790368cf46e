#include "StaffEditor.h"
#include <juce_core/juce_core.h>
#include <algorithm>

using model::Cell;
using model::EditResult;
using model::EditStatus;
using model::EmbKind;
using model::Position;
using model::SessionCommand;
using model::TabDocument;
using model::TabSession;

namespace edit {

namespace {

constexpr int NUM_STRINGS = TabDocument::NUM_STRINGS;

// Insert text at column, then crop back to the line's original width
void insertCropped(TabDocument& doc, int line, int column, const std::string& text)
{
    auto s = doc.getLine(line);
    auto width = s.size();
    if (static_cast<size_t>(column) > s.size()) return;
    s.insert(static_cast<size_t>(column), text);
    s.resize(width);
    doc.setLine(line, s);
}

// Remove chars at column and pad the right end with dashes to keep width
void removePadded(TabDocument& doc, int line, int column, int chars)
{
    auto s = doc.getLine(line);
    if (static_cast<size_t>(column) >= s.size()) return;
    auto removed = std::min(static_cast<size_t>(chars), s.size() - static_cast<size_t>(column));
    s.erase(static_cast<size_t>(column), removed);
    s.append(removed, '-');
    doc.setLine(line, s);
}

} // anonymous namespace

std::string StaffEditor::makeStringLine(const std::string& prefix, int width)
{
    int cells = std::max(1, (width - TabDocument::FIRST_CELL_COLUMN) / Cell::WIDTH);
    return prefix + std::string(static_cast<size_t>(TabDocument::MARGIN_WIDTH + cells * Cell::WIDTH), '-');
}

EditResult StaffEditor::makeStaff(TabSession& session, const Position& pos)
{
    return makeStaff(session, pos, session.getSettings().staffWidth);
}

EditResult StaffEditor::makeStaff(TabSession& session, const Position& pos, int width)
{
    session.setLastCommand(SessionCommand::Edit);
    width = std::clamp(width, model::SessionSettings::MIN_STAFF_WIDTH, model::SessionSettings::MAX_STAFF_WIDTH);

    auto& doc = session.getDocument();
    const auto& tuning = session.getTuning();

    std::vector<std::string> lines;
    for (const auto& prefix : tuning.prefix)
        lines.push_back(makeStringLine(prefix, width));

    int firstLine = 0;
    int above = doc.findStaffAbove(pos.line);
    if (above >= 0)
    {
        int insertAt = doc.getStaff(above).lastLine() + 1;
        lines.insert(lines.begin(), std::string());
        doc.insertLines(insertAt, lines);
        firstLine = insertAt + 1;
    }
    else
    {
        firstLine = std::max(0, pos.line) + 3;
        auto staves = doc.getStaves();
        if (!staves.empty())
            firstLine = std::min(firstLine, staves.front().firstLine);
        doc.ensureLineCount(firstLine);
        doc.insertLines(firstLine, lines);
    }

    return EditResult::success({firstLine, TabDocument::FIRST_CELL_COLUMN});
}

EditResult StaffEditor::insertColumns(TabSession& session, const TabContext& ctx, int count)
{
    session.setLastCommand(SessionCommand::Edit);

    if (count > 0)
    {
        std::string blanks(static_cast<size_t>(count * Cell::WIDTH), '-');
        for (int s = 0; s < NUM_STRINGS; ++s)
            insertCropped(session.getDocument(), ctx.firstLine + s, ctx.column(), blanks);
    }

    return EditResult::success(ctx.position());
}

EditResult StaffEditor::deleteCells(TabSession& session, const TabContext& ctx, int count, Direction direction)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    int cells = doc.getCellCount(ctx.staffIndex);

    int first = ctx.cellIndex;
    int removed = 0;
    if (direction == Direction::Forward)
    {
        removed = std::clamp(count, 0, cells - ctx.cellIndex);
    }
    else
    {
        removed = std::clamp(count, 0, ctx.cellIndex);
        first = ctx.cellIndex - removed;
    }

    if (removed > 0)
    {
        for (int s = 0; s < NUM_STRINGS; ++s)
            removePadded(doc, ctx.firstLine + s, TabDocument::cellColumn(first), removed * Cell::WIDTH);
    }

    TabContext moved = ctx;
    moved.cellIndex = first;
    return EditResult::success(moved.position());
}

EditResult StaffEditor::toggleBarline(TabSession& session, const TabContext& ctx, bool advanceCursor)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    bool isBar = doc.getCell(ctx.staffIndex, 0, ctx.cellIndex).isBarline();
    Cell value = isBar ? Cell::blank() : Cell::barline();

    for (int s = 0; s < NUM_STRINGS; ++s)
        doc.setCell(ctx.staffIndex, s, ctx.cellIndex, value);


    if (!advanceCursor)
        return EditResult::success(ctx.position());

    if (auto next = CursorModel::advance(doc, ctx, 1))
        return EditResult::success(next->position());

    // End of line: behave like two plain characters were typed over
    return EditResult::success({ctx.line(), ctx.column() + 2});
}

EditResult StaffEditor::killRegion(TabSession& session, const TabContext& begin,
                                   const TabContext& end, bool deleteSource)
{
    session.setLastCommand(SessionCommand::Edit);

    if (begin.staffIndex != end.staffIndex)
    {
        DBG("Region spans staves " << begin.staffIndex << " and " << end.staffIndex);
        return EditResult::failure(EditStatus::RegionSpansMultipleStaves, begin.position());
    }

    auto& doc = session.getDocument();
    int low = std::min(begin.cellIndex, end.cellIndex);
    int high = std::max(begin.cellIndex, end.cellIndex);
    int column = TabDocument::cellColumn(low);
    int chars = (high - low + 1) * Cell::WIDTH;

    model::Clipboard::Rectangle data;
    for (int s = 0; s < NUM_STRINGS; ++s)
    {
        const auto& line = doc.getLine(begin.firstLine + s);
        data[static_cast<size_t>(s)] = line.substr(static_cast<size_t>(column), static_cast<size_t>(chars));
        data[static_cast<size_t>(s)].resize(static_cast<size_t>(chars), '-');
    }
    session.getClipboard().copy(data);

    if (deleteSource)
    {
        for (int s = 0; s < NUM_STRINGS; ++s)
            removePadded(doc, begin.firstLine + s, column, chars);
    }

    TabContext moved = begin;
    moved.cellIndex = low;
    return EditResult::success(moved.position());
}

EditResult StaffEditor::yank(TabSession& session, const TabContext& ctx)
{
    session.setLastCommand(SessionCommand::Edit);

    const auto& clipboard = session.getClipboard();
    if (clipboard.isEmpty())
        return EditResult::failure(EditStatus::ClipboardEmpty, ctx.position());

    for (int s = 0; s < NUM_STRINGS; ++s)
        insertCropped(session.getDocument(), ctx.firstLine + s, ctx.column(), clipboard.getData()[static_cast<size_t>(s)]);

    return EditResult::success(ctx.position());
}

EditResult StaffEditor::placeNote(TabSession& session, const TabContext& ctx, int fret, bool advanceCursor)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    doc.setCell(ctx.staffIndex, ctx.stringIndex, ctx.cellIndex,
                Cell::note(fret, session.getPendingEmbellishment()));
    session.setPendingEmbellishment(EmbKind::Normal);

    if (advanceCursor)
    {
        if (auto next = CursorModel::advance(doc, ctx, 1))
            return EditResult::success(next->position());
    }
    return EditResult::success(ctx.position());
}

EditResult StaffEditor::toggleEmbellishment(TabSession& session, const TabContext& ctx, EmbKind kind)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    auto cell = doc.getCell(ctx.staffIndex, ctx.stringIndex, ctx.cellIndex);

    if (cell.isNote())
    {
        cell.emb = cell.emb == kind ? EmbKind::Normal : kind;
        doc.setCell(ctx.staffIndex, ctx.stringIndex, ctx.cellIndex, cell);
    }
    else
    {
        // No note yet: the embellishment waits for the next fret entered
        auto pending = session.getPendingEmbellishment();
        session.setPendingEmbellishment(pending == kind ? EmbKind::Normal : kind);
    }

    return EditResult::success(ctx.position());
}

EditResult StaffEditor::deleteNote(TabSession& session, const TabContext& ctx)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    if (!doc.getCell(ctx.staffIndex, ctx.stringIndex, ctx.cellIndex).isNote())
        return EditResult::failure(EditStatus::NoNoteAtCursor, ctx.position());

    doc.setCell(ctx.staffIndex, ctx.stringIndex, ctx.cellIndex, Cell::blank());
    return EditResult::success(ctx.position());
}

EditResult StaffEditor::typeLyric(TabSession& session, const Position& pos, char ch)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    int staffIndex = doc.findStaffAtLine(pos.line);
    if (staffIndex < 0)
        return EditResult::failure(EditStatus::NotInTabContext, pos);

    int stringIndex = pos.line - doc.getStaff(staffIndex).firstLine;
    int labelLine = ensureLabelLine(doc, staffIndex);

    auto label = doc.getLine(labelLine);
    if (label.size() <= static_cast<size_t>(pos.column))
        label.resize(static_cast<size_t>(pos.column) + 1, ' ');
    label[static_cast<size_t>(pos.column)] = ch;
    doc.setLine(labelLine, label);

    return EditResult::success({labelLine + 1 + stringIndex, pos.column + 1});
}

int StaffEditor::ensureLabelLine(TabDocument& doc, int staffIndex)
{
    auto staff = doc.getStaff(staffIndex);
    if (staff.firstLine > 0 && !model::isStringLine(doc.getLine(staff.firstLine - 1)))
        return staff.firstLine - 1;

    doc.insertLines(staff.firstLine, {std::string()});
    return staff.firstLine;
}

} // namespace edit
