#include "Transposer.h"
#include "TuningModel.h"
#include <juce_core/juce_core.h>
#include <algorithm>
#include <cstdint>

using model::Cell;
using model::EditResult;
using model::EditStatus;
using model::SessionCommand;
using model::TabDocument;
using model::TabSession;
using model::Tuning;

namespace edit {

namespace {

// Whole octaves up until non-negative, or down until on the neck
int wrapFret(int fret, int delta)
{
    int64_t shifted = static_cast<int64_t>(fret) + delta;
    if (shifted < 0)
        shifted += 12 * ((-shifted + 11) / 12);
    else if (shifted > Cell::MAX_FRET)
        shifted -= 12 * ((shifted - Cell::MAX_FRET + 11) / 12);
    return static_cast<int>(shifted);
}

void transposeCells(TabDocument& doc, int staffIndex, int low, int high, const Transposer::StringDeltas& deltas)
{
    for (int s = 0; s < Tuning::NUM_STRINGS; ++s)
    {
        for (int c = low; c <= high; ++c)
        {
            auto cell = doc.getCell(staffIndex, s, c);
            if (!cell.isNote()) continue;
            cell.fret = wrapFret(cell.fret, deltas[static_cast<size_t>(s)]);
            doc.setCell(staffIndex, s, c, cell);
        }
    }
}

} // anonymous namespace

int Transposer::nearestInterval(int fromPitch, int toPitch)
{
    int diff = model::wrapPitch(toPitch - fromPitch);
    return diff > 6 ? diff - 12 : diff;
}

EditResult Transposer::transpose(TabSession& session, const TabContext& begin,
                                 const TabContext& end, const StringDeltas& deltas)
{
    session.setLastCommand(SessionCommand::Edit);

    if (begin.staffIndex != end.staffIndex)
    {
        DBG("Transpose region spans staves " << begin.staffIndex << " and " << end.staffIndex);
        return EditResult::failure(EditStatus::RegionSpansMultipleStaves, begin.position());
    }

    transposeCells(session.getDocument(), begin.staffIndex,
                   std::min(begin.cellIndex, end.cellIndex),
                   std::max(begin.cellIndex, end.cellIndex), deltas);

    return EditResult::success(begin.position());
}

EditResult Transposer::transposeUniform(TabSession& session, const TabContext& begin,
                                        const TabContext& end, int semitones)
{
    StringDeltas deltas;
    deltas.fill(semitones);
    return transpose(session, begin, end, deltas);
}

EditResult Transposer::copyRetune(TabSession& session, const TabContext& source)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    auto staff = doc.getStaff(source.staffIndex);
    auto oldTuning = TuningModel::readTuning(doc, source.staffIndex);
    const auto& current = session.getTuning();

    std::vector<std::string> copy;
    for (int s = 0; s < Tuning::NUM_STRINGS; ++s)
    {
        auto line = doc.getLine(staff.firstLine + s);
        line.replace(0, Tuning::PREFIX_WIDTH, current.prefix[static_cast<size_t>(s)]);
        copy.push_back(line);
    }

    int blank = staff.lastLine() + 1;
    while (blank < doc.getLineCount() && !doc.isBlankLine(blank))
        ++blank;
    if (blank >= doc.getLineCount())
    {
        doc.ensureLineCount(doc.getLineCount() + 1);
        blank = doc.getLineCount() - 1;
    }

    int firstLine = blank + 1;
    if (firstLine < doc.getLineCount() && model::isStringLine(doc.getLine(firstLine)))
        copy.push_back(std::string());
    doc.insertLines(firstLine, copy);

    StringDeltas deltas;
    for (int s = 0; s < Tuning::NUM_STRINGS; ++s)
    {
        auto i = static_cast<size_t>(s);
        deltas[i] = nearestInterval(current.pitch[i], oldTuning.pitch[i]);
    }

    int newStaff = doc.findStaffAtLine(firstLine);
    int cells = doc.getCellCount(newStaff);
    if (cells > 0)
        transposeCells(doc, newStaff, 0, cells - 1, deltas);

    return EditResult::success({firstLine + source.stringIndex, source.column()});
}

EditResult Transposer::octaveShift(TabSession& session, const TabContext& ctx, OctaveDirection direction)
{
    session.setLastCommand(SessionCommand::Edit);

    auto& doc = session.getDocument();
    auto cell = doc.getCell(ctx.staffIndex, ctx.stringIndex, ctx.cellIndex);
    if (!cell.isNote())
        return EditResult::failure(EditStatus::NoNoteAtCursor, ctx.position());

    if (direction == OctaveDirection::Up && cell.fret <= 12)
        cell.fret += 12;
    else if (direction == OctaveDirection::Down && cell.fret >= 12)
        cell.fret -= 12;

    doc.setCell(ctx.staffIndex, ctx.stringIndex, ctx.cellIndex, cell);
    return EditResult::success(ctx.position());
}

} // namespace edit
