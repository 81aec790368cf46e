#include "ChordAnalyzer.h"
#include "../edit/StaffEditor.h"
#include <juce_core/juce_core.h>
#include <algorithm>

using model::ChordAnalysis;
using model::EditResult;
using model::EditStatus;
using model::SessionCommand;
using model::TabSession;
using model::Tuning;

namespace theory {

namespace {

constexpr int NUM_STRINGS = Tuning::NUM_STRINGS;

std::vector<int> intervalsAbove(const std::array<int, 12>& counts, int root, int skipPitch)
{
    std::vector<int> intervals;
    for (int pitch = 0; pitch < 12; ++pitch)
    {
        if (counts[static_cast<size_t>(pitch)] == 0 || pitch == root || pitch == skipPitch) continue;
        intervals.push_back(model::wrapPitch(pitch - root));
    }
    std::sort(intervals.begin(), intervals.end());
    return intervals;
}

} // anonymous namespace

ChordAnalysis ChordAnalyzer::analyzeFrets(const Frets& frets, const Tuning& tuning,
                                          int rootString, bool twelveToneSpelling)
{
    ChordAnalysis chord;
    chord.rootString = rootString;

    std::array<int, NUM_STRINGS> pitches;
    std::array<int, 12> counts = {};
    int bass = -1;

    // High string first, so the lowest sounding string is seen last
    for (int s = 0; s < NUM_STRINGS; ++s)
    {
        auto i = static_cast<size_t>(s);
        pitches[i] = frets[i] == NO_NOTE ? NO_NOTE : model::wrapPitch(frets[i] + tuning.pitch[i]);
        if (pitches[i] == NO_NOTE) continue;
        ++counts[static_cast<size_t>(pitches[i])];
        bass = pitches[i];
    }

    int root = pitches[static_cast<size_t>(rootString)];
    chord.rootPitch = root;
    chord.bassPitch = bass;
    chord.intervals = intervalsAbove(counts, root, -1);
    chord.count = 1 + static_cast<int>(chord.intervals.size());

    std::string quality = "??";
    const ChordPattern* pattern = ChordTable::match(chord.intervals, chord.count);
    if (pattern)
    {
        quality = pattern->name;
        chord.disclaimer = pattern->disclaimer;
    }
    else if (bass != root && counts[static_cast<size_t>(bass)] == 1)
    {
        // Try again as a slash chord over a single bass note
        auto upper = intervalsAbove(counts, root, bass);
        pattern = ChordTable::match(upper, chord.count - 1);
        if (pattern)
        {
            quality = pattern->name + "/" + model::noteName(bass);
            chord.disclaimer = pattern->disclaimer;
        }
    }
    chord.chordName = model::noteName(root) + quality;

    for (int s = 0; s < NUM_STRINGS; ++s)
    {
        if (s > 0) chord.spelling += ' ';
        int pitch = pitches[static_cast<size_t>(s)];
        if (pitch == NO_NOTE)
            chord.spelling += 'x';
        else if (pattern)
            chord.spelling += pattern->degreeLabel(pitch - root);
        else
            chord.spelling += ChordTable::degreeLabel(pitch - root);
    }

    if (twelveToneSpelling)
    {
        chord.spelling += " (";
        for (int s = NUM_STRINGS - 1; s >= 0; --s)
        {
            int pitch = pitches[static_cast<size_t>(s)];
            chord.spelling += pitch == NO_NOTE ? std::string("x") : std::to_string(model::wrapPitch(pitch - root));
            if (s > 0) chord.spelling += ' ';
        }
        chord.spelling += ')';
    }

    return chord;
}

EditResult ChordAnalyzer::analyze(TabSession& session, const edit::TabContext& ctx)
{
    const auto& doc = session.getDocument();

    Frets frets;
    for (int s = 0; s < NUM_STRINGS; ++s)
    {
        auto cell = doc.getCell(ctx.staffIndex, s, ctx.cellIndex);
        frets[static_cast<size_t>(s)] = cell.isNote() ? cell.fret : NO_NOTE;
    }

    const auto& pending = session.getPendingChord();
    bool repeat = session.getLastCommand() == SessionCommand::AnalyzeChord && pending
               && pending->staffIndex == ctx.staffIndex && pending->cellIndex == ctx.cellIndex;

    int start = repeat ? pending->rootString + 1 : ctx.stringIndex;
    int rootString = -1;
    for (int i = 0; i < NUM_STRINGS; ++i)
    {
        int s = (start + i) % NUM_STRINGS;
        if (frets[static_cast<size_t>(s)] != NO_NOTE)
        {
            rootString = s;
            break;
        }
    }

    if (rootString < 0)
    {
        DBG("No notes in column " << ctx.cellIndex << " of staff " << ctx.staffIndex);
        session.clearPendingChord();
        session.setLastCommand(SessionCommand::AnalyzeChord);
        return EditResult::failure(EditStatus::NoNotesInChord, ctx.position());
    }

    auto chord = analyzeFrets(frets, session.getTuning(), rootString, session.getSettings().twelveToneSpelling);
    chord.staffIndex = ctx.staffIndex;
    chord.cellIndex = ctx.cellIndex;

    session.setLastCommand(SessionCommand::AnalyzeChord);
    session.setPendingChord(chord);

    auto rootCtx = ctx;
    rootCtx.stringIndex = rootString;
    return EditResult::success(rootCtx.position());
}

EditResult ChordAnalyzer::labelChord(TabSession& session, const edit::TabContext& ctx)
{
    const auto& pending = session.getPendingChord();
    if (session.getLastCommand() != SessionCommand::AnalyzeChord || !pending)
    {
        DBG("Chord label requested without a preceding analysis");
        session.setLastCommand(SessionCommand::LabelChord);
        return EditResult::failure(EditStatus::ChordLabelOutOfSequence, ctx.position());
    }

    auto chord = *pending;
    auto& doc = session.getDocument();
    int firstLineBefore = doc.getStaff(chord.staffIndex).firstLine;
    int labelLine = edit::StaffEditor::ensureLabelLine(doc, chord.staffIndex);
    int shift = doc.getStaff(chord.staffIndex).firstLine - firstLineBefore;

    auto label = doc.getLine(labelLine);
    auto column = static_cast<size_t>(model::TabDocument::cellColumn(chord.cellIndex));

    // Clear the old label word under the root column
    if (column < label.size() && label[column] != ' ')
    {
        size_t begin = column;
        while (begin > 0 && label[begin - 1] != ' ')
            --begin;
        for (size_t i = begin; i < label.size() && label[i] != ' '; ++i)
            label[i] = ' ';
    }

    if (label.size() < column + chord.chordName.size())
        label.resize(column + chord.chordName.size(), ' ');
    label.replace(column, chord.chordName.size(), chord.chordName);
    doc.setLine(labelLine, label);

    session.setLastCommand(SessionCommand::LabelChord);

    auto cursor = ctx.position();
    cursor.line += shift;
    return EditResult::success(cursor);
}

std::string ChordAnalyzer::describe(const ChordAnalysis& chord)
{
    return chord.chordName + chord.disclaimer + "  " + chord.spelling;
}

} // namespace theory
