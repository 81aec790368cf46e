#include "KeyHandler.h"
#include "../edit/StaffEditor.h"
#include "../edit/Transposer.h"
#include "../edit/TuningModel.h"
#include "../theory/ChordAnalyzer.h"
#include <juce_core/juce_core.h>

using edit::CursorModel;
using edit::Direction;
using edit::StaffEditor;
using edit::TabContext;
using model::EditStatus;
using model::EmbKind;
using model::TabSession;

namespace input {

namespace {

// Signed decimal within [minValue, maxValue]; anything else is refused
bool parseBoundedInt(const juce::String& text, int minValue, int maxValue, int& value)
{
    auto digits = text.startsWithChar('-') || text.startsWithChar('+') ? text.substring(1) : text;
    if (digits.isEmpty() || digits.length() > 9 || !digits.containsOnly("0123456789"))
        return false;

    value = text.startsWithChar('-') ? -digits.getIntValue() : digits.getIntValue();
    return value >= minValue && value <= maxValue;
}

KeyActionResult rejected(const model::Position& pos, const juce::String& message)
{
    KeyActionResult result(KeyAction::Rejected);
    result.cursor = pos;
    result.message = message.toStdString();
    return result;
}

} // namespace

KeyHandler::KeyHandler(ModeManager& modeManager) : modeManager_(modeManager) {}

TabCommand KeyHandler::translate(const KeyEvent& key, int& commandData)
{
    commandData = 0;
    char c = key.ch;

    if (key.ctrl)
    {
        switch (c)
        {
            case 'f': return TabCommand::CellForward;
            case 'b': return TabCommand::CellBackward;
            case 'k': return TabCommand::DeleteNote;
            case 'c': return TabCommand::ToggleChordMode;
            case 'l': return TabCommand::ToggleLyricMode;
            case 'h': return TabCommand::DeleteBackward;
            default: return TabCommand::None;
        }
    }

    // Alt+0/1/2 reach frets 10-12 on a single key
    if (key.alt)
    {
        if (c >= '0' && c <= '2')
        {
            commandData = 10 + (c - '0');
            return TabCommand::Fret;
        }
        return TabCommand::None;
    }

    if (c >= '0' && c <= '9')
    {
        commandData = c - '0';
        return TabCommand::Fret;
    }

    EmbKind kind;
    if (c != '-' && model::embFromGlyph(c, kind))
    {
        commandData = static_cast<int>(kind);
        return TabCommand::Embellish;
    }

    switch (c)
    {
        case ' ': return TabCommand::CellForward;
        case 'k': return TabCommand::StringUp;
        case 'j': return TabCommand::StringDown;
        case 'K': return TabCommand::StaffUp;
        case 'J': return TabCommand::StaffDown;
        case '|': return TabCommand::Barline;
        case 'i': return TabCommand::InsertColumn;
        case 'x': return TabCommand::DeleteForward;
        case '\b': return TabCommand::DeleteBackward;
        case '+': return TabCommand::OctaveUp;
        case '_': return TabCommand::OctaveDown;
        case '?': return TabCommand::AnalyzeChord;
        case '!': return TabCommand::LabelChord;
    }
    return TabCommand::None;
}

KeyActionResult KeyHandler::handleKey(TabSession& session, int rawOffset, const KeyEvent& key)
{
    const auto& doc = session.getDocument();
    auto pos = doc.positionOf(rawOffset);
    auto ctx = CursorModel::resolve(doc, pos);
    if (!ctx)
    {
        session.setLastCommand(model::SessionCommand::Other);
        return KeyActionResult::literal(key.ch);
    }

    if (modeManager_.getMode() == Mode::Lyric && !key.ctrl && !key.alt && key.ch >= ' ' && key.ch <= '~')
        return KeyActionResult::fromEdit(StaffEditor::typeLyric(session, pos, key.ch));

    int commandData = 0;
    auto command = translate(key, commandData);
    if (command != TabCommand::AnalyzeChord && command != TabCommand::LabelChord)
        session.setLastCommand(model::SessionCommand::Other);

    if (command == TabCommand::None)
    {
        KeyActionResult result;
        result.cursor = pos;
        return result;
    }
    return executeTabCommand(session, *ctx, command, commandData);
}

KeyActionResult KeyHandler::navigate(TabSession& session, const TabContext& ctx,
                                     const std::optional<TabContext>& target)
{
    KeyActionResult result;
    result.cursor = ctx.position();
    if (target)
    {
        result.action = KeyAction::Applied;
        result.cursor = target->position();
        session.setLastCommand(model::SessionCommand::Navigate);
    }
    return result;
}

KeyActionResult KeyHandler::executeTabCommand(TabSession& session, const TabContext& ctx,
                                              TabCommand command, int commandData)
{
    const auto& doc = session.getDocument();

    switch (command)
    {
        case TabCommand::Fret:
        {
            bool advance = modeManager_.getMode() == Mode::Tab && session.getSettings().advanceAfterNote;
            return KeyActionResult::fromEdit(StaffEditor::placeNote(session, ctx, commandData, advance));
        }
        case TabCommand::Embellish:
            return KeyActionResult::fromEdit(
                StaffEditor::toggleEmbellishment(session, ctx, static_cast<EmbKind>(commandData)));
        case TabCommand::DeleteNote:
            return KeyActionResult::fromEdit(StaffEditor::deleteNote(session, ctx));

        case TabCommand::CellForward:
            return navigate(session, ctx, CursorModel::advance(doc, ctx, 1));
        case TabCommand::CellBackward:
            return navigate(session, ctx, CursorModel::advance(doc, ctx, -1));
        case TabCommand::StringUp:
        {
            auto target = CursorModel::moveStrings(ctx, -1);
            if (!target)
            {
                // Off the top string: bottom string of the staff above
                target = CursorModel::moveStaff(doc, ctx, Direction::Backward);
                if (target) target->stringIndex = model::Tuning::NUM_STRINGS - 1;
            }
            return navigate(session, ctx, target);
        }
        case TabCommand::StringDown:
        {
            auto target = CursorModel::moveStrings(ctx, 1);
            if (!target)
                target = CursorModel::moveStaff(doc, ctx, Direction::Forward);
            return navigate(session, ctx, target);
        }
        case TabCommand::StaffUp:
            return navigate(session, ctx, CursorModel::moveStaff(doc, ctx, Direction::Backward));
        case TabCommand::StaffDown:
            return navigate(session, ctx, CursorModel::moveStaff(doc, ctx, Direction::Forward));

        case TabCommand::Barline:
            return KeyActionResult::fromEdit(StaffEditor::toggleBarline(session, ctx, true));
        case TabCommand::InsertColumn:
            return KeyActionResult::fromEdit(StaffEditor::insertColumns(session, ctx, 1));
        case TabCommand::DeleteForward:
            return KeyActionResult::fromEdit(StaffEditor::deleteCells(session, ctx, 1, Direction::Forward));
        case TabCommand::DeleteBackward:
            return KeyActionResult::fromEdit(StaffEditor::deleteCells(session, ctx, 1, Direction::Backward));

        case TabCommand::OctaveUp:
            return KeyActionResult::fromEdit(edit::Transposer::octaveShift(session, ctx, edit::OctaveDirection::Up));
        case TabCommand::OctaveDown:
            return KeyActionResult::fromEdit(edit::Transposer::octaveShift(session, ctx, edit::OctaveDirection::Down));

        case TabCommand::AnalyzeChord:
        {
            auto result = KeyActionResult::fromEdit(theory::ChordAnalyzer::analyze(session, ctx));
            if (result.isApplied())
                result.message = theory::ChordAnalyzer::describe(*session.getPendingChord());
            return result;
        }
        case TabCommand::LabelChord:
            return KeyActionResult::fromEdit(theory::ChordAnalyzer::labelChord(session, ctx));

        case TabCommand::ToggleChordMode:
        case TabCommand::ToggleLyricMode:
        {
            modeManager_.toggleMode(command == TabCommand::ToggleChordMode ? Mode::Chord : Mode::Lyric);
            KeyActionResult result(KeyAction::Applied);
            result.cursor = ctx.position();
            result.message = modeManager_.getModeString();
            return result;
        }

        case TabCommand::LyricChar:
        case TabCommand::None:
            break;
    }

    KeyActionResult result;
    result.cursor = ctx.position();
    return result;
}

KeyActionResult KeyHandler::executeCommand(TabSession& session, int rawOffset, int markOffset,
                                           const std::string& command)
{
    auto text = juce::String(command).trim();
    DBG("Executing command: " << text);
    session.setLastCommand(model::SessionCommand::Other);

    auto name = text.upToFirstOccurrenceOf(" ", false, false);
    auto argument = text.fromFirstOccurrenceOf(" ", false, false).trim();

    const auto& doc = session.getDocument();
    auto pos = doc.positionOf(rawOffset);

    if (name == "staff")
    {
        int width = session.getSettings().staffWidth;
        if (argument.isNotEmpty()
            && !parseBoundedInt(argument, model::SessionSettings::MIN_STAFF_WIDTH,
                                model::SessionSettings::MAX_STAFF_WIDTH, width))
            return rejected(pos, "staff width must be between "
                                     + juce::String(model::SessionSettings::MIN_STAFF_WIDTH) + " and "
                                     + juce::String(model::SessionSettings::MAX_STAFF_WIDTH));
        return KeyActionResult::fromEdit(StaffEditor::makeStaff(session, pos, width));
    }
    if (name == "spelling")
    {
        auto& settings = session.getSettings();
        settings.twelveToneSpelling = !settings.twelveToneSpelling;
        KeyActionResult result(KeyAction::Applied);
        result.cursor = pos;
        result.message = settings.twelveToneSpelling ? "12-tone spelling on" : "12-tone spelling off";
        return result;
    }

    auto ctx = CursorModel::resolve(doc, pos);
    if (!ctx)
        return KeyActionResult::fromEdit(model::EditResult::failure(EditStatus::NotInTabContext, pos));

    if (name == "learn")
        return KeyActionResult::fromEdit(edit::TuningModel::learnTuning(session, *ctx));
    if (name == "retune")
        return KeyActionResult::fromEdit(edit::TuningModel::retuneString(session, *ctx, argument.toStdString()));
    if (name == "copy-retune")
        return KeyActionResult::fromEdit(edit::Transposer::copyRetune(session, *ctx));
    if (name == "yank")
        return KeyActionResult::fromEdit(StaffEditor::yank(session, *ctx));

    if (name == "kill" || name == "copy" || name == "transpose")
    {
        auto mark = CursorModel::resolve(doc, markOffset);
        if (!mark)
            return KeyActionResult::fromEdit(model::EditResult::failure(EditStatus::NotInTabContext, pos));

        if (name == "transpose")
        {
            int semitones = 0;
            if (!parseBoundedInt(argument, -model::Cell::MAX_FRET, model::Cell::MAX_FRET, semitones))
                return rejected(pos, "transpose needs a number of semitones between -"
                                         + juce::String(model::Cell::MAX_FRET) + " and "
                                         + juce::String(model::Cell::MAX_FRET));
            return KeyActionResult::fromEdit(
                edit::Transposer::transposeUniform(session, *mark, *ctx, semitones));
        }
        return KeyActionResult::fromEdit(StaffEditor::killRegion(session, *mark, *ctx, name == "kill"));
    }

    return rejected(pos, "Unknown command: " + text);
}

} // namespace input
