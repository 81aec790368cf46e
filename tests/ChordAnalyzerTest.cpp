#include <gtest/gtest.h>
#include "../src/edit/StaffEditor.h"
#include "../src/edit/Transposer.h"
#include "../src/theory/ChordAnalyzer.h"
#include "TabTestUtils.h"
#include <algorithm>

using namespace theory;
using model::EditStatus;
using model::Position;
using model::SessionCommand;
using model::TabSession;
using model::Tuning;

namespace {

constexpr int X = ChordAnalyzer::NO_NOTE;

// Frets from the high e string down to the low E
model::ChordAnalysis analyze(ChordAnalyzer::Frets frets, int rootString, bool twelveTone = false) {
    return ChordAnalyzer::analyzeFrets(frets, Tuning::standard(), rootString, twelveTone);
}

} // namespace

TEST(ChordAnalyzerTest, MajorTriad) {
    auto chord = analyze({0, 2, 2, 2, 0, X}, 4);
    EXPECT_EQ(chord.chordName, "A");
    EXPECT_EQ(chord.disclaimer, "");
    EXPECT_EQ(chord.spelling, "5 3 rt 5 rt x");
    EXPECT_EQ(chord.count, 3);
    EXPECT_EQ(chord.rootPitch, 5);
    EXPECT_EQ(chord.bassPitch, 5);
}

TEST(ChordAnalyzerTest, MinorTriad) {
    auto chord = analyze({0, 1, 2, 2, 0, X}, 4);
    EXPECT_EQ(chord.chordName, "Am");
    EXPECT_EQ(chord.spelling, "5 b3 rt 5 rt x");
}

TEST(ChordAnalyzerTest, DominantSeventh) {
    auto chord = analyze({1, 0, 0, 0, 2, 3}, 5);
    EXPECT_EQ(chord.chordName, "G7");
    EXPECT_EQ(chord.spelling, "7 3 rt 5 3 rt");
    EXPECT_EQ(chord.intervals, (std::vector<int>{4, 7, 10}));
}

TEST(ChordAnalyzerTest, PowerChord) {
    auto chord = analyze({X, X, X, 2, 2, 0}, 5);
    EXPECT_EQ(chord.chordName, "E5");
    EXPECT_EQ(chord.spelling, "x x x rt 5 rt");
}

TEST(ChordAnalyzerTest, SingleNoteNamesItsPitch) {
    auto chord = analyze({3, X, X, X, X, X}, 0);
    EXPECT_EQ(chord.chordName, "G");
    EXPECT_EQ(chord.disclaimer, ",no3,no5");
    EXPECT_EQ(ChordAnalyzer::describe(chord), "G,no3,no5  rt x x x x x");
}

TEST(ChordAnalyzerTest, SeventhWithoutThirdKeepsBareDisclaimer) {
    auto chord = analyze({1, X, X, 0, X, 3}, 5);
    EXPECT_EQ(chord.chordName, "G7");
    EXPECT_EQ(chord.disclaimer, "no3");
    EXPECT_EQ(ChordAnalyzer::describe(chord), "G7no3  7 x x 5 x rt");
}

TEST(ChordAnalyzerTest, EarlierEntryShadowsLaterOne) {
    auto chord = analyze({0, 3, 0, 2, 0, X}, 4);
    EXPECT_EQ(chord.chordName, "A7sus4");
    EXPECT_EQ(chord.spelling, "5 4 7 5 rt x");

    const auto& patterns = ChordTable::getPatterns(4);
    auto eleven = std::find_if(patterns.begin(), patterns.end(), [](const ChordPattern& p) {
        return p.name == "11" && p.intervals == std::vector<int>{5, 7, 10};
    });
    EXPECT_NE(eleven, patterns.end());
    EXPECT_EQ(ChordTable::match({5, 7, 10}, 4)->name, "7sus4");
}

TEST(ChordAnalyzerTest, NinthUsesExtendedDegreeNames) {
    auto chord = analyze({3, 3, 3, 2, 3, X}, 4);
    EXPECT_EQ(chord.chordName, "C9");
    EXPECT_EQ(chord.spelling, "5 9 7 3 rt x");
    EXPECT_EQ(chord.count, 5);
}

TEST(ChordAnalyzerTest, UnknownChordOverSingleBassBecomesSlashChord) {
    auto chord = analyze({0, 1, 0, 2, 3, 2}, 4);
    EXPECT_EQ(chord.chordName, "C/F#");
    EXPECT_EQ(chord.spelling, "3 rt 5 3 rt b5");
    EXPECT_EQ(chord.bassPitch, 2);
}

TEST(ChordAnalyzerTest, UnknownChordIsMarked) {
    auto chord = analyze({X, 0, 3, X, 0, X}, 4);
    EXPECT_EQ(chord.chordName, "A??");
    EXPECT_EQ(chord.disclaimer, "");
    EXPECT_EQ(chord.spelling, "x 2 b2 x rt x");
}

TEST(ChordAnalyzerTest, TwelveToneSpellingListsIntervalsLowToHigh) {
    auto chord = analyze({0, 2, 2, 2, 0, X}, 4, true);
    EXPECT_EQ(chord.spelling, "5 3 rt 5 rt x (x 0 7 0 4 7)");
}

TEST(ChordAnalyzerTest, FollowsTuning) {
    Tuning dropD;
    ASSERT_TRUE(dropD.setFromNames({"e", "B", "G", "D", "A", "D"}));
    auto chord = ChordAnalyzer::analyzeFrets({X, X, X, 0, X, 0}, dropD, 5, false);
    EXPECT_EQ(chord.chordName, "D");
    EXPECT_EQ(chord.disclaimer, ",no3,no5");
}

TEST(ChordTableTest, EveryCountHasPatterns) {
    for (int n = ChordTable::MIN_NOTES; n <= ChordTable::MAX_NOTES; ++n)
        EXPECT_FALSE(ChordTable::getPatterns(n).empty()) << "note count " << n;
    EXPECT_TRUE(ChordTable::getPatterns(0).empty());
    EXPECT_TRUE(ChordTable::getPatterns(7).empty());
}

TEST(ChordTableTest, DegreeLabelsWrap) {
    EXPECT_STREQ(ChordTable::degreeLabel(0), "rt");
    EXPECT_STREQ(ChordTable::degreeLabel(11), "maj7");
    EXPECT_STREQ(ChordTable::degreeLabel(-5), "5");
    EXPECT_STREQ(ChordTable::degreeLabel(15), "b3");
}

class ChordSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        // A major in cell 0, nothing in cell 1
        session = TabSession("     Dm7 x\n" + testutil::staff({{
            {"--0", "---"},
            {"--2", "---"},
            {"--2", "---"},
            {"--2", "---"},
            {"--0", "---"},
            {"---", "---"},
        }}));
    }

    edit::TabContext at(int string, int cell) {
        return *edit::CursorModel::at(session.getDocument(), 0, string, cell);
    }

    TabSession session;
};

TEST_F(ChordSessionTest, AnalyzeMovesCursorToRoot) {
    auto result = ChordAnalyzer::analyze(session, at(5, 0));
    ASSERT_TRUE(result.ok());

    // Muted low E, so the search wraps to the high e
    EXPECT_EQ(result.cursor, (Position{1, 5}));
    ASSERT_TRUE(session.getPendingChord().has_value());
    EXPECT_EQ(session.getPendingChord()->rootString, 0);
    EXPECT_EQ(session.getLastCommand(), SessionCommand::AnalyzeChord);
}

TEST_F(ChordSessionTest, RepeatedAnalysisRotatesRoot) {
    auto result = ChordAnalyzer::analyze(session, at(4, 0));
    EXPECT_EQ(session.getPendingChord()->chordName, "A");
    EXPECT_EQ(result.cursor, (Position{5, 5}));

    result = ChordAnalyzer::analyze(session, at(4, 0));
    EXPECT_EQ(session.getPendingChord()->rootString, 0);
    EXPECT_EQ(session.getPendingChord()->chordName, "E??");
    EXPECT_EQ(result.cursor, (Position{1, 5}));

    result = ChordAnalyzer::analyze(session, at(0, 0));
    EXPECT_EQ(session.getPendingChord()->rootString, 1);
}

TEST_F(ChordSessionTest, InterveningCommandRestartsAtCursor) {
    ChordAnalyzer::analyze(session, at(4, 0));
    session.setLastCommand(SessionCommand::Navigate);
    EXPECT_FALSE(session.getPendingChord().has_value());

    ChordAnalyzer::analyze(session, at(4, 0));
    EXPECT_EQ(session.getPendingChord()->rootString, 4);
}

TEST_F(ChordSessionTest, EmptyColumnHasNoChord) {
    auto result = ChordAnalyzer::analyze(session, at(2, 1));
    EXPECT_EQ(result.status, EditStatus::NoNotesInChord);
    EXPECT_FALSE(session.getPendingChord().has_value());
}

TEST_F(ChordSessionTest, LabelNeedsPrecedingAnalysis) {
    auto result = ChordAnalyzer::labelChord(session, at(4, 0));
    EXPECT_EQ(result.status, EditStatus::ChordLabelOutOfSequence);

    ChordAnalyzer::analyze(session, at(4, 0));
    session.setLastCommand(SessionCommand::Edit);
    result = ChordAnalyzer::labelChord(session, at(4, 0));
    EXPECT_EQ(result.status, EditStatus::ChordLabelOutOfSequence);
    EXPECT_EQ(session.getDocument().getLine(0), "     Dm7 x");
}

TEST_F(ChordSessionTest, RejectedEditsStillEndTheAnalysis) {
    ChordAnalyzer::analyze(session, at(4, 0));
    EXPECT_EQ(edit::StaffEditor::deleteNote(session, at(5, 0)).status, EditStatus::NoNoteAtCursor);
    EXPECT_EQ(ChordAnalyzer::labelChord(session, at(4, 0)).status, EditStatus::ChordLabelOutOfSequence);

    ChordAnalyzer::analyze(session, at(4, 0));
    EXPECT_EQ(edit::StaffEditor::yank(session, at(4, 1)).status, EditStatus::ClipboardEmpty);
    EXPECT_EQ(ChordAnalyzer::labelChord(session, at(4, 0)).status, EditStatus::ChordLabelOutOfSequence);

    ChordAnalyzer::analyze(session, at(4, 0));
    auto result = edit::Transposer::octaveShift(session, at(4, 1), edit::OctaveDirection::Up);
    EXPECT_EQ(result.status, EditStatus::NoNoteAtCursor);
    EXPECT_EQ(ChordAnalyzer::labelChord(session, at(4, 0)).status, EditStatus::ChordLabelOutOfSequence);

    EXPECT_EQ(session.getDocument().getLine(0), "     Dm7 x");
}

TEST_F(ChordSessionTest, FailedAnalysisDropsEarlierChord) {
    ASSERT_TRUE(ChordAnalyzer::analyze(session, at(4, 0)).ok());
    EXPECT_EQ(ChordAnalyzer::analyze(session, at(4, 1)).status, EditStatus::NoNotesInChord);
    EXPECT_FALSE(session.getPendingChord().has_value());
    EXPECT_EQ(ChordAnalyzer::labelChord(session, at(4, 1)).status, EditStatus::ChordLabelOutOfSequence);
    EXPECT_EQ(session.getDocument().getLine(0), "     Dm7 x");
}

TEST_F(ChordSessionTest, LabelReplacesWordAboveColumn) {
    ChordAnalyzer::analyze(session, at(4, 0));
    auto result = ChordAnalyzer::labelChord(session, at(4, 0));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(session.getDocument().getLine(0), "     A   x");
    EXPECT_EQ(result.cursor, (Position{5, 5}));
    EXPECT_EQ(session.getLastCommand(), SessionCommand::LabelChord);

    // A label ends the sequence
    EXPECT_EQ(ChordAnalyzer::labelChord(session, at(4, 0)).status, EditStatus::ChordLabelOutOfSequence);
}

TEST(ChordLabelTest, InsertsLabelLineAboveTopStaff) {
    TabSession session(testutil::staff({{
        {"---", "--3"},
        {"---", "--0"},
        {"---", "--0"},
        {"---", "--0"},
        {"---", "--2"},
        {"---", "--3"},
    }}));
    auto ctx = *edit::CursorModel::at(session.getDocument(), 0, 5, 1);

    ChordAnalyzer::analyze(session, ctx);
    auto result = ChordAnalyzer::labelChord(session, ctx);
    ASSERT_TRUE(result.ok());

    EXPECT_EQ(session.getDocument().getLine(0), "        G");
    EXPECT_EQ(session.getDocument().getStaff(0).firstLine, 1);
    EXPECT_EQ(result.cursor, (Position{6, 8}));
}
