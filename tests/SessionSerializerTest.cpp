#include <gtest/gtest.h>
#include "../src/model/SessionSerializer.h"
#include "../src/model/TabSession.h"

using namespace model;

TEST(SessionSerializerTest, JsonRoundTripKeepsSettings) {
    SessionSettings settings;
    settings.staffWidth = 41;
    settings.twelveToneSpelling = true;
    settings.advanceAfterNote = false;
    settings.tuning = {"d", "A", "F", "C", "G", "D"};

    SessionSettings loaded;
    ASSERT_TRUE(SessionSerializer::fromJson(loaded, SessionSerializer::toJson(settings)));
    EXPECT_EQ(loaded.staffWidth, 41);
    EXPECT_TRUE(loaded.twelveToneSpelling);
    EXPECT_FALSE(loaded.advanceAfterNote);
    EXPECT_EQ(loaded.tuning, settings.tuning);
}

TEST(SessionSerializerTest, RejectsMalformedJson) {
    SessionSettings settings;
    EXPECT_FALSE(SessionSerializer::fromJson(settings, "{ not json"));
    EXPECT_FALSE(SessionSerializer::fromJson(settings, "[1, 2, 3]"));
    EXPECT_EQ(settings.staffWidth, SessionSettings::DEFAULT_STAFF_WIDTH);
}

TEST(SessionSerializerTest, MissingKeysKeepDefaults) {
    SessionSettings settings;
    ASSERT_TRUE(SessionSerializer::fromJson(settings, "{ \"twelveToneSpelling\": true }"));
    EXPECT_TRUE(settings.twelveToneSpelling);
    EXPECT_EQ(settings.staffWidth, SessionSettings::DEFAULT_STAFF_WIDTH);
    EXPECT_TRUE(settings.advanceAfterNote);
    EXPECT_EQ(settings.tuning[5], "E");
}

TEST(SessionSerializerTest, IgnoresBadValues) {
    SessionSettings settings;
    ASSERT_TRUE(SessionSerializer::fromJson(settings,
        "{ \"staffWidth\": 3, \"tuning\": [\"e\", \"B\", \"G\", \"D\", \"A\", \"H\"] }"));
    EXPECT_EQ(settings.staffWidth, SessionSettings::DEFAULT_STAFF_WIDTH);
    EXPECT_EQ(settings.tuning[5], "E");

    ASSERT_TRUE(SessionSerializer::fromJson(settings, "{ \"tuning\": [\"e\", \"B\"] }"));
    EXPECT_EQ(settings.tuning[0], "e");
}

TEST(SessionSerializerTest, SavesAndLoadsFile) {
    auto dir = juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("tabmode_serializer_test");
    auto file = dir.getChildFile("settings.json");

    SessionSettings settings;
    settings.staffWidth = 29;
    settings.tuning[5] = "D";
    ASSERT_TRUE(SessionSerializer::save(settings, file));
    EXPECT_TRUE(file.existsAsFile());

    SessionSettings loaded;
    ASSERT_TRUE(SessionSerializer::load(loaded, file));
    EXPECT_EQ(loaded.staffWidth, 29);
    EXPECT_EQ(loaded.tuning[5], "D");

    dir.deleteRecursively();
    EXPECT_FALSE(SessionSerializer::load(loaded, file));
}

TEST(SessionSerializerTest, SessionAppliesLoadedTuning) {
    SessionSettings settings;
    ASSERT_TRUE(SessionSerializer::fromJson(settings,
        "{ \"staffWidth\": 20, \"tuning\": [\"e\", \"B\", \"G\", \"D\", \"A\", \"D\"] }"));

    TabSession session("", settings);
    EXPECT_EQ(session.getTuning().pitch[5], 10);
    EXPECT_EQ(session.getTuning().prefix[5], "d-|");
    EXPECT_EQ(session.getSettings().staffWidth, 20);
}
