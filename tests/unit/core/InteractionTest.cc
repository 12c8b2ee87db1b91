#include "vault/core/Interaction.hh"

#include <gtest/gtest.h>

using namespace vault;

class InteractionTest : public ::testing::Test {
  protected:
    void SetUp() override { progress.totalKeys = level.totalKeys(); }

    void collectAllKeys() {
        system.interact("Desk_Mesh", level, presence, progress);
        system.interact("Bookshelf_Mesh", level, presence, progress);
        system.interact("ControlPanel_Mesh", level, presence, progress);
    }

    GameConfig config;
    Level level = buildWorld(config);
    PresenceModel presence{config.presence.maxLevel, config.presence.decayRate, config.presence.moveCost};
    ProgressState progress;
    InteractionSystem system{config.presence};
};

TEST_F(InteractionTest, MissCostsMinor) {
    auto outcome = system.interact(std::nullopt, level, presence, progress);
    EXPECT_EQ(outcome.kind, OutcomeKind::Missed);
    EXPECT_EQ(outcome.message, "You touch the air. Nothing happens.");
    EXPECT_EQ(outcome.tone, MessageTone::Muted);
    EXPECT_FLOAT_EQ(outcome.cost, 1.0f);
    EXPECT_FLOAT_EQ(presence.level(), 1.0f);
}

TEST_F(InteractionTest, NonInteractableIsIgnored) {
    auto collision = system.interact("Desk_C", level, presence, progress);
    EXPECT_EQ(collision.kind, OutcomeKind::Ignored);
    EXPECT_TRUE(collision.message.empty());

    auto unknown = system.interact("Nope", level, presence, progress);
    EXPECT_EQ(unknown.kind, OutcomeKind::Ignored);
    EXPECT_FLOAT_EQ(presence.level(), 0.0f);
}

TEST_F(InteractionTest, FirstVisitFindsKey) {
    auto outcome = system.interact("Desk_Mesh", level, presence, progress);
    EXPECT_EQ(outcome.kind, OutcomeKind::KeyFound);
    EXPECT_EQ(outcome.message, "Key Card (1/3) found. A faint whisper echoes.");
    EXPECT_EQ(outcome.tone, MessageTone::Reward);
    EXPECT_FLOAT_EQ(outcome.cost, 3.0f);
    ASSERT_EQ(outcome.effects.size(), 1u);
    EXPECT_EQ(outcome.effects[0].objectId, "Desk_Mesh");
    EXPECT_EQ(outcome.effects[0].feedback, VisualFeedback::Consumed);

    EXPECT_EQ(progress.keysFound, 1);
    EXPECT_TRUE(level.record("Desk_Mesh")->examined);
    EXPECT_EQ(level.find("Desk_Mesh")->feedback, VisualFeedback::Consumed);
    EXPECT_TRUE(level.find("Desk_Mesh")->visible);
}

TEST_F(InteractionTest, RepeatNeverGrantsASecondKey) {
    system.interact("Desk_Mesh", level, presence, progress);
    auto outcome = system.interact("Desk_Mesh", level, presence, progress);

    EXPECT_EQ(outcome.kind, OutcomeKind::Repeat);
    EXPECT_EQ(outcome.message, "You've already searched here.");
    EXPECT_FLOAT_EQ(outcome.cost, 1.0f);
    EXPECT_EQ(progress.keysFound, 1);
    EXPECT_FLOAT_EQ(presence.level(), 4.0f);
}

TEST_F(InteractionTest, ScareFiresOnce) {
    auto first = system.interact("Distortion_Mesh", level, presence, progress);
    EXPECT_EQ(first.kind, OutcomeKind::Scare);
    EXPECT_EQ(first.message, "A cold terror grips you!");
    EXPECT_EQ(first.tone, MessageTone::Danger);
    EXPECT_TRUE(first.scare);
    EXPECT_FLOAT_EQ(first.cost, 30.0f);
    EXPECT_TRUE(progress.jumpscarePlayed);
    EXPECT_FALSE(level.find("Distortion_Mesh")->visible);
    EXPECT_EQ(level.find("Distortion_Mesh")->feedback, VisualFeedback::Hidden);

    for (int i = 0; i < 4; ++i) {
        auto again = system.interact("Distortion_Mesh", level, presence, progress);
        EXPECT_EQ(again.kind, OutcomeKind::Repeat);
        EXPECT_EQ(again.message, "It's just a faint residue now.");
        EXPECT_FALSE(again.scare);
    }
    EXPECT_FLOAT_EQ(presence.level(), 34.0f);
}

TEST_F(InteractionTest, PlayedScareDoesNotRetrigger) {
    progress.jumpscarePlayed = true;
    auto outcome = system.interact("Distortion_Mesh", level, presence, progress);

    EXPECT_EQ(outcome.kind, OutcomeKind::Examined);
    EXPECT_FALSE(outcome.scare);
    EXPECT_FLOAT_EQ(outcome.cost, 3.0f);
    EXPECT_TRUE(level.find("Distortion_Mesh")->visible);
}

TEST_F(InteractionTest, ExitLockedUntilAllKeys) {
    auto outcome = system.interact("Door_Mesh", level, presence, progress);
    EXPECT_EQ(outcome.kind, OutcomeKind::ExitLocked);
    EXPECT_EQ(outcome.message, "The emergency exit needs 3 keys.");
    EXPECT_FALSE(outcome.win);
    EXPECT_FLOAT_EQ(outcome.cost, 3.0f);

    // Still locked, and still the locked message rather than a repeat
    auto again = system.interact("Door_Mesh", level, presence, progress);
    EXPECT_EQ(again.kind, OutcomeKind::ExitLocked);
    EXPECT_FLOAT_EQ(presence.level(), 6.0f);
}

TEST_F(InteractionTest, ExitOpensWithAllKeys) {
    collectAllKeys();
    EXPECT_TRUE(progress.allKeysFound());
    EXPECT_FLOAT_EQ(presence.level(), 9.0f);

    auto outcome = system.interact("Door_Mesh", level, presence, progress);
    EXPECT_EQ(outcome.kind, OutcomeKind::Escaped);
    EXPECT_EQ(outcome.message, "All keys inserted. The final lock clicks open.");
    EXPECT_EQ(outcome.tone, MessageTone::Reward);
    EXPECT_TRUE(outcome.win);
    EXPECT_FLOAT_EQ(outcome.cost, 0.0f);
    EXPECT_FLOAT_EQ(presence.level(), 9.0f);
}

TEST_F(InteractionTest, MissingRecordIsUnconfigured) {
    level.records.erase("Bookshelf_Mesh");
    auto outcome = system.interact("Bookshelf_Mesh", level, presence, progress);
    EXPECT_EQ(outcome.kind, OutcomeKind::Unconfigured);
    EXPECT_EQ(outcome.message, "Nothing happens.");
    EXPECT_FLOAT_EQ(presence.level(), 0.0f);
}

TEST_F(InteractionTest, CostsClampAtMax) {
    presence.applyCost(99.0f);
    system.interact("Distortion_Mesh", level, presence, progress);
    EXPECT_FLOAT_EQ(presence.level(), 100.0f);
    EXPECT_TRUE(presence.isExhausted());
}

TEST_F(InteractionTest, OutcomeNames) {
    EXPECT_EQ(outcomeKindToString(OutcomeKind::KeyFound), "KeyFound");
    EXPECT_EQ(outcomeKindToString(OutcomeKind::ExitLocked), "ExitLocked");
    EXPECT_EQ(messageToneToString(MessageTone::Danger), "Danger");
}
