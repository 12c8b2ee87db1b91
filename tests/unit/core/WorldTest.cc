#include "vault/core/World.hh"

#include <gtest/gtest.h>

#include <set>

using namespace vault;

class WorldTest : public ::testing::Test {
  protected:
    void SetUp() override { level = buildWorld(config); }

    GameConfig config;
    Level level;
};

TEST_F(WorldTest, BuildsTheVault) {
    EXPECT_EQ(level.objects.size(), 13u);

    std::set<std::string> interactables;
    for (const auto& obj : level.objects) {
        if (obj.kind == ObjectKind::Interactable)
            interactables.insert(obj.id);
    }
    std::set<std::string> expected = {"Door_Mesh", "Desk_Mesh", "Bookshelf_Mesh", "ControlPanel_Mesh",
                                      "Distortion_Mesh"};
    EXPECT_EQ(interactables, expected);

    EXPECT_EQ(level.collisionVolumes().size(), 8u);
    EXPECT_EQ(level.totalKeys(), 3);
    EXPECT_TRUE(validateWorld(level).isOk());
}

TEST_F(WorldTest, BuildIsDeterministic) {
    Level again = buildWorld(config);
    ASSERT_EQ(again.objects.size(), level.objects.size());
    for (std::size_t i = 0; i < level.objects.size(); ++i) {
        EXPECT_EQ(again.objects[i].id, level.objects[i].id);
        EXPECT_FLOAT_EQ(again.objects[i].bounds.min.x, level.objects[i].bounds.min.x);
        EXPECT_FLOAT_EQ(again.objects[i].bounds.max.z, level.objects[i].bounds.max.z);
    }
}

TEST_F(WorldTest, RecordsMatchTheLayout) {
    const auto* door = level.record("Door_Mesh");
    ASSERT_NE(door, nullptr);
    EXPECT_TRUE(door->isExit);
    EXPECT_FALSE(door->hasKey);
    EXPECT_EQ(door->rewardMessage, "The emergency exit needs 3 keys.");

    const auto* desk = level.record("Desk_Mesh");
    ASSERT_NE(desk, nullptr);
    EXPECT_TRUE(desk->hasKey);
    EXPECT_FALSE(desk->examined);

    const auto* distortion = level.record("Distortion_Mesh");
    ASSERT_NE(distortion, nullptr);
    EXPECT_TRUE(distortion->scareTrigger);
    EXPECT_FALSE(distortion->hasKey);
    ASSERT_TRUE(distortion->repeatMessage.has_value());

    EXPECT_EQ(level.record("Desk_C"), nullptr);
}

TEST_F(WorldTest, KeyMessagesCountAgainstTheTotal) {
    EXPECT_EQ(level.record("Desk_Mesh")->rewardMessage, "Key Card (1/3) found. A faint whisper echoes.");
    EXPECT_EQ(level.record("Bookshelf_Mesh")->rewardMessage, "Magnetic Key (2/3) found. Silence returns... briefly.");
    EXPECT_EQ(level.record("ControlPanel_Mesh")->rewardMessage,
              "Access Token (3/3) acquired. The lock system is ready.");
}

TEST_F(WorldTest, KeyCountPhrase) {
    EXPECT_EQ(keyCountPhrase(0), "no keys");
    EXPECT_EQ(keyCountPhrase(1), "one key");
    EXPECT_EQ(keyCountPhrase(3), "three keys");
    EXPECT_EQ(keyCountPhrase(12), "12 keys");
}

TEST_F(WorldTest, FloorIsAPlane) {
    const auto* floor = level.find("Floor");
    ASSERT_NE(floor, nullptr);
    EXPECT_FLOAT_EQ(floor->bounds.min.y, 0.0f);
    EXPECT_FLOAT_EQ(floor->bounds.max.y, 0.0f);
    EXPECT_FLOAT_EQ(floor->bounds.min.x, -6.0f);
    EXPECT_FLOAT_EQ(floor->bounds.max.z, 6.0f);
}

TEST_F(WorldTest, SideWallsAreRotated) {
    const auto* left = level.find("WallLeft");
    ASSERT_NE(left, nullptr);
    EXPECT_NEAR(left->bounds.max.x - left->bounds.min.x, 0.1f, 1e-4f);
    EXPECT_NEAR(left->bounds.max.z - left->bounds.min.z, 12.0f, 1e-4f);
    EXPECT_NEAR(left->bounds.center().x, -6.0f, 1e-4f);
}

TEST_F(WorldTest, WorldSizeScalesTheShell) {
    config.world.sizeX = 20.0f;
    Level wide = buildWorld(config);
    const auto* right = wide.find("WallRight");
    ASSERT_NE(right, nullptr);
    EXPECT_NEAR(right->bounds.center().x, 10.0f, 1e-4f);
    EXPECT_TRUE(validateWorld(wide).isOk());
}

TEST_F(WorldTest, FindReturnsNullForUnknown) {
    EXPECT_EQ(level.find("Nope"), nullptr);
    EXPECT_NE(level.find("Desk_C"), nullptr);
}

TEST_F(WorldTest, ResetRestoresLatchesAndVisibility) {
    auto* distortion = level.find("Distortion_Mesh");
    distortion->visible = false;
    distortion->feedback = VisualFeedback::Hidden;
    level.record("Distortion_Mesh")->examined = true;
    level.find("Desk_Mesh")->feedback = VisualFeedback::Consumed;

    resetWorld(level);

    EXPECT_TRUE(distortion->visible);
    EXPECT_EQ(distortion->feedback, VisualFeedback::Normal);
    EXPECT_FALSE(level.record("Distortion_Mesh")->examined);
    EXPECT_EQ(level.find("Desk_Mesh")->feedback, VisualFeedback::Normal);
    EXPECT_EQ(level.objects.size(), 13u);
}

TEST_F(WorldTest, ValidateRejectsDuplicateIds) {
    level.objects.push_back(level.objects.front());
    auto result = validateWorld(level);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::AlreadyExists);
}

TEST_F(WorldTest, ValidateRejectsInteractableWithoutRecord) {
    level.records.erase("Desk_Mesh");
    auto result = validateWorld(level);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::NotFound);
}

TEST_F(WorldTest, ValidateRejectsRecordForCollisionVolume) {
    level.records["Desk_C"] = InteractionRecord{};
    auto result = validateWorld(level);
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
}

TEST_F(WorldTest, ValidateRequiresExactlyOneExit) {
    level.record("Desk_Mesh")->isExit = true;
    auto twoExits = validateWorld(level);
    ASSERT_TRUE(twoExits.isError());
    EXPECT_EQ(twoExits.code(), ErrorCode::InvalidArgument);

    level.record("Desk_Mesh")->isExit = false;
    level.record("Door_Mesh")->isExit = false;
    EXPECT_TRUE(validateWorld(level).isError());
}

TEST_F(WorldTest, KindNames) {
    EXPECT_EQ(objectKindToString(ObjectKind::Collision), "Collision");
    EXPECT_EQ(objectKindToString(ObjectKind::Interactable), "Interactable");
    EXPECT_EQ(visualFeedbackToString(VisualFeedback::Consumed), "Consumed");
    EXPECT_EQ(visualFeedbackToString(VisualFeedback::Hidden), "Hidden");
}
