#include "vault/core/Targeting.hh"

#include <gtest/gtest.h>

#include <numbers>

using namespace vault;

namespace {

WorldObject makeObject(const std::string& id, ObjectKind kind, const Vec3f& center, const Vec3f& half) {
    WorldObject obj;
    obj.id = id;
    obj.kind = kind;
    obj.transform = Transform<float>(center, Quaternion<float>());
    obj.halfExtents = half;
    obj.bounds = AABB::fromCenterHalfExtents(center, half);
    return obj;
}

} // namespace

class TargetingTest : public ::testing::Test {
  protected:
    // Looking down -Z from the origin
    PlayerPose pose{Vec3f(0.0f, 1.6f, 0.0f), 0.0f};
    Vec3f half{0.25f, 0.25f, 0.25f};
};

TEST_F(TargetingTest, AimRayFollowsPose) {
    Ray ray = aimRay(pose);
    EXPECT_FLOAT_EQ(ray.origin.y, 1.6f);
    EXPECT_NEAR(ray.direction.z, -1.0f, 1e-5f);
}

TEST_F(TargetingTest, HitsInteractableInRange) {
    std::vector<WorldObject> objects{makeObject("Box", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, -2.0f), half)};

    auto hit = findTarget(pose, objects, 3.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->objectId, "Box");
    EXPECT_EQ(hit->objectIndex, 0u);
    EXPECT_NEAR(hit->distance, 1.75f, 1e-5f);
}

TEST_F(TargetingTest, OutOfRangeIsNoTarget) {
    std::vector<WorldObject> objects{makeObject("Box", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, -3.5f), half)};
    EXPECT_FALSE(findTarget(pose, objects, 3.0f).has_value());
}

TEST_F(TargetingTest, CollisionVolumesAreTransparent) {
    std::vector<WorldObject> objects{
        makeObject("Wall", ObjectKind::Collision, Vec3f(0.0f, 1.6f, -1.0f), half),
        makeObject("Box", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, -2.0f), half),
    };

    auto hit = findTarget(pose, objects, 3.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->objectId, "Box");
    EXPECT_EQ(hit->objectIndex, 1u);
}

TEST_F(TargetingTest, NearestWins) {
    std::vector<WorldObject> objects{
        makeObject("Far", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, -2.5f), half),
        makeObject("Near", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, -1.0f), half),
    };

    auto hit = findTarget(pose, objects, 3.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->objectId, "Near");
}

TEST_F(TargetingTest, TieGoesToEarlierObject) {
    std::vector<WorldObject> objects{
        makeObject("First", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, -2.0f), half),
        makeObject("Second", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, -2.0f), half),
    };

    auto hit = findTarget(pose, objects, 3.0f);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->objectId, "First");
}

TEST_F(TargetingTest, BehindIsNoTarget) {
    std::vector<WorldObject> objects{makeObject("Box", ObjectKind::Interactable, Vec3f(0.0f, 1.6f, 1.5f), half)};
    EXPECT_FALSE(findTarget(pose, objects, 3.0f).has_value());
}

TEST_F(TargetingTest, SpawnFacesTheDoor) {
    GameConfig config;
    Level level = buildWorld(config);
    PlayerPose spawn(Vec3f(config.player.spawnX, config.player.height, config.player.spawnZ), config.player.spawnYaw);

    auto hit = findTarget(spawn, level.objects, config.player.interactRange);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->objectId, "Door_Mesh");
    EXPECT_NEAR(hit->distance, 0.8f, 1e-3f);
}

TEST_F(TargetingTest, SpawnFacingIntoTheRoomFindsNothing) {
    GameConfig config;
    Level level = buildWorld(config);
    PlayerPose spawn(Vec3f(config.player.spawnX, config.player.height, config.player.spawnZ), 0.0f);

    EXPECT_FALSE(findTarget(spawn, level.objects, config.player.interactRange).has_value());
}
