#pragma once

#include "vault/core/Bounds.hh"
#include "vault/core/GameConfig.hh"
#include "vault/core/Spatial.hh"
#include "vault/utils/ErrorHandling.hh"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vault {

enum class ObjectKind : std::uint8_t {
    Collision,
    Interactable,
};

// Presentation hint emitted by interactions; the core never draws.
enum class VisualFeedback : std::uint8_t {
    Normal,
    Consumed,
    Hidden,
};

std::string objectKindToString(ObjectKind kind);
std::string visualFeedbackToString(VisualFeedback feedback);

struct WorldObject {
    std::string id;
    ObjectKind kind = ObjectKind::Collision;
    Transform<float> transform;
    Vec3f halfExtents; // in the object's local frame
    AABB bounds;       // world-space, derived from transform and halfExtents
    bool visible = true;
    VisualFeedback feedback = VisualFeedback::Normal;
};

struct InteractionRecord {
    bool hasKey = false;
    std::string rewardMessage;
    std::optional<std::string> repeatMessage;
    bool isExit = false;
    bool scareTrigger = false;
    bool examined = false; // latched on first successful interaction
};

// The fixed level: geometry in build order plus the rule record for each
// interactable, keyed by object id. Object order is stable and is the
// raycast tie-break order.
struct Level {
    std::vector<WorldObject> objects;
    std::unordered_map<std::string, InteractionRecord> records;

    WorldObject* find(std::string_view id);
    const WorldObject* find(std::string_view id) const;

    InteractionRecord* record(std::string_view id);
    const InteractionRecord* record(std::string_view id) const;

    // Number of records carrying a key
    int totalKeys() const;

    std::vector<AABB> collisionVolumes() const;
};

// "one key", "three keys", "12 keys"
std::string keyCountPhrase(int count);

// Constructs the vault: floor, four walls, furniture, the exit door and
// the interactable items. Ids are deterministic.
Level buildWorld(const GameConfig& config);

// Restore latches, visibility and feedback to their built values. Object
// identity and order are untouched.
void resetWorld(Level& level);

// Every interactable has exactly one record, every record names an
// interactable, ids are unique and exactly one exit exists.
Result<void> validateWorld(const Level& level);

} // namespace vault
