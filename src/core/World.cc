#include "vault/core/World.hh"

#include "vault/core/Log.hh"

#include <numbers>
#include <unordered_set>

namespace vault {

std::string objectKindToString(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::Collision:
            return "Collision";
        case ObjectKind::Interactable:
            return "Interactable";
        default:
            return "Unknown";
    }
}

std::string visualFeedbackToString(VisualFeedback feedback) {
    switch (feedback) {
        case VisualFeedback::Normal:
            return "Normal";
        case VisualFeedback::Consumed:
            return "Consumed";
        case VisualFeedback::Hidden:
            return "Hidden";
        default:
            return "Unknown";
    }
}

WorldObject* Level::find(std::string_view id) {
    for (auto& obj : objects) {
        if (obj.id == id)
            return &obj;
    }
    return nullptr;
}

const WorldObject* Level::find(std::string_view id) const {
    for (const auto& obj : objects) {
        if (obj.id == id)
            return &obj;
    }
    return nullptr;
}

InteractionRecord* Level::record(std::string_view id) {
    auto it = records.find(std::string(id));
    return it != records.end() ? &it->second : nullptr;
}

const InteractionRecord* Level::record(std::string_view id) const {
    auto it = records.find(std::string(id));
    return it != records.end() ? &it->second : nullptr;
}

int Level::totalKeys() const {
    int count = 0;
    for (const auto& [id, rec] : records) {
        if (rec.hasKey)
            ++count;
    }
    return count;
}

std::string keyCountPhrase(int count) {
    static constexpr const char* kWords[] = {"no", "one", "two", "three", "four", "five", "six", "seven", "eight", "nine"};
    std::string number = count >= 0 && count < 10 ? kWords[count] : std::to_string(count);
    return number + (count == 1 ? " key" : " keys");
}

std::vector<AABB> Level::collisionVolumes() const {
    std::vector<AABB> volumes;
    for (const auto& obj : objects) {
        if (obj.kind == ObjectKind::Collision)
            volumes.push_back(obj.bounds);
    }
    return volumes;
}

namespace {

const Vec3f kUnitY(0.0f, 1.0f, 0.0f);

// Boxes are given by full size, matching how the room is laid out
void addBox(Level& level, std::string id, ObjectKind kind, const Vec3f& size, const Vec3f& position,
            const Quaternion<float>& rotation = Quaternion<float>()) {
    WorldObject obj;
    obj.id = std::move(id);
    obj.kind = kind;
    obj.transform = Transform<float>(position, rotation);
    obj.halfExtents = size * 0.5f;
    obj.bounds = boundsOfBox(obj.transform, obj.halfExtents);
    level.objects.push_back(std::move(obj));
}

} // namespace

Level buildWorld(const GameConfig& config) {
    constexpr float kPi = std::numbers::pi_v<float>;
    constexpr float kWallThickness = 0.1f;

    const float wX = config.world.sizeX;
    const float wY = config.world.sizeY;
    const float wZ = config.world.sizeZ;

    Level level;

    // Room shell
    // Zero-thickness plane at y = 0
    addBox(level, "Floor", ObjectKind::Collision, Vec3f(wX, 0.0f, wZ), Vec3f(0.0f, 0.0f, 0.0f));
    addBox(level, "WallBack", ObjectKind::Collision, Vec3f(wX, wY, kWallThickness), Vec3f(0.0f, wY / 2.0f, -wZ / 2.0f));
    addBox(level, "WallLeft", ObjectKind::Collision, Vec3f(wZ, wY, kWallThickness), Vec3f(-wX / 2.0f, wY / 2.0f, 0.0f),
           Quaternion<float>::fromAxisAngle(kUnitY, kPi / 2.0f));
    addBox(level, "WallRight", ObjectKind::Collision, Vec3f(wZ, wY, kWallThickness), Vec3f(wX / 2.0f, wY / 2.0f, 0.0f),
           Quaternion<float>::fromAxisAngle(kUnitY, -kPi / 2.0f));
    // Sits just behind the door so the door stays reachable
    addBox(level, "WallFront", ObjectKind::Collision, Vec3f(wX, wY, kWallThickness),
           Vec3f(0.0f, wY / 2.0f, wZ / 2.0f + kWallThickness));

    addBox(level, "Door_Mesh", ObjectKind::Interactable, Vec3f(2.0f, 4.0f, 0.2f), Vec3f(0.0f, 2.0f, wZ / 2.0f - 0.1f));

    // Furniture and the items hidden on it
    addBox(level, "Desk_C", ObjectKind::Collision, Vec3f(2.0f, 1.0f, 1.0f), Vec3f(3.0f, 0.5f, 3.0f));
    addBox(level, "Desk_Mesh", ObjectKind::Interactable, Vec3f(0.5f, 0.1f, 0.5f), Vec3f(3.0f, 1.05f, 3.0f));

    addBox(level, "Bookshelf_C", ObjectKind::Collision, Vec3f(1.0f, 3.0f, 4.0f), Vec3f(-4.5f, 1.5f, 0.0f));
    addBox(level, "Bookshelf_Mesh", ObjectKind::Interactable, Vec3f(0.1f, 0.1f, 0.1f), Vec3f(-4.5f, 1.5f, -1.5f));

    // Cylindrical console, collided as its enclosing box
    addBox(level, "Panel_C", ObjectKind::Collision, Vec3f(1.6f, 1.5f, 1.6f), Vec3f(4.0f, 0.75f, -4.0f));
    addBox(level, "ControlPanel_Mesh", ObjectKind::Interactable, Vec3f(0.5f, 0.5f, 0.05f), Vec3f(4.0f, 1.5f, -3.1f));

    // Ring-shaped symbol hanging near the back wall
    addBox(level, "Distortion_Mesh", ObjectKind::Interactable, Vec3f(0.8f, 0.8f, 0.2f),
           Vec3f(-3.0f, wY * 0.8f, -wZ / 2.0f + 1.1f));

    auto& door = level.records["Door_Mesh"];
    door.isExit = true;

    struct KeyItem {
        const char* objectId;
        const char* name;
        const char* aftermath;
    };
    const KeyItem keyItems[] = {
        {"Desk_Mesh", "Key Card", "found. A faint whisper echoes."},
        {"Bookshelf_Mesh", "Magnetic Key", "found. Silence returns... briefly."},
        {"ControlPanel_Mesh", "Access Token", "acquired. The lock system is ready."},
    };
    for (const auto& item : keyItems) {
        level.records[item.objectId].hasKey = true;
    }

    const std::string keySuffix = "/" + std::to_string(level.totalKeys()) + ") ";
    int ordinal = 0;
    for (const auto& item : keyItems) {
        level.records[item.objectId].rewardMessage =
            std::string(item.name) + " (" + std::to_string(++ordinal) + keySuffix + item.aftermath;
    }

    auto& distortion = level.records["Distortion_Mesh"];
    distortion.scareTrigger = true;
    distortion.rewardMessage = "A sudden, blinding static! THE PRESENCE IS CLOSER!";
    distortion.repeatMessage = "It's just a faint residue now.";

    door.rewardMessage = "The emergency exit needs " + std::to_string(level.totalKeys()) + " keys.";

    VAULT_LOG_DEBUG("Built world: {} objects, {} interaction records, {} keys", level.objects.size(),
                    level.records.size(), level.totalKeys());
    return level;
}

void resetWorld(Level& level) {
    for (auto& obj : level.objects) {
        obj.visible = true;
        obj.feedback = VisualFeedback::Normal;
    }
    for (auto& [id, rec] : level.records) {
        rec.examined = false;
    }
}

Result<void> validateWorld(const Level& level) {
    std::unordered_set<std::string> seen;
    for (const auto& obj : level.objects) {
        if (!seen.insert(obj.id).second) {
            return Result<void>::error(ErrorCode::AlreadyExists, "Duplicate world object id '" + obj.id + "'");
        }
        if (obj.kind == ObjectKind::Interactable && level.records.count(obj.id) == 0) {
            return Result<void>::error(ErrorCode::NotFound, "Interactable '" + obj.id + "' has no interaction record");
        }
    }

    int exits = 0;
    for (const auto& [id, rec] : level.records) {
        const auto* obj = level.find(id);
        if (obj == nullptr) {
            return Result<void>::error(ErrorCode::NotFound, "Interaction record names unknown object '" + id + "'");
        }
        if (obj->kind != ObjectKind::Interactable) {
            return Result<void>::error(ErrorCode::InvalidArgument,
                                       "Interaction record names non-interactable object '" + id + "'");
        }
        if (rec.isExit)
            ++exits;
    }

    if (exits != 1) {
        return Result<void>::error(ErrorCode::InvalidArgument,
                                   "Level must have exactly one exit, found " + std::to_string(exits));
    }
    return Result<void>::ok();
}

} // namespace vault
