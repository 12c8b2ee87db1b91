#include "vault/core/Bounds.hh"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace vault {

AABB::AABB() : min(Vec3f(0.0f, 0.0f, 0.0f)), max(Vec3f(0.0f, 0.0f, 0.0f)) {}

AABB::AABB(const Vec3f& min, const Vec3f& max) : min(min), max(max) {}

AABB AABB::fromCenterHalfExtents(const Vec3f& center, const Vec3f& halfExtents) {
    return AABB(center - halfExtents, center + halfExtents);
}

Vec3f AABB::center() const {
    return Vec3f((min.x + max.x) * 0.5f, (min.y + max.y) * 0.5f, (min.z + max.z) * 0.5f);
}

Vec3f AABB::extents() const {
    return Vec3f((max.x - min.x) * 0.5f, (max.y - min.y) * 0.5f, (max.z - min.z) * 0.5f);
}

void AABB::expand(const Vec3f& point) {
    min = Vec3f(std::min(min.x, point.x), std::min(min.y, point.y), std::min(min.z, point.z));
    max = Vec3f(std::max(max.x, point.x), std::max(max.y, point.y), std::max(max.z, point.z));
}

bool AABB::contains(const Vec3f& point) const {
    return point.x >= min.x && point.x <= max.x && point.y >= min.y && point.y <= max.y && point.z >= min.z &&
           point.z <= max.z;
}

bool AABB::intersects(const AABB& other) const {
    return min.x < other.max.x && max.x > other.min.x && min.y < other.max.y && max.y > other.min.y &&
           min.z < other.max.z && max.z > other.min.z;
}

std::optional<float> intersectRay(const Ray& ray, const AABB& box, float maxDistance) {
    constexpr float kInf = std::numeric_limits<float>::infinity();

    const std::array<float, 3> origin{ray.origin.x, ray.origin.y, ray.origin.z};
    const std::array<float, 3> dir{ray.direction.x, ray.direction.y, ray.direction.z};
    const std::array<float, 3> lo{box.min.x, box.min.y, box.min.z};
    const std::array<float, 3> hi{box.max.x, box.max.y, box.max.z};

    float tNear = -kInf;
    float tFar = kInf;

    for (int axis = 0; axis < 3; ++axis) {
        if (dir[axis] == 0.0f) {
            // Parallel to this slab: miss unless the origin lies between the planes
            if (origin[axis] < lo[axis] || origin[axis] > hi[axis])
                return std::nullopt;
            continue;
        }
        float inv = 1.0f / dir[axis];
        float t0 = (lo[axis] - origin[axis]) * inv;
        float t1 = (hi[axis] - origin[axis]) * inv;
        if (t0 > t1)
            std::swap(t0, t1);
        tNear = std::max(tNear, t0);
        tFar = std::min(tFar, t1);
        if (tNear > tFar)
            return std::nullopt;
    }

    if (tFar < 0.0f)
        return std::nullopt;

    float t = tNear >= 0.0f ? tNear : tFar;
    if (t > maxDistance)
        return std::nullopt;
    return t;
}

AABB boundsOfBox(const Transform<float>& transform, const Vec3f& halfExtents) {
    const auto center = transform.getPosition();
    AABB box(center, center);
    for (int i = 0; i < 8; ++i) {
        LocalVec3f corner((i & 1) ? halfExtents.x : -halfExtents.x, (i & 2) ? halfExtents.y : -halfExtents.y,
                          (i & 4) ? halfExtents.z : -halfExtents.z);
        box.expand(transform.transformPoint(corner));
    }
    return box;
}

} // namespace vault
