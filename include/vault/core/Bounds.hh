#pragma once

#include "vault/core/Spatial.hh"

#include <optional>

namespace vault {

// Axis-aligned bounding box
struct AABB {
    Vec3f min;
    Vec3f max;

    AABB();
    AABB(const Vec3f& min, const Vec3f& max);

    static AABB fromCenterHalfExtents(const Vec3f& center, const Vec3f& halfExtents);

    Vec3f center() const;
    Vec3f extents() const;

    void expand(const Vec3f& point);
    bool contains(const Vec3f& point) const;

    // Strict overlap: boxes that only share a face do not intersect, so a
    // player standing on the floor plane is not colliding with it.
    bool intersects(const AABB& other) const;
};

struct Ray {
    Vec3f origin;
    Vec3f direction; // unit length
};

// Distance along the ray to the first point inside `box`, if within
// [0, maxDistance]. A ray starting inside the box reports its exit distance.
std::optional<float> intersectRay(const Ray& ray, const AABB& box, float maxDistance);

// World AABB enclosing a box of `halfExtents` placed by `transform`.
AABB boundsOfBox(const Transform<float>& transform, const Vec3f& halfExtents);

} // namespace vault
