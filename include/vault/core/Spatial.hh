#pragma once

#include <cmath>

namespace vault {

template <typename T, typename SpaceTag> class Vector3;
template <typename T> class Quaternion;

/**
 * @brief Type tags for different coordinate spaces
 *
 * Player-relative input directions live in Local space; everything the
 * solver, targeting and world model exchange lives in World space.
 */
namespace Space {
struct Local {}; // Player's yaw-relative frame
struct World {}; // Level coordinates
} // namespace Space

/**
 * @brief 3D vector class with coordinate space type safety
 *
 * @tparam T Numeric type (float, double, etc.)
 * @tparam Space Coordinate space tag
 */
template <typename T, typename SpaceTag = Space::World> class Vector3 {
  public:
    T x, y, z;

    Vector3() : x(0), y(0), z(0) {}
    Vector3(T x, T y, T z) : x(x), y(y), z(z) {}

    Vector3<T, SpaceTag> operator+(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x + other.x, y + other.y, z + other.z);
    }

    Vector3<T, SpaceTag> operator-(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(x - other.x, y - other.y, z - other.z);
    }

    Vector3<T, SpaceTag> operator*(T scalar) const { return Vector3<T, SpaceTag>(x * scalar, y * scalar, z * scalar); }

    Vector3<T, SpaceTag> operator/(T scalar) const { return Vector3<T, SpaceTag>(x / scalar, y / scalar, z / scalar); }

    // Cannot mix different spaces - these operations are deleted
    template <typename OtherSpace> Vector3<T, SpaceTag> operator+(const Vector3<T, OtherSpace>&) const = delete;

    template <typename OtherSpace> Vector3<T, SpaceTag> operator-(const Vector3<T, OtherSpace>&) const = delete;

    T dot(const Vector3<T, SpaceTag>& other) const { return x * other.x + y * other.y + z * other.z; }

    Vector3<T, SpaceTag> cross(const Vector3<T, SpaceTag>& other) const {
        return Vector3<T, SpaceTag>(y * other.z - z * other.y, z * other.x - x * other.z, x * other.y - y * other.x);
    }

    T lengthSquared() const { return x * x + y * y + z * z; }

    T length() const { return std::sqrt(lengthSquared()); }

    Vector3<T, SpaceTag> normalized() const {
        T len = length();
        if (len == 0)
            return *this;
        return *this / len;
    }

    // Reinterpret in another space (e.g. after an explicit rotation)
    template <typename TargetSpace> Vector3<T, TargetSpace> as() const { return Vector3<T, TargetSpace>(x, y, z); }
};

/**
 * @brief Quaternion class for representing rotations
 *
 * @tparam T Numeric type (float, double, etc.)
 */
template <typename T> class Quaternion {
  public:
    T x, y, z, w;

    Quaternion() : x(0), y(0), z(0), w(1) {}
    Quaternion(T x, T y, T z, T w) : x(x), y(y), z(z), w(w) {}

    // Axis must be unit length; angle in radians
    static Quaternion<T> fromAxisAngle(const Vector3<T, Space::World>& axis, T angle) {
        T halfAngle = angle * T(0.5);
        T s = std::sin(halfAngle);

        return Quaternion<T>(axis.x * s, axis.y * s, axis.z * s, std::cos(halfAngle));
    }

    Quaternion<T> operator*(const Quaternion<T>& other) const {
        return Quaternion<T>(w * other.x + x * other.w + y * other.z - z * other.y,
                             w * other.y - x * other.z + y * other.w + z * other.x,
                             w * other.z + x * other.y - y * other.x + z * other.w,
                             w * other.w - x * other.x - y * other.y - z * other.z);
    }

    T lengthSquared() const { return x * x + y * y + z * z + w * w; }

    Quaternion<T> conjugate() const { return Quaternion<T>(-x, -y, -z, w); }

    template <typename SpaceTag> Vector3<T, SpaceTag> rotateVector(const Vector3<T, SpaceTag>& v) const {
        Quaternion<T> vQuat(v.x, v.y, v.z, 0);
        Quaternion<T> result = *this * vQuat * conjugate();
        return Vector3<T, SpaceTag>(result.x, result.y, result.z);
    }
};

/**
 * @brief Rigid placement of a world object: position plus orientation.
 *
 * Level geometry never scales, so unlike a full scene transform there is
 * no scale component and no cached matrix.
 */
template <typename T> class Transform {
  public:
    using Vec3 = Vector3<T, Space::World>;
    using Quat = Quaternion<T>;

    Transform() = default;
    Transform(const Vec3& position, const Quat& rotation) : position_(position), rotation_(rotation) {}

    const Vec3& getPosition() const { return position_; }
    const Quat& getRotation() const { return rotation_; }

    void setPosition(const Vec3& position) { position_ = position; }
    void setRotation(const Quat& rotation) { rotation_ = rotation; }

    void setRotationAxisAngle(const Vec3& axis, T angle) { rotation_ = Quat::fromAxisAngle(axis, angle); }

    template <typename SpaceTag> Vec3 transformPoint(const Vector3<T, SpaceTag>& point) const {
        return position_ + rotation_.rotateVector(point).template as<Space::World>();
    }

  private:
    Vec3 position_;
    Quat rotation_;
};

using Vec3f = Vector3<float, Space::World>;
using LocalVec3f = Vector3<float, Space::Local>;

} // namespace vault
