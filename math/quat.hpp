#ifndef BRANCHMESH_MATH_QUAT_HPP
#define BRANCHMESH_MATH_QUAT_HPP

#include "vec3.hpp"
#include <cmath>
#include <numbers>

namespace branchmesh {

// Unit quaternion rotation (w + xi + yj + zk)
struct Quat {
    float w = 1.0f;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Quat() = default;
    constexpr Quat(float w_, float x_, float y_, float z_) : w(w_), x(x_), y(y_), z(z_) {}

    static constexpr Quat identity() { return {}; }

    // Rotation of `angle` radians about a unit axis
    static Quat from_axis_angle(const Vec3& axis, float angle) {
        float half = angle * 0.5f;
        float s = std::sin(half);
        return {std::cos(half), axis.x * s, axis.y * s, axis.z * s};
    }

    // Shortest-arc rotation taking unit vector `from` onto unit vector `to`.
    // Exactly opposite inputs rotate half a turn about an arbitrary perpendicular.
    static Quat from_rotation_arc(const Vec3& from, const Vec3& to) {
        float d = from.dot(to);
        if (d < -1.0f + 1e-6f) {
            Vec3 axis = vec3::unit_x().cross(from);
            if (axis.length_squared() < 1e-6f) {
                axis = vec3::unit_y().cross(from);
            }
            return from_axis_angle(axis.normalized(), std::numbers::pi_v<float>);
        }
        Vec3 c = from.cross(to);
        return Quat{1.0f + d, c.x, c.y, c.z}.normalized();
    }

    constexpr Vec3 vector_part() const { return {x, y, z}; }

    // Hamilton product: (a * b) applies b first, then a
    constexpr Quat operator*(const Quat& o) const {
        return {
            w * o.w - x * o.x - y * o.y - z * o.z,
            w * o.x + x * o.w + y * o.z - z * o.y,
            w * o.y - x * o.z + y * o.w + z * o.x,
            w * o.z + x * o.y - y * o.x + z * o.w
        };
    }

    // Rotate a vector
    constexpr Vec3 operator*(const Vec3& v) const {
        Vec3 q = vector_part();
        Vec3 t = q.cross(v) * 2.0f;
        return v + t * w + q.cross(t);
    }

    constexpr float length_squared() const {
        return w * w + x * x + y * y + z * z;
    }

    Quat normalized() const {
        float len = std::sqrt(length_squared());
        if (len > 0.0f) {
            return {w / len, x / len, y / len, z / len};
        }
        return identity();
    }

    bool is_finite() const {
        return std::isfinite(w) && std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    constexpr bool operator==(const Quat& other) const {
        return w == other.w && x == other.x && y == other.y && z == other.z;
    }
};

}  // namespace branchmesh

#endif // BRANCHMESH_MATH_QUAT_HPP
