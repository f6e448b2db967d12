#ifndef BRANCHMESH_MATH_VEC3_HPP
#define BRANCHMESH_MATH_VEC3_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace branchmesh {

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(float scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(float scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& other) {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }

    constexpr Vec3& operator*=(float scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    constexpr float dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    constexpr float length_squared() const {
        return x * x + y * y + z * z;
    }

    float length() const {
        return std::sqrt(length_squared());
    }

    // Unit vector, or zero when the length is zero
    Vec3 normalized() const {
        float len = length();
        if (len > 0.0f) {
            return *this / len;
        }
        return {0.0f, 0.0f, 0.0f};
    }

    float distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    constexpr float distance_squared_to(const Vec3& other) const {
        return (*this - other).length_squared();
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

constexpr Vec3 operator*(float scalar, const Vec3& v) {
    return v * scalar;
}

// Component-wise min/max, used for bounding boxes
inline Vec3 component_min(const Vec3& a, const Vec3& b) {
    return {std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z)};
}

inline Vec3 component_max(const Vec3& a, const Vec3& b) {
    return {std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)};
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0f, 0.0f, 0.0f}; }
    constexpr Vec3 unit_x() { return {1.0f, 0.0f, 0.0f}; }
    constexpr Vec3 unit_y() { return {0.0f, 1.0f, 0.0f}; }
    constexpr Vec3 unit_z() { return {0.0f, 0.0f, 1.0f}; }
}

}  // namespace branchmesh

#endif // BRANCHMESH_MATH_VEC3_HPP
