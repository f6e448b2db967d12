#ifndef BRANCHMESH_MATH_VEC4_HPP
#define BRANCHMESH_MATH_VEC4_HPP

namespace branchmesh {

// Texture coordinate pair
struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}

    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }
};

// RGBA color, stored linearly as given by the skeleton
struct Vec4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;

    constexpr Vec4() = default;
    constexpr Vec4(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}

    constexpr bool operator==(const Vec4& other) const {
        return x == other.x && y == other.y && z == other.z && w == other.w;
    }

    static constexpr Vec4 one() { return {1.0f, 1.0f, 1.0f, 1.0f}; }
};

}  // namespace branchmesh

#endif // BRANCHMESH_MATH_VEC4_HPP
