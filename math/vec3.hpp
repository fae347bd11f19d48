#ifndef TRAITGALAXY_MATH_VEC3_HPP
#define TRAITGALAXY_MATH_VEC3_HPP

#include <cmath>

namespace traitgalaxy {

// Position / velocity / force in galaxy space. y is the vertical axis.
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    static constexpr Vec3 zero() { return {0.0f, 0.0f, 0.0f}; }

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

    // Magnitude squared (no sqrt)
    constexpr float length_squared() const {
        return dot(*this);
    }

    float length() const {
        return std::sqrt(length_squared());
    }

    // Unit vector in the same direction, or zero for a zero vector
    Vec3 normalized() const {
        float len = length();
        if (len > 0.0f) {
            return *this / len;
        }
        return zero();
    }

    float distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    // Same direction, rescaled to the given length. Zero stays zero.
    Vec3 with_length(float new_length) const {
        return normalized() * new_length;
    }

    bool is_zero() const {
        return x == 0.0f && y == 0.0f && z == 0.0f;
    }

    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }
};

constexpr Vec3 operator*(float scalar, const Vec3& v) {
    return v * scalar;
}

namespace vec3 {
    constexpr Vec3 unit_x() { return {1.0f, 0.0f, 0.0f}; }
}

}  // namespace traitgalaxy

#endif // TRAITGALAXY_MATH_VEC3_HPP
