#pragma once

#include <cmath>

namespace terravox::math {

constexpr float kPi = 3.14159265358979323846f;

inline float radians(float degreesValue) {
    return degreesValue * (kPi / 180.0f);
}

struct Vector3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vector3() = default;
    constexpr Vector3(float xIn, float yIn, float zIn) : x(xIn), y(yIn), z(zIn) {}

    constexpr bool operator==(const Vector3&) const = default;

    constexpr Vector3 operator+(const Vector3& rhs) const { return Vector3{x + rhs.x, y + rhs.y, z + rhs.z}; }
    constexpr Vector3 operator-(const Vector3& rhs) const { return Vector3{x - rhs.x, y - rhs.y, z - rhs.z}; }
    constexpr Vector3 operator-() const { return Vector3{-x, -y, -z}; }
    constexpr Vector3 operator*(float scalar) const { return Vector3{x * scalar, y * scalar, z * scalar}; }
    constexpr Vector3 operator/(float scalar) const { return Vector3{x / scalar, y / scalar, z / scalar}; }

    Vector3& operator+=(const Vector3& rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }
};

inline constexpr Vector3 operator*(float scalar, const Vector3& v) {
    return v * scalar;
}

inline float dot(const Vector3& a, const Vector3& b) {
    return (a.x * b.x) + (a.y * b.y) + (a.z * b.z);
}

inline Vector3 cross(const Vector3& a, const Vector3& b) {
    return Vector3{
        (a.y * b.z) - (a.z * b.y),
        (a.z * b.x) - (a.x * b.z),
        (a.x * b.y) - (a.y * b.x)
    };
}

inline float lengthSquared(const Vector3& v) {
    return dot(v, v);
}

inline float length(const Vector3& v) {
    return std::sqrt(lengthSquared(v));
}

inline Vector3 normalize(const Vector3& v) {
    const float len = length(v);
    if (len <= 0.0f) {
        return Vector3{};
    }
    return v / len;
}

// Direction a yaw/pitch pair looks along. Yaw 0 faces +X, yaw 90 faces +Z.
inline Vector3 directionFromYawPitch(float yawDegrees, float pitchDegrees) {
    const float yawRadians = radians(yawDegrees);
    const float pitchRadians = radians(pitchDegrees);
    const float cosPitch = std::cos(pitchRadians);
    return normalize(Vector3{
        std::cos(yawRadians) * cosPitch,
        std::sin(pitchRadians),
        std::sin(yawRadians) * cosPitch
    });
}

} // namespace terravox::math
