
#pragma once

#include <cmath>

namespace dmlgeom {

/**
 * A 2-dimensional euclidean floating-point vector.
 */
struct Vector2 {

    double x, y;

    inline Vector2(double val = 0) : x(val), y(val) { }

    inline Vector2(double x, double y) : x(x), y(y) { }

    /// Returns the vector's length.
    inline double length() const {
        return sqrt(x*x+y*y);
    }

    /// Returns the vector rotated by the angle whose cosine and sine are the components of direction.
    inline Vector2 rotate(const Vector2 &direction) const {
        return Vector2(direction.x*x-direction.y*y, direction.y*x+direction.x*y);
    }

    /// Returns true if both components are finite numbers.
    inline bool isFinite() const {
        return std::isfinite(x) && std::isfinite(y);
    }

    inline Vector2 &operator+=(const Vector2 other) {
        x += other.x, y += other.y;
        return *this;
    }

    inline Vector2 &operator*=(double value) {
        x *= value, y *= value;
        return *this;
    }

};

/// A vector may also represent a point, which shall be differentiated semantically using the alias Point2.
typedef Vector2 Point2;

/// Dot product of two vectors.
inline double dotProduct(const Vector2 a, const Vector2 b) {
    return a.x*b.x+a.y*b.y;
}

/// A special version of the cross product for 2D vectors (returns scalar value).
inline double crossProduct(const Vector2 a, const Vector2 b) {
    return a.x*b.y-a.y*b.x;
}

inline bool operator==(const Vector2 a, const Vector2 b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vector2 a, const Vector2 b) {
    return a.x != b.x || a.y != b.y;
}

inline Vector2 operator-(const Vector2 v) {
    return Vector2(-v.x, -v.y);
}

inline Vector2 operator+(const Vector2 a, const Vector2 b) {
    return Vector2(a.x+b.x, a.y+b.y);
}

inline Vector2 operator-(const Vector2 a, const Vector2 b) {
    return Vector2(a.x-b.x, a.y-b.y);
}

inline Vector2 operator*(const Vector2 a, const Vector2 b) {
    return Vector2(a.x*b.x, a.y*b.y);
}

inline Vector2 operator/(const Vector2 a, const Vector2 b) {
    return Vector2(a.x/b.x, a.y/b.y);
}

inline Vector2 operator*(double a, const Vector2 b) {
    return Vector2(a*b.x, a*b.y);
}

}
