#pragma once
#include <cstdint>

// Integer grid coordinate. Doubles as a displacement vector; all arithmetic
// is exact (no rounding anywhere).
struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Vec2i& a, const Vec2i& b) { return !(a == b); }

// Row-major ordering so Vec2i can key ordered containers.
inline bool operator<(const Vec2i& a, const Vec2i& b) {
    return (a.y != b.y) ? (a.y < b.y) : (a.x < b.x);
}

inline Vec2i operator+(const Vec2i& a, const Vec2i& b) { return {a.x + b.x, a.y + b.y}; }
inline Vec2i operator-(const Vec2i& a, const Vec2i& b) { return {a.x - b.x, a.y - b.y}; }
inline Vec2i operator-(const Vec2i& a) { return {-a.x, -a.y}; }
inline Vec2i operator*(const Vec2i& a, int s) { return {a.x * s, a.y * s}; }

inline Vec2i& operator+=(Vec2i& a, const Vec2i& b) { a.x += b.x; a.y += b.y; return a; }
inline Vec2i& operator-=(Vec2i& a, const Vec2i& b) { a.x -= b.x; a.y -= b.y; return a; }
inline Vec2i& operator*=(Vec2i& a, int s) { a.x *= s; a.y *= s; return a; }

inline int dot(const Vec2i& a, const Vec2i& b) {
    return a.x * b.x + a.y * b.y;
}

inline int lengthSquared(const Vec2i& v) {
    return v.x * v.x + v.y * v.y;
}

inline Vec2i mulComponents(const Vec2i& a, const Vec2i& b) {
    return {a.x * b.x, a.y * b.y};
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}
