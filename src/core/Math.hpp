#pragma once

#include <cmath>

// World-space vector. Simulation state stays in double; the renderer converts at draw time.
struct DVec2 {
    double x{0.0};
    double y{0.0};
};

inline DVec2 operator+(const DVec2& a, const DVec2& b) { return {a.x + b.x, a.y + b.y}; }
inline DVec2 operator-(const DVec2& a, const DVec2& b) { return {a.x - b.x, a.y - b.y}; }
inline DVec2 operator*(const DVec2& a, double s) { return {a.x * s, a.y * s}; }
inline DVec2& operator+=(DVec2& a, const DVec2& b) {
    a.x += b.x;
    a.y += b.y;
    return a;
}
inline bool operator==(const DVec2& a, const DVec2& b) { return a.x == b.x && a.y == b.y; }

inline double dot(const DVec2& a, const DVec2& b) { return a.x * b.x + a.y * b.y; }
inline double length2(const DVec2& a) { return dot(a, a); }
inline double length(const DVec2& a) { return std::sqrt(length2(a)); }
inline double distance(const DVec2& a, const DVec2& b) { return length(b - a); }

// Unit vector a body with the given heading (radians) points along.
// World is y-up; heading 0 faces +y and positive headings turn counter-clockwise.
inline DVec2 forward_from_heading(double heading) { return DVec2{-std::sin(heading), std::cos(heading)}; }
