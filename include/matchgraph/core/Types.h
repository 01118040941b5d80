#pragma once

#include <cmath>
#include <string>

namespace matchgraph {

/// Opaque entity id (team, program, ...). Ordering is plain lexicographic.
using NodeId = std::string;

/// Canonical key of an unordered node pair, see EdgeKey.h
using EdgeKeyString = std::string;

/// Sentinel for "no degree assigned"
constexpr double NO_DEGREE = -1.0;

struct Point {
    double x = 0.0;
    double y = 0.0;

    constexpr Point() = default;
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    constexpr Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }

    double distanceTo(const Point& o) const {
        double dx = x - o.x;
        double dy = y - o.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    constexpr bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(const Point& o) const { return !(*this == o); }
};

/// Half-integer degrees are the only fractional values the layering produces
inline bool isBridgeDegree(double degree) {
    return degree != std::floor(degree);
}

}  // namespace matchgraph
