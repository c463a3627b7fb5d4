#pragma once

/**
 * @file point.h
 * @brief Planar pixel coordinate value type
 *
 * Point is immutable by convention: every operation returns a new Point.
 * It is used for pixel-space and projected (meter) coordinates alike.
 */

#include <glm/glm.hpp>
#include <cmath>
#include <string>

namespace slippy_map {

/**
 * @brief Planar coordinate in pixel or projected space
 */
struct Point {
    double x;  ///< Horizontal component
    double y;  ///< Vertical component

    constexpr Point() : x(0.0), y(0.0) {}
    constexpr Point(double x_, double y_) : x(x_), y(y_) {}

    /**
     * @brief Build a point from a glm vector
     */
    static Point FromVec(const glm::dvec2& v) {
        return Point(v.x, v.y);
    }

    /**
     * @brief Convert to a glm vector for matrix math
     */
    glm::dvec2 ToVec() const {
        return glm::dvec2(x, y);
    }

    constexpr Point Add(const Point& other) const {
        return Point(x + other.x, y + other.y);
    }

    constexpr Point Subtract(const Point& other) const {
        return Point(x - other.x, y - other.y);
    }

    constexpr Point MultiplyBy(double k) const {
        return Point(x * k, y * k);
    }

    constexpr Point DivideBy(double k) const {
        return Point(x / k, y / k);
    }

    /**
     * @brief Round both components to the nearest integer
     *
     * Halves round towards positive infinity, so -0.5 becomes 0 and 0.5
     * becomes 1. Screen placement relies on this being symmetric under a
     * whole-pixel shift of the input.
     */
    Point Round() const {
        return Point(std::floor(x + 0.5), std::floor(y + 0.5));
    }

    /**
     * @brief Round both components down
     */
    Point Floor() const {
        return Point(std::floor(x), std::floor(y));
    }

    /**
     * @brief Round both components up
     */
    Point Ceil() const {
        return Point(std::ceil(x), std::ceil(y));
    }

    /**
     * @brief Euclidean distance in the same planar space
     */
    double DistanceTo(const Point& other) const {
        return glm::distance(ToVec(), other.ToVec());
    }

    /**
     * @brief Exact component-wise equality
     */
    constexpr bool Equals(const Point& other) const {
        return x == other.x && y == other.y;
    }

    std::string ToString() const;

    constexpr Point operator+(const Point& other) const { return Add(other); }
    constexpr Point operator-(const Point& other) const { return Subtract(other); }
    constexpr Point operator*(double k) const { return MultiplyBy(k); }
    constexpr Point operator/(double k) const { return DivideBy(k); }

    constexpr bool operator==(const Point& other) const { return Equals(other); }
    constexpr bool operator!=(const Point& other) const { return !Equals(other); }
};

} // namespace slippy_map
