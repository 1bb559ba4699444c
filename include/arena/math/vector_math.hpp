/**
 * @file vector_math.hpp
 * @brief 2D vector and position primitives used by the collision core
 *
 * Provides:
 * - Vector class for offsets and contact normals
 * - Position class for point locations in world pixels
 * - Point-to-point helpers (distance, heading angle)
 */

#ifndef ARENA_VECTOR_MATH_HPP
#define ARENA_VECTOR_MATH_HPP

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Returns the unit vector in the same direction
     *
     * A vector without a usable length (zero or NaN) has no direction;
     * the zero vector is returned for it.
     */
    Vector normalized() const;
};

/**
 * @brief Represents a point location in world space (pixels)
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    /**
     * @brief Offset from another position to this one
     * @param from Origin of the offset
     * @return Vector pointing from @p from to this position
     */
    Vector operator-(const Position& from) const;
};

/**
 * @brief Euclidean distance between two points
 */
double pointDistance(double x1, double y1, double x2, double y2);

/**
 * @brief Heading from the first point towards the second
 *
 * @return Angle in radians measured from the positive X axis, in (-pi, pi]
 */
double pointAngle(double x1, double y1, double x2, double y2);

#endif // ARENA_VECTOR_MATH_HPP
