/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics
 *
 * This file provides the geometric primitives shared by the chamber policies
 * and the global systems:
 * - Vector class for direction and magnitude calculations
 * - Position class for point locations in canvas or chamber space
 * - Segment helpers used by walls, blades and planks
 */

#ifndef CONTRAPTION_VECTOR_MATH_HPP
#define CONTRAPTION_VECTOR_MATH_HPP

class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Clamps a value into [lo, hi]
 */
double clampValue(double value, double lo, double hi);

/**
 * @brief Represents a 2D point in space
 *
 * Position class is used for absolute locations. Supports basic arithmetic
 * and conversion to/from Vector.
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

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);
};

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

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoids the square root */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /** @brief Returns perpendicular vector (rotated 90 degrees) */
    Vector perp() const;

    /**
     * @brief Returns the unit vector, or @p fallback when the length is ~0
     *
     * Collision normals go through here so that coincident centres never
     * produce a NaN direction.
     */
    Vector normalizedOr(const Vector& fallback) const;

    /**
     * @brief Reflects the vector about a unit normal
     *
     * Computes v - factor * dot(v, n) * n. A factor of 2 is a mirror bounce;
     * larger factors add energy.
     */
    Vector reflect(const Vector& normal, double factor) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
};

/** @brief Straight-up direction used when a contact normal is undefined */
const Vector FALLBACK_NORMAL(0.0, -1.0);

/**
 * @brief Result of projecting a point onto a line segment
 */
struct SegmentProjection {
    Vector closest;  ///< Closest point on the segment
    double t;        ///< Parameter along the segment in [0,1]
};

/**
 * @brief Finds closest point on line segment to a point
 *
 * @param a Start point of line segment
 * @param b End point of line segment
 * @param p Point to find closest position to
 * @return Closest point and its clamped parameter along ab
 */
SegmentProjection closestPointOnSegment(const Vector &a, const Vector &b, const Vector &p);

#endif
