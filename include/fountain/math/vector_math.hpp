/**
 * @file vector_math.hpp
 * @brief 3D vector mathematics used by the particle fountain
 *
 * This file provides the geometric primitives shared by every component:
 * - Vector3 class for positions, velocities and directions
 * - Component-wise arithmetic and the usual products
 * - Utility functions for floating-point comparisons
 */

#ifndef FOUNTAIN_VECTOR_MATH_HPP
#define FOUNTAIN_VECTOR_MATH_HPP

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
 * @brief Represents a 3D vector (Y is up)
 *
 * Vector3 is used both for absolute locations and for velocities.
 */
class Vector3 {
public:
    double x;  ///< X component
    double y;  ///< Y component (vertical)
    double z;  ///< Z component

    /** @brief Constructs a zero vector (0,0,0) */
    Vector3();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     * @param z Z component
     */
    Vector3(double x, double y, double z);

    /** @brief Returns negation of this vector */
    Vector3 operator-() const;

    /**
     * @brief Adds two vectors
     * @param b Vector to add
     * @return Sum vector
     */
    Vector3 operator+(const Vector3& b) const;

    /**
     * @brief Subtracts two vectors
     * @param b Vector to subtract
     * @return Difference vector
     */
    Vector3 operator-(const Vector3& b) const;

    /**
     * @brief Scales vector by scalar value
     * @param scalar Scale factor
     * @return Scaled vector
     */
    Vector3 operator*(double scalar) const;

    /**
     * @brief Divides vector by scalar value
     * @param scalar Divisor
     * @return Divided vector
     */
    Vector3 operator/(double scalar) const;

    Vector3& operator+=(const Vector3& v);
    Vector3& operator-=(const Vector3& v);
    Vector3& operator*=(double scalar);

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude (no square root) */
    double lengthSquared() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector3& v) const;

    /**
     * @brief Calculates cross product with another vector
     * @param v Other vector
     * @return Vector perpendicular to both operands
     */
    Vector3 cross(const Vector3& v) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A zero-length vector normalizes to +Y.
     */
    Vector3 normalized() const;

    /**
     * @brief Scales vector to specified length
     * @param length Target length
     * @return Vector with same direction but new length
     */
    Vector3 scale(double length) const;

    /**
     * @brief Calculates Euclidean distance to another point
     * @param p Target point
     * @return Distance between the two points
     */
    double dist(const Vector3& p) const;
};

#endif // FOUNTAIN_VECTOR_MATH_HPP
