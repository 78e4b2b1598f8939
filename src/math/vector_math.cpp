#include "fountain/math/vector_math.hpp"

#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

Vector3::Vector3() : x(0), y(0), z(0) {}
Vector3::Vector3(double x, double y, double z) : x(x), y(y), z(z) {}

Vector3 Vector3::operator-() const {
  return {-this->x, -this->y, -this->z};
}

Vector3 Vector3::operator+(const Vector3& b) const {
  return {this->x + b.x, this->y + b.y, this->z + b.z};
}

Vector3 Vector3::operator-(const Vector3& b) const {
  return {this->x - b.x, this->y - b.y, this->z - b.z};
}

Vector3 Vector3::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar, this->z * scalar};
}

Vector3 Vector3::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar, this->z / scalar};
}

Vector3& Vector3::operator+=(const Vector3& v) {
  this->x += v.x;
  this->y += v.y;
  this->z += v.z;
  return *this;
}

Vector3& Vector3::operator-=(const Vector3& v) {
  this->x -= v.x;
  this->y -= v.y;
  this->z -= v.z;
  return *this;
}

Vector3& Vector3::operator*=(double scalar) {
  this->x *= scalar;
  this->y *= scalar;
  this->z *= scalar;
  return *this;
}

double Vector3::length() const {
  return std::sqrt(lengthSquared());
}

double Vector3::lengthSquared() const {
  return this->x * this->x + this->y * this->y + this->z * this->z;
}

double Vector3::dotProduct(const Vector3& v) const {
  return this->x * v.x + this->y * v.y + this->z * v.z;
}

Vector3 Vector3::cross(const Vector3& v) const {
  return {this->y * v.z - this->z * v.y,
          this->z * v.x - this->x * v.z,
          this->x * v.y - this->y * v.x};
}

Vector3 Vector3::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len, this->z / len};
  }
  // default direction if zero-length vector
  return {0.0, 1.0, 0.0};
}

Vector3 Vector3::scale(double length) const {
  return normalized() * length;
}

double Vector3::dist(const Vector3& p) const {
  return (*this - p).length();
}
