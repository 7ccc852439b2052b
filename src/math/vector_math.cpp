#include "contraption/math/vector_math.hpp"

#include <algorithm>
#include <cmath>

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

double clampValue(double value, double lo, double hi) {
  return std::max(lo, std::min(hi, value));
}

// Position

Position::Position() : x(0), y(0) {}
Position::Position(double x, double y) : x(x), y(y) {}

Position::operator Vector() const {
  return {this->x, this->y};
}

Position Position::operator+(const Position& b) const {
  return {this->x + b.x, this->y + b.y};
}

Position Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y};
}

double Position::dist(const Position& p) const {
  double const dx = this->x - p.x;
  double const dy = this->y - p.y;
  return std::sqrt(dx * dx + dy * dy);
}

Position& Position::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Position& Position::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}

// Vector

Vector::Vector() : x(0), y(0) {}
Vector::Vector(double x, double y) : x(x), y(y) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y) {}

Vector::operator Position() const {
  return {this->x, this->y};
}

Vector Vector::operator-() const {
    return {-this->x, -this->y};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar};
}

double Vector::length() const {
  return std::sqrt(this->x * this->x + this->y * this->y);
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y;
}

Vector Vector::perp() const {
  return {-this->y, this->x};
}

Vector Vector::normalizedOr(const Vector& fallback) const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len};
  }
  return fallback;
}

Vector Vector::reflect(const Vector& normal, double factor) const {
  double const d = this->dotProduct(normal);
  return {this->x - factor * d * normal.x, this->y - factor * d * normal.y};
}

Vector& Vector::operator+=(const Vector& v) {
    this->x += v.x;
    this->y += v.y;
    return *this;
}

Vector& Vector::operator-=(const Vector& v) {
    this->x -= v.x;
    this->y -= v.y;
    return *this;
}

SegmentProjection closestPointOnSegment(const Vector &a, const Vector &b, const Vector &p) {
  Vector const ab = b - a;
  double const denom = ab.dotProduct(ab);
  if (denom < EPSILON) {
    return {a, 0.0};
  }
  double t = ((p.x - a.x)*ab.x + (p.y - a.y)*ab.y) / denom;
  t = clampValue(t, 0.0, 1.0);
  return {Vector(a.x + ab.x*t, a.y + ab.y*t), t};
}
