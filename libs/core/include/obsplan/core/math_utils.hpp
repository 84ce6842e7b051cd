/**
 * @file math_utils.hpp
 * @brief Shared vector/matrix and spherical geometry helpers.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <array>
#include <cmath>

#include "obsplan/core/constants.hpp"
#include "obsplan/core/types.hpp"

namespace obsplan::core {

/**
 * @brief Dense 3x3 matrix in row-major storage.
 */
struct Mat3 {
  std::array<double, 9> v{};
  [[nodiscard]] double& operator()(const int r, const int c) { return v[static_cast<std::size_t>(r * 3 + c)]; }
  [[nodiscard]] double operator()(const int r, const int c) const { return v[static_cast<std::size_t>(r * 3 + c)]; }
};

/**
 * @brief Create identity 3x3 matrix.
 */
inline Mat3 mat_identity() {
  Mat3 m{};
  m(0, 0) = 1.0;
  m(1, 1) = 1.0;
  m(2, 2) = 1.0;
  return m;
}

/**
 * @brief Matrix-matrix multiplication.
 */
inline Mat3 mat_mul(const Mat3& a, const Mat3& b) {
  Mat3 c{};
  for (int r = 0; r < 3; ++r) {
    for (int col = 0; col < 3; ++col) {
      c(r, col) = a(r, 0) * b(0, col) + a(r, 1) * b(1, col) + a(r, 2) * b(2, col);
    }
  }
  return c;
}

/**
 * @brief Matrix transpose.
 */
inline Mat3 mat_transpose(const Mat3& m) {
  Mat3 t{};
  for (int r = 0; r < 3; ++r) {
    for (int c = 0; c < 3; ++c) {
      t(r, c) = m(c, r);
    }
  }
  return t;
}

/**
 * @brief Matrix-vector multiplication.
 */
inline Vec3 mat_vec(const Mat3& m, const Vec3& x) {
  return Vec3{
      m(0, 0) * x.x + m(0, 1) * x.y + m(0, 2) * x.z,
      m(1, 0) * x.x + m(1, 1) * x.y + m(1, 2) * x.z,
      m(2, 0) * x.x + m(2, 1) * x.y + m(2, 2) * x.z,
  };
}

/**
 * @brief Vector cross product.
 */
inline Vec3 vec_cross(const Vec3& a, const Vec3& b) {
  return Vec3{
      a.y * b.z - a.z * b.y,
      a.z * b.x - a.x * b.z,
      a.x * b.y - a.y * b.x,
  };
}

/**
 * @brief Wrap an angle into [0, 2*pi).
 */
inline double wrap_two_pi(double a) {
  a = std::fmod(a, constants::kTwoPi);
  if (a < 0.0) {
    a += constants::kTwoPi;
  }
  return a;
}

/**
 * @brief Wrap an angle into [0, 360) degrees.
 */
inline double wrap_360(double deg) {
  deg = std::fmod(deg, 360.0);
  if (deg < 0.0) {
    deg += 360.0;
  }
  return deg;
}

/**
 * @brief Wrap an angle into (-180, 180] degrees.
 */
inline double wrap_180(double deg) {
  deg = wrap_360(deg);
  return (deg > 180.0) ? deg - 360.0 : deg;
}

/**
 * @brief Unit vector for a spherical direction (longitude-like, latitude-like) in radians.
 */
inline Vec3 unit_vector(double lon_rad, double lat_rad) {
  const double cl = std::cos(lat_rad);
  return Vec3{cl * std::cos(lon_rad), cl * std::sin(lon_rad), std::sin(lat_rad)};
}

/**
 * @brief Spherical angles (radians) of a vector; longitude in [0, 2*pi).
 */
inline std::array<double, 2> spherical_angles(const Vec3& v) {
  const double rxy = std::hypot(v.x, v.y);
  const double lon = (rxy > 0.0) ? wrap_two_pi(std::atan2(v.y, v.x)) : 0.0;
  const double lat = std::atan2(v.z, rxy);
  return {lon, lat};
}

/**
 * @brief Angle between two vectors in radians.
 */
inline double angle_between(const Vec3& a, const Vec3& b) {
  return std::atan2(norm(vec_cross(a, b)), dot(a, b));
}

}  // namespace obsplan::core
