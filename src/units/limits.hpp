#pragma once
#include <cmath>
#include <optional>

/**
 * @brief Engineering-unit clamp bounds of a conversion
 *
 * Either bound may be absent; a field with no setpoint side usually has
 * neither. Clamping saturates silently and is idempotent.
 */
struct Limits {
  std::optional<double> lower;  ///< Minimum engineering value
  std::optional<double> upper;  ///< Maximum engineering value

  /**
   * @brief Clamp value into [lower, upper]
   * @param v Input value to clamp
   * @return v saturated at whichever bounds are present
   */
  double clamp(double v) const {
    if (lower && v < *lower) return *lower;
    if (upper && v > *upper) return *upper;
    return v;
  }

  bool empty() const { return !lower && !upper; }

  /**
   * @brief Present bounds are finite and ordered (lower <= upper)
   */
  bool valid() const {
    return finite() && !(lower && upper && *lower > *upper);
  }

  bool finite() const {
    return (!lower || std::isfinite(*lower)) && (!upper || std::isfinite(*upper));
  }

  bool operator==(const Limits& other) const {
    return lower == other.lower && upper == other.upper;
  }
};
