/**
 * @file scaling_bounds.hpp
 * @brief Min/max size annotations of a MachineSet or MachineDeployment.
 *
 * Outcomes of ParseScalingBounds():
 *   - either annotation missing      -> success, empty optional
 *   - unparseable, negative, max<min -> BoundsError
 *   - min == max                     -> success, bounds with CanScale()==false
 *   - otherwise                      -> success, usable bounds
 *
 * Header-only, C++17, compatible with -fno-exceptions -fno-rtti.
 */

#ifndef MSCALE_SCALING_BOUNDS_HPP_
#define MSCALE_SCALING_BOUNDS_HPP_

#include "mscale/options.hpp"
#include "mscale/resource.hpp"
#include "mscale/vocabulary.hpp"

#include <cstdint>

namespace mscale {

struct ScalingBounds {
  int32_t min_size = 0;
  int32_t max_size = 0;

  /** A group whose min equals its max has no room to scale. */
  bool CanScale() const noexcept { return max_size > min_size; }
};

namespace detail {

/** Base-10 int32: optional sign followed by digits only. */
inline bool ParseDecimal(const char* str, int32_t& out) noexcept {
  if (str == nullptr || *str == '\0') return false;
  bool negative = false;
  if (*str == '+' || *str == '-') {
    negative = (*str == '-');
    ++str;
  }
  if (*str == '\0') return false;
  int64_t acc = 0;
  for (; *str != '\0'; ++str) {
    if (*str < '0' || *str > '9') return false;
    acc = acc * 10 + (*str - '0');
    if (acc > static_cast<int64_t>(INT32_MAX) + 1) return false;
  }
  if (negative) acc = -acc;
  if (acc < INT32_MIN || acc > INT32_MAX) return false;
  out = static_cast<int32_t>(acc);
  return true;
}

}  // namespace detail

using BoundsResult = expected<optional<ScalingBounds>, BoundsError>;

inline BoundsResult ParseScalingBounds(const Annotations& annotations,
                                       const AnnotationKeys& keys) noexcept {
  const AnnotationValue* min_str = annotations.Find(keys.min_size.c_str());
  const AnnotationValue* max_str = annotations.Find(keys.max_size.c_str());
  if (min_str == nullptr || max_str == nullptr) {
    return BoundsResult::success(optional<ScalingBounds>());
  }

  ScalingBounds b;
  if (!detail::ParseDecimal(min_str->c_str(), b.min_size)) {
    return BoundsResult::error(BoundsError::kInvalidMinValue);
  }
  if (b.min_size < 0) {
    return BoundsResult::error(BoundsError::kNegativeMin);
  }
  if (!detail::ParseDecimal(max_str->c_str(), b.max_size)) {
    return BoundsResult::error(BoundsError::kInvalidMaxValue);
  }
  if (b.max_size < 0) {
    return BoundsResult::error(BoundsError::kNegativeMax);
  }
  if (b.max_size < b.min_size) {
    return BoundsResult::error(BoundsError::kMaxBelowMin);
  }
  return BoundsResult::success(optional<ScalingBounds>(b));
}

}  // namespace mscale

#endif  // MSCALE_SCALING_BOUNDS_HPP_
