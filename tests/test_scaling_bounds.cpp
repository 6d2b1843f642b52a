/**
 * @file test_scaling_bounds.cpp
 * @brief Tests for scaling_bounds.hpp
 */

#include "mscale/scaling_bounds.hpp"

#include <catch2/catch_test_macros.hpp>

namespace {

mscale::Annotations Bounds(const char* min, const char* max) {
  mscale::AnnotationKeys keys;
  mscale::Annotations a;
  if (min != nullptr) a.Set(keys.min_size.c_str(), min);
  if (max != nullptr) a.Set(keys.max_size.c_str(), max);
  return a;
}

}  // namespace

TEST_CASE("bounds - valid pair", "[bounds]") {
  auto r = mscale::ParseScalingBounds(Bounds("1", "10"), mscale::AnnotationKeys{});
  REQUIRE(r.has_value());
  REQUIRE(r.value().has_value());
  REQUIRE(r.value()->min_size == 1);
  REQUIRE(r.value()->max_size == 10);
  REQUIRE(r.value()->CanScale());
}

TEST_CASE("bounds - zero minimum allowed", "[bounds]") {
  auto r = mscale::ParseScalingBounds(Bounds("0", "3"), mscale::AnnotationKeys{});
  REQUIRE(r.has_value());
  REQUIRE(r.value()->min_size == 0);
  REQUIRE(r.value()->CanScale());
}

TEST_CASE("bounds - missing annotation means not scalable", "[bounds]") {
  mscale::AnnotationKeys keys;
  auto none = mscale::ParseScalingBounds(Bounds(nullptr, nullptr), keys);
  REQUIRE(none.has_value());
  REQUIRE_FALSE(none.value().has_value());

  auto only_min = mscale::ParseScalingBounds(Bounds("1", nullptr), keys);
  REQUIRE(only_min.has_value());
  REQUIRE_FALSE(only_min.value().has_value());

  auto only_max = mscale::ParseScalingBounds(Bounds(nullptr, "3"), keys);
  REQUIRE(only_max.has_value());
  REQUIRE_FALSE(only_max.value().has_value());
}

TEST_CASE("bounds - min equal to max cannot scale", "[bounds]") {
  auto r = mscale::ParseScalingBounds(Bounds("1", "1"), mscale::AnnotationKeys{});
  REQUIRE(r.has_value());
  REQUIRE(r.value().has_value());
  REQUIRE_FALSE(r.value()->CanScale());
}

TEST_CASE("bounds - misconfigured values", "[bounds]") {
  struct Case {
    const char* min;
    const char* max;
    mscale::BoundsError err;
  };
  const Case cases[] = {
      {"abc", "3", mscale::BoundsError::kInvalidMinValue},
      {"", "3", mscale::BoundsError::kInvalidMinValue},
      {"1.5", "3", mscale::BoundsError::kInvalidMinValue},
      {"-1", "1", mscale::BoundsError::kNegativeMin},
      {"1", "x", mscale::BoundsError::kInvalidMaxValue},
      {"1", "99999999999", mscale::BoundsError::kInvalidMaxValue},
      {"0", "-1", mscale::BoundsError::kNegativeMax},
      {"3", "2", mscale::BoundsError::kMaxBelowMin},
  };
  for (const auto& c : cases) {
    INFO("min=" << c.min << " max=" << c.max);
    auto r = mscale::ParseScalingBounds(Bounds(c.min, c.max),
                                        mscale::AnnotationKeys{});
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == c.err);
  }
}

TEST_CASE("bounds - min checked before max", "[bounds]") {
  auto r = mscale::ParseScalingBounds(Bounds("bad", "bad"),
                                      mscale::AnnotationKeys{});
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == mscale::BoundsError::kInvalidMinValue);
}

TEST_CASE("bounds - custom annotation keys", "[bounds]") {
  mscale::AnnotationKeys keys;
  keys.min_size.assign(mscale::TruncateToCapacity, "example.com/min");
  keys.max_size.assign(mscale::TruncateToCapacity, "example.com/max");

  mscale::Annotations a;
  a.Set("example.com/min", "2");
  a.Set("example.com/max", "5");
  auto r = mscale::ParseScalingBounds(a, keys);
  REQUIRE(r.has_value());
  REQUIRE(r.value()->max_size == 5);

  auto defaults = mscale::ParseScalingBounds(a, mscale::AnnotationKeys{});
  REQUIRE(defaults.has_value());
  REQUIRE_FALSE(defaults.value().has_value());
}

TEST_CASE("bounds - ParseDecimal", "[bounds]") {
  int32_t v = 0;
  REQUIRE(mscale::detail::ParseDecimal("+7", v));
  REQUIRE(v == 7);
  REQUIRE(mscale::detail::ParseDecimal("-2147483648", v));
  REQUIRE(v == INT32_MIN);
  REQUIRE_FALSE(mscale::detail::ParseDecimal("2147483648", v));
  REQUIRE_FALSE(mscale::detail::ParseDecimal(" 1", v));
  REQUIRE_FALSE(mscale::detail::ParseDecimal("-", v));
  REQUIRE_FALSE(mscale::detail::ParseDecimal(nullptr, v));
}
