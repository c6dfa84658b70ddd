#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include "EmpiricalDistance.h"
#include "VitalsException.h"

using namespace trialsynth;

TEST_CASE("EmpiricalDistance: Wasserstein of a shifted sample equals the shift", "[stats][wasserstein]") {
  const std::vector<double> a{120.0, 125.0, 130.0, 135.0, 140.0};
  const std::vector<double> b{125.0, 130.0, 135.0, 140.0, 145.0};

  REQUIRE(EmpiricalDistance::wasserstein(a, b) == Catch::Approx(5.0));
}

TEST_CASE("EmpiricalDistance: Wasserstein handles unequal sample sizes", "[stats][wasserstein]") {
  // F_a steps at 0 and 1; F_b jumps at 0.5 => area 0.5*0.5 + 0.5*0.5
  REQUIRE(EmpiricalDistance::wasserstein({0.0, 1.0}, {0.5}) == Catch::Approx(0.5));
  REQUIRE(EmpiricalDistance::wasserstein({0.0, 0.0, 3.0}, {0.0}) == Catch::Approx(1.0));
}

TEST_CASE("EmpiricalDistance: metrics are symmetric bit for bit", "[stats][wasserstein][ks]") {
  const std::vector<double> a{36.4, 36.9, 37.1, 36.6, 36.8, 38.2, 35.9};
  const std::vector<double> b{36.7, 36.5, 37.4, 36.8, 36.2};

  REQUIRE(EmpiricalDistance::wasserstein(a, b) == EmpiricalDistance::wasserstein(b, a));
  REQUIRE(EmpiricalDistance::kolmogorovSmirnov(a, b) == EmpiricalDistance::kolmogorovSmirnov(b, a));
}

TEST_CASE("EmpiricalDistance: identical samples are at distance zero", "[stats][wasserstein][ks]") {
  const std::vector<double> a{80.0, 75.0, 90.0, 75.0};
  std::vector<double> shuffled{75.0, 90.0, 75.0, 80.0};

  REQUIRE(EmpiricalDistance::wasserstein(a, shuffled) == 0.0);
  REQUIRE(EmpiricalDistance::kolmogorovSmirnov(a, shuffled) == 0.0);
}

TEST_CASE("EmpiricalDistance: Kolmogorov-Smirnov statistic", "[stats][ks]") {
  REQUIRE(EmpiricalDistance::kolmogorovSmirnov({1.0, 2.0, 3.0}, {4.0, 5.0}) == Catch::Approx(1.0));
  REQUIRE(EmpiricalDistance::kolmogorovSmirnov({1.0, 2.0, 3.0, 4.0}, {3.0, 4.0, 5.0, 6.0}) ==
          Catch::Approx(0.5));
}

TEST_CASE("EmpiricalDistance: empty samples are rejected", "[stats][wasserstein]") {
  REQUIRE_THROWS_AS(EmpiricalDistance::wasserstein({}, {1.0}), InsufficientDataError);
  REQUIRE_THROWS_AS(EmpiricalDistance::kolmogorovSmirnov({1.0}, {}), InsufficientDataError);
}
