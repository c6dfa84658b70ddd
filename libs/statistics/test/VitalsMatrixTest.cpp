#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "VitalsMatrix.h"
#include "StatisticsTestData.h"

using namespace trialsynth;

TEST_CASE("VitalsMatrix: rows follow records, columns follow numericColumns", "[stats][matrix]") {
  auto records = testdata::distinctRecords(3);
  VitalsMatrix m = toVitalsMatrix(records);

  REQUIRE(m.rows() == 3);
  REQUIRE(m(0, 0) == Catch::Approx(110.0));
  REQUIRE(m(2, 0) == Catch::Approx(112.0));
  REQUIRE(m(1, 1) == Catch::Approx(77.0));
  REQUIRE(m(1, 3) == Catch::Approx(36.1));
}

TEST_CASE("VitalsMatrix: Pearson correlation of linear and constant columns", "[stats][correlation]") {
  VitalsMatrix m(5, 4);
  for (int i = 0; i < 5; ++i) {
    m(i, 0) = 100.0 + i;        // x
    m(i, 1) = 200.0 - 2.0 * i;  // -2x
    m(i, 2) = 70.0;             // constant
    m(i, 3) = (i % 2) ? 1.0 : -1.0;
  }

  Matrix4 c = pearsonCorrelation(m);
  REQUIRE(c(0, 1) == Catch::Approx(-1.0));
  REQUIRE(c(1, 0) == Catch::Approx(-1.0));
  REQUIRE(c(0, 2) == 0.0);
  REQUIRE(c(2, 3) == 0.0);
  REQUIRE(c(2, 2) == 1.0);
  REQUIRE(c(3, 3) == 1.0);
}

TEST_CASE("VitalsMatrix: sample covariance", "[stats][covariance]") {
  VitalsMatrix m(3, 4);
  m << 1.0, 2.0, 0.0, 5.0,
       2.0, 4.0, 0.0, 5.0,
       3.0, 6.0, 0.0, 5.0;

  Matrix4 cov = sampleCovariance(m);
  REQUIRE(cov(0, 0) == Catch::Approx(1.0));
  REQUIRE(cov(1, 1) == Catch::Approx(4.0));
  REQUIRE(cov(0, 1) == Catch::Approx(2.0));
  REQUIRE(cov(3, 3) == Catch::Approx(0.0));

  VitalsMatrix single(1, 4);
  single << 1.0, 2.0, 3.0, 4.0;
  REQUIRE(sampleCovariance(single).isZero());
  REQUIRE(pearsonCorrelation(single).isIdentity());
}
