#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "ConstraintEnforcer.h"
#include "ClinicalLimits.h"
#include "VitalsException.h"

using namespace trialsynth;

namespace {
  VitalsRecord makeRecord(int sbp, int dbp, int hr, double temp)
  {
    return VitalsRecord{"RA001-001", Visit::Week4, TreatmentArm::Active, sbp, dbp, hr, temp};
  }
}

TEST_CASE("ConstraintEnforcer: valid record is unchanged", "[enforcer]") {
  VitalsRecord r = makeRecord(128, 82, 70, 36.7);
  REQUIRE(ConstraintEnforcer::enforce(r) == r);
  REQUIRE(ConstraintEnforcer::satisfies(r));
}

TEST_CASE("ConstraintEnforcer: out of range values are clipped", "[enforcer]") {
  VitalsRecord r = ConstraintEnforcer::enforce(makeRecord(250, 40, 150, 42.3));
  REQUIRE(r.systolicBP == 200);
  REQUIRE(r.diastolicBP == 55);
  REQUIRE(r.heartRate == 120);
  REQUIRE(r.temperature == Catch::Approx(40.0));

  VitalsRecord low = ConstraintEnforcer::enforce(makeRecord(80, 60, 30, 33.0));
  REQUIRE(low.systolicBP == 95);
  REQUIRE(low.heartRate == 50);
  REQUIRE(low.temperature == Catch::Approx(35.0));
}

TEST_CASE("ConstraintEnforcer: inverted pressures are swapped when that resolves it", "[enforcer]") {
  VitalsRecord r = ConstraintEnforcer::enforce(makeRecord(100, 120, 70, 36.8));
  REQUIRE(r.systolicBP == 120);
  REQUIRE(r.diastolicBP == 100);
  REQUIRE(ConstraintEnforcer::satisfies(r));
}

TEST_CASE("ConstraintEnforcer: narrow differential lowers diastolic", "[enforcer]") {
  VitalsRecord r = ConstraintEnforcer::enforce(makeRecord(110, 108, 70, 36.8));
  REQUIRE(r.systolicBP == 110);
  REQUIRE(r.diastolicBP == 105);

  // 96/98 cannot be fixed by a swap alone.
  VitalsRecord s = ConstraintEnforcer::enforce(makeRecord(96, 98, 70, 36.8));
  REQUIRE(s.systolicBP == 96);
  REQUIRE(s.diastolicBP == 91);
  REQUIRE(ConstraintEnforcer::satisfies(s));
}

TEST_CASE("ConstraintEnforcer: clip happens before the differential repair", "[enforcer]") {
  // DiastolicBP 140 clips to 130 first; SBP 132 then only differs by 2.
  VitalsRecord r = ConstraintEnforcer::enforce(makeRecord(132, 140, 70, 36.8));
  REQUIRE(r.systolicBP == 132);
  REQUIRE(r.diastolicBP == 127);
}

TEST_CASE("ConstraintEnforcer: enforce is idempotent and never mutates input", "[enforcer]") {
  VitalsRecordList input{makeRecord(300, 20, 10, 45.0), makeRecord(100, 100, 70, 36.5)};
  VitalsRecordList copy(input);

  auto once = ConstraintEnforcer::enforce(input);
  auto twice = ConstraintEnforcer::enforce(once);

  REQUIRE(input == copy);
  REQUIRE(once == twice);
  REQUIRE_NOTHROW(ConstraintEnforcer::verify(once));
}

TEST_CASE("ConstraintEnforcer: fromSample rounds then enforces", "[enforcer]") {
  auto r = ConstraintEnforcer::fromSample("RA001-004", Visit::Day1, TreatmentArm::Placebo,
                                          {131.4, 129.7, 49.2, 36.77});
  REQUIRE(r.subjectId == "RA001-004");
  REQUIRE(r.systolicBP == 131);
  REQUIRE(r.diastolicBP == 126);
  REQUIRE(r.heartRate == 50);
  REQUIRE(r.temperature == Catch::Approx(36.8));
}

TEST_CASE("ConstraintEnforcer: verify reports broken invariants", "[enforcer]") {
  REQUIRE_THROWS_AS(ConstraintEnforcer::verify(makeRecord(210, 80, 70, 36.8)),
                    RangeViolationError);
  REQUIRE_THROWS_AS(ConstraintEnforcer::verify(makeRecord(120, 118, 70, 36.8)),
                    RangeViolationError);

  try {
    ConstraintEnforcer::verify(VitalsRecordList{makeRecord(120, 80, 70, 36.8),
                                                makeRecord(120, 80, 130, 36.8)});
    FAIL("expected RangeViolationError");
  }
  catch (const RangeViolationError& e) {
    const std::string msg = e.what();
    REQUIRE(msg.find("record 1") != std::string::npos);
    REQUIRE(msg.find("HeartRate") != std::string::npos);
  }
}
