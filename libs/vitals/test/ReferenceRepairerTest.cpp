#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "ReferenceRepairer.h"
#include "ConstraintEnforcer.h"
#include "VitalsException.h"

using namespace trialsynth;

namespace {
  RawVitalsRecord raw(const std::string& subject, const std::string& visit, const std::string& arm,
                      std::optional<double> sbp, std::optional<double> dbp,
                      std::optional<double> hr, std::optional<double> temp)
  {
    RawVitalsRecord r;
    r.subjectId = subject;
    r.visitName = visit;
    r.treatmentArm = arm;
    r.systolicBP = sbp;
    r.diastolicBP = dbp;
    r.heartRate = hr;
    r.temperature = temp;
    return r;
  }

  RawVitalsRecordList cleanDataset()
  {
    RawVitalsRecordList records;
    const char *visits[] = {"Screening", "Day 1", "Week 4", "Week 12"};
    for (int v = 0; v < 4; ++v) {
      records.push_back(raw("S01", visits[v], "Active", 140 - v, 88, 72, 36.8));
      records.push_back(raw("S02", visits[v], "Placebo", 135 + v, 85, 75, 36.6));
    }
    return records;
  }

  std::size_t countKind(const RepairReport& report, RepairKind kind)
  {
    std::size_t n = 0;
    for (const auto& a : report)
      if (a.kind == kind)
        ++n;
    return n;
  }
}

TEST_CASE("ReferenceRepairer: clean data passes through unchanged", "[repairer]") {
  auto dataset = ReferenceRepairer::repair(cleanDataset());
  REQUIRE(dataset.size() == 8);
  REQUIRE(dataset.getReport().empty());
  REQUIRE(dataset.getRecords()[0].subjectId == "S01");
  REQUIRE(dataset.getRecords()[0].systolicBP == 140);
  REQUIRE(dataset.getRecords()[1].arm == TreatmentArm::Placebo);
}

TEST_CASE("ReferenceRepairer: one duplicate and one SBP of 300 produce exactly two fixes", "[repairer]") {
  auto input = cleanDataset();
  input[2].systolicBP = 300.0;
  input.push_back(input[0]);

  auto dataset = ReferenceRepairer::repair(input);
  const auto& report = dataset.getReport();

  REQUIRE(report.size() == 2);
  REQUIRE(countKind(report, RepairKind::DuplicateRemoved) == 1);
  REQUIRE(countKind(report, RepairKind::ValueClipped) == 1);
  REQUIRE(dataset.size() == 8);

  const VitalsRecord& clipped = dataset.getRecords()[2];
  REQUIRE(clipped.subjectId == "S01");
  REQUIRE(clipped.visit == Visit::Day1);
  REQUIRE(clipped.systolicBP == 200);

  for (const auto& a : report) {
    if (a.kind == RepairKind::ValueClipped) {
      REQUIRE(a.field == "SystolicBP");
      REQUIRE(a.before == "300");
      REQUIRE(a.after == "200");
    }
  }
}

TEST_CASE("ReferenceRepairer: repair is idempotent", "[repairer]") {
  auto input = cleanDataset();
  input[0].systolicBP = std::nullopt;
  input[1].treatmentArm = std::string("Active");
  input[3].diastolicBP = 140.0;
  input[4].systolicBP = 80.0;
  input[4].diastolicBP = 90.0;
  input[5].temperature = 43.26;
  input.push_back(input[6]);

  auto first = ReferenceRepairer::repair(input);
  REQUIRE_FALSE(first.getReport().empty());
  REQUIRE_NOTHROW(ConstraintEnforcer::verify(first.getRecords()));

  auto second = ReferenceRepairer::repair(toRawRecords(first.getRecords()));
  REQUIRE(second.getReport().empty());
  REQUIRE(second.getRecords() == first.getRecords());
}

TEST_CASE("ReferenceRepairer: arm resolves to the most frequent arm", "[repairer]") {
  auto input = cleanDataset();
  input[2].treatmentArm = std::string("Placebo");   // S01 Day 1

  auto dataset = ReferenceRepairer::repair(input);
  REQUIRE(countKind(dataset.getReport(), RepairKind::ArmCorrected) == 1);
  for (const auto& r : dataset.getRecords()) {
    if (r.subjectId == "S01")
      REQUIRE(r.arm == TreatmentArm::Active);
  }
}

TEST_CASE("ReferenceRepairer: arm tie resolves to the first record's arm", "[repairer]") {
  auto input = cleanDataset();
  input[4].treatmentArm = std::string("Placebo");   // S01 Week 4
  input[6].treatmentArm = std::string("Placebo");   // S01 Week 12

  auto dataset = ReferenceRepairer::repair(input);
  REQUIRE(countKind(dataset.getReport(), RepairKind::ArmCorrected) == 2);
  for (const auto& r : dataset.getRecords()) {
    if (r.subjectId == "S01")
      REQUIRE(r.arm == TreatmentArm::Active);
  }
}

TEST_CASE("ReferenceRepairer: imputation uses subject median then cohort median", "[repairer]") {
  auto input = cleanDataset();
  input[0].heartRate = std::nullopt;                // S01 has 72 at other visits
  input.push_back(raw("S03", "Screening", "Active", 130, 80, std::nullopt, 36.9));

  auto dataset = ReferenceRepairer::repair(input);
  REQUIRE(countKind(dataset.getReport(), RepairKind::ValueImputed) == 2);
  REQUIRE(dataset.getRecords()[0].heartRate == 72);

  // cohort median of {72 x3, 75 x4} is 75
  REQUIRE(dataset.getRecords().back().heartRate == 75);
}

TEST_CASE("ReferenceRepairer: a field with no observed values cannot be imputed", "[repairer]") {
  auto input = cleanDataset();
  for (auto& r : input)
    r.temperature = std::nullopt;

  REQUIRE_THROWS_AS(ReferenceRepairer::repair(input), InsufficientDataError);
}

TEST_CASE("ReferenceRepairer: differential repair swaps then lowers", "[repairer]") {
  auto input = cleanDataset();
  input[0].systolicBP = 80.0;
  input[0].diastolicBP = 120.0;
  input[2].systolicBP = 110.0;
  input[2].diastolicBP = 108.0;

  auto dataset = ReferenceRepairer::repair(input);
  const auto& records = dataset.getRecords();

  REQUIRE(records[0].systolicBP == 120);
  REQUIRE(records[0].diastolicBP == 95);
  REQUIRE(records[2].systolicBP == 110);
  REQUIRE(records[2].diastolicBP == 105);
  REQUIRE(countKind(dataset.getReport(), RepairKind::DiastolicLowered) == 1);
}

TEST_CASE("ReferenceRepairer: schema errors name record and field", "[repairer]") {
  auto input = cleanDataset();
  input[3].visitName = std::string("Week 8");

  try {
    ReferenceRepairer::repair(input);
    FAIL("expected SchemaError");
  }
  catch (const SchemaError& e) {
    const std::string msg = e.what();
    REQUIRE(msg.find("record 3") != std::string::npos);
    REQUIRE(msg.find("VisitName") != std::string::npos);
  }

  auto missing = cleanDataset();
  missing[5].subjectId = std::nullopt;
  REQUIRE_THROWS_AS(ReferenceRepairer::repair(missing), SchemaError);
}

TEST_CASE("ReferenceRepairer: validate reports issues by severity", "[repairer][validate]") {
  REQUIRE(ReferenceRepairer::validate(cleanDataset()).isClean());

  auto input = cleanDataset();
  input[0].systolicBP = 60.0;        // out of range and inverted
  input[1].heartRate = std::nullopt;
  input.push_back(input[2]);          // duplicate
  input.push_back(raw("S09", "Screening", "Placebo", 120, 80, 70, 36.7));  // incomplete visits

  auto report = ReferenceRepairer::validate(input);
  REQUIRE_FALSE(report.isClean());
  REQUIRE(report.getRecordCount() == input.size());
  REQUIRE(report.countBySeverity(IssueSeverity::Critical) >= 1);
  REQUIRE(report.countBySeverity(IssueSeverity::High) >= 3);
  REQUIRE(report.countBySeverity(IssueSeverity::Medium) >= 1);

  bool sawDuplicates = false;
  for (const auto& issue : report.getIssues())
    if (issue.category == "duplicates") {
      sawDuplicates = true;
      REQUIRE(issue.count == 1);
    }
  REQUIRE(sawDuplicates);
}
