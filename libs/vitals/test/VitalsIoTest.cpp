#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>

#include "VitalsCsvReader.h"
#include "VitalsJsonSerializer.h"
#include "VitalsException.h"

using namespace trialsynth;

TEST_CASE("VitalsCsvReader: reads rows and keeps empty cells as missing", "[io][csv]") {
  std::istringstream in(
    "SubjectID,VisitName,TreatmentArm,SystolicBP,DiastolicBP,HeartRate,Temperature,Site\n"
    "RA001-001,Screening,Active,132,84,71,36.7,Boston\n"
    "RA001-001,Week 12,Active,,82,70,36.5,Boston\n"
    "RA001-002,Day 1,Placebo,128.5,80,,36.9,Denver\n");

  VitalsCsvReader reader("inline.csv", in);
  auto records = reader.readFile();

  REQUIRE(records.size() == 3);
  REQUIRE(*records[0].subjectId == "RA001-001");
  REQUIRE(*records[0].systolicBP == Catch::Approx(132.0));
  REQUIRE(*records[1].visitName == "Week 12");
  REQUIRE_FALSE(records[1].systolicBP.has_value());
  REQUIRE(*records[2].systolicBP == Catch::Approx(128.5));
  REQUIRE_FALSE(records[2].heartRate.has_value());
}

TEST_CASE("VitalsCsvReader: missing column is a schema error", "[io][csv]") {
  std::istringstream in(
    "SubjectID,VisitName,TreatmentArm,SystolicBP,DiastolicBP,HeartRate\n"
    "RA001-001,Screening,Active,132,84,71\n");

  VitalsCsvReader reader("short.csv", in);
  REQUIRE_THROWS_AS(reader.readFile(), SchemaError);
}

TEST_CASE("VitalsCsvReader: non-numeric vital is a schema error", "[io][csv]") {
  std::istringstream in(
    "SubjectID,VisitName,TreatmentArm,SystolicBP,DiastolicBP,HeartRate,Temperature\n"
    "RA001-001,Screening,Active,high,84,71,36.7\n");

  VitalsCsvReader reader("bad.csv", in);
  REQUIRE_THROWS_AS(reader.readFile(), SchemaError);
}

TEST_CASE("VitalsCsvWriter: writes header and one decimal temperature", "[io][csv]") {
  VitalsRecordList records{
    {"RA001-001", Visit::Week4, TreatmentArm::Active, 125, 80, 68, 37.0}
  };

  std::ostringstream os;
  VitalsCsvWriter::write(os, records);

  REQUIRE(os.str() ==
          "SubjectID,VisitName,TreatmentArm,SystolicBP,DiastolicBP,HeartRate,Temperature\n"
          "RA001-001,Week 4,Active,125,80,68,37.0\n");
}

TEST_CASE("VitalsJsonSerializer: records survive a JSON round trip", "[io][json]") {
  VitalsRecordList records{
    {"RA001-001", Visit::Screening, TreatmentArm::Active, 131, 85, 72, 36.8},
    {"RA001-002", Visit::Week12, TreatmentArm::Placebo, 127, 79, 66, 36.4}
  };

  auto parsed = VitalsJsonSerializer::parseRecords(VitalsJsonSerializer::recordsToJson(records));
  REQUIRE(parsed.size() == 2);
  REQUIRE(*parsed[1].visitName == "Week 12");
  REQUIRE(*parsed[1].treatmentArm == "Placebo");
  REQUIRE(*parsed[0].temperature == Catch::Approx(36.8));
}

TEST_CASE("VitalsJsonSerializer: accepts a records member and null values", "[io][json]") {
  const std::string json = R"({"records": [
      {"SubjectID": "S1", "VisitName": "Week4", "TreatmentArm": "Active",
       "SystolicBP": null, "DiastolicBP": 80, "HeartRate": 70}
  ]})";

  auto parsed = VitalsJsonSerializer::parseRecords(json);
  REQUIRE(parsed.size() == 1);
  REQUIRE_FALSE(parsed[0].systolicBP.has_value());
  REQUIRE_FALSE(parsed[0].temperature.has_value());
  REQUIRE(*parsed[0].diastolicBP == Catch::Approx(80.0));

  REQUIRE_THROWS_AS(VitalsJsonSerializer::parseRecords("{not json"), SchemaError);
  REQUIRE_THROWS_AS(VitalsJsonSerializer::parseRecords(R"({"rows": []})"), SchemaError);
}

TEST_CASE("VitalsJsonSerializer: non-string identity field is a schema error", "[io][json]") {
  const std::string numericId = R"([
      {"SubjectID": 101, "VisitName": "Week 4", "TreatmentArm": "Active",
       "SystolicBP": 120, "DiastolicBP": 80, "HeartRate": 70, "Temperature": 36.8}
  ])";
  REQUIRE_THROWS_AS(VitalsJsonSerializer::parseRecords(numericId), SchemaError);

  const std::string numericArm = R"([
      {"SubjectID": "S1", "VisitName": "Week 4", "TreatmentArm": 1,
       "SystolicBP": 120, "DiastolicBP": 80, "HeartRate": 70, "Temperature": 36.8}
  ])";
  REQUIRE_THROWS_AS(VitalsJsonSerializer::parseRecords(numericArm), SchemaError);
}

TEST_CASE("VitalsJsonSerializer: repair report lists each action", "[io][json]") {
  RepairReport report{
    {RepairKind::ValueClipped, "S1", Visit::Day1, "SystolicBP", "300", "200"}
  };

  const std::string json = VitalsJsonSerializer::repairReportToJson(report);
  REQUIRE(json.find("\"value_clipped\"") != std::string::npos);
  REQUIRE(json.find("\"Day 1\"") != std::string::npos);
  REQUIRE(json.find("\"fixCount\": 1") != std::string::npos);
}
