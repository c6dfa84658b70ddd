#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "ResultSerializer.h"
#include <limits>
#include <rapidjson/document.h>

using namespace trialsynth;

TEST_CASE("ResultSerializer writes quality reports", "[ResultSerializer]")
{
    QualityReport report;
    report.wassersteinDistances[VitalsColumn::SystolicBP] = 1.5;
    report.wassersteinDistances[VitalsColumn::Temperature] = 0.05;
    report.correlationPreservation = 0.9;
    report.knnImputationScore = 0.8;
    report.overallQualityScore = 0.86;
    report.qualityLevel = QualityLevel::Excellent;
    report.summary = "EXCELLENT - Quality score: 0.86 - Production ready";
    report.nearestNeighborDistances.mean = 2.5;

    rapidjson::Document doc;
    doc.Parse(ResultSerializer::qualityReportToJson(report).c_str());

    REQUIRE_FALSE(doc.HasParseError());
    REQUIRE(doc["wasserstein_distances"]["SystolicBP"].GetDouble() == Catch::Approx(1.5));
    REQUIRE_FALSE(doc["wasserstein_distances"].HasMember("HeartRate"));
    REQUIRE(doc["overall_quality_score"].GetDouble() == Catch::Approx(0.86));
    REQUIRE(std::string(doc["quality_level"].GetString()) == "EXCELLENT");
    REQUIRE(doc["nearest_neighbor_distances"]["mean"].GetDouble() == Catch::Approx(2.5));
}

TEST_CASE("ResultSerializer writes treatment effects", "[ResultSerializer]")
{
    TreatmentEffectResult result;
    result.active.n = 50;
    result.placebo.n = 50;
    result.difference = -6.0;
    result.tStatistic = -std::numeric_limits<double>::infinity();
    result.pValue = 0.0;
    result.significant = true;
    result.clinicalRelevance = "clinically significant";

    rapidjson::Document doc;
    doc.Parse(ResultSerializer::treatmentEffectToJson(result).c_str());

    REQUIRE_FALSE(doc.HasParseError());
    REQUIRE(doc["active"]["n"].GetUint64() == 50);
    REQUIRE(doc["difference"].GetDouble() == Catch::Approx(-6.0));
    REQUIRE(doc["t_statistic"].GetDouble() == std::numeric_limits<double>::lowest());
    REQUIRE(doc["significant"].GetBool());
    REQUIRE(std::string(doc["visit"].GetString()) == "Week 12");
    REQUIRE(std::string(doc["field"].GetString()) == "SystolicBP");
}

TEST_CASE("ResultSerializer writes generation results", "[ResultSerializer]")
{
    GenerationResult result;
    result.seedUsed = 123;
    result.method = GenerationMethod::Bootstrap;
    result.records.push_back(VitalsRecord{"RA001-001", Visit::Day1, TreatmentArm::Active, 128, 82, 71, 36.9});

    rapidjson::Document doc;
    doc.Parse(ResultSerializer::generationResultToJson(result).c_str());

    REQUIRE_FALSE(doc.HasParseError());
    REQUIRE(doc["seed_used"].GetUint64() == 123);
    REQUIRE(std::string(doc["method"].GetString()) == "bootstrap");
    REQUIRE(doc["record_count"].GetUint64() == 1);
    REQUIRE(std::string(doc["records"][0]["VisitName"].GetString()) == "Day 1");
    REQUIRE(doc["records"][0]["SystolicBP"].GetInt() == 128);
}
