#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <sstream>
#include "ConstraintEnforcer.h"
#include "DescriptiveStats.h"
#include "GenerationPipeline.h"
#include "GenerationTestData.h"
#include "TreatmentEffectAnalyzer.h"
#include "VitalsException.h"

using namespace trialsynth;

namespace {
  double week12Difference(const VitalsRecordList& records)
  {
    return DescriptiveStats::computeMean(columnValues(records, VitalsColumn::SystolicBP, Visit::Week12, TreatmentArm::Active)) -
      DescriptiveStats::computeMean(columnValues(records, VitalsColumn::SystolicBP, Visit::Week12, TreatmentArm::Placebo));
  }
}

TEST_CASE("GenerationPipeline: MVN with five subjects per arm and a -5 effect", "[pipeline]") {
  std::ostringstream log;
  GenerationPipeline pipeline(log);

  GenerationRequest request(5, -5.0, GenerationMethod::Mvn, 123ULL, std::nullopt,
                            Visit::Week12, EffectOnset::EndpointOnly, EffectMode::Snap);
  const GenerationResult result = pipeline.run(request, testdata::referenceCohort());

  REQUIRE(result.records.size() == 40);
  REQUIRE(result.seedUsed == 123ULL);
  REQUIRE(result.method == GenerationMethod::Mvn);
  REQUIRE(week12Difference(result.records) == Catch::Approx(-5.0).margin(1.0));
  REQUIRE_NOTHROW(ConstraintEnforcer::verify(result.records));
  REQUIRE(log.str().find("[GenerationPipeline]") != std::string::npos);
}

TEST_CASE("GenerationPipeline: additive -5 effect with five subjects per arm", "[pipeline]") {
  std::ostringstream log;
  GenerationPipeline pipeline(log);

  GenerationRequest request(5, -5.0, GenerationMethod::Mvn, 123ULL);
  const GenerationResult result = pipeline.run(request, testdata::referenceCohort());

  REQUIRE(result.records.size() == 40);

  const TreatmentEffectResult effect = TreatmentEffectAnalyzer::analyze(result.records);
  REQUIRE(std::fabs(effect.difference + 5.0) <= 2.0 * effect.seDifference);
}

TEST_CASE("GenerationPipeline: seeded runs replay exactly", "[pipeline]") {
  std::ostringstream log;
  GenerationPipeline pipeline(log);
  const auto reference = testdata::referenceCohort();

  GenerationRequest request(8, 4.0, GenerationMethod::Bootstrap, 55ULL, 0.2);
  REQUIRE(pipeline.run(request, reference).records == pipeline.run(request, reference).records);
}

TEST_CASE("GenerationPipeline: an unseeded run reports a seed that replays it", "[pipeline]") {
  std::ostringstream log;
  GenerationPipeline pipeline(log);

  GenerationRequest request(4, -3.0, GenerationMethod::Rules);
  const GenerationResult first = pipeline.run(request, VitalsRecordList{});
  const GenerationResult replay = pipeline.run(request.withSeed(first.seedUsed), VitalsRecordList{});

  REQUIRE(first.records == replay.records);
  REQUIRE(log.str().find("(auto)") != std::string::npos);
}

TEST_CASE("GenerationPipeline: every record satisfies the clinical invariants", "[pipeline]") {
  std::ostringstream log;
  GenerationPipeline pipeline(log);
  const auto reference = testdata::referenceCohort();

  for (GenerationMethod method : { GenerationMethod::Mvn, GenerationMethod::Bootstrap, GenerationMethod::Rules })
    {
      // A large effect pushes Active SBP into the lower clip bound.
      GenerationRequest request(20, -40.0, method, 9ULL);
      const GenerationResult result = pipeline.run(request, reference);

      REQUIRE(result.records.size() == 160);
      for (const auto& r : result.records)
        REQUIRE(ConstraintEnforcer::satisfies(r));
    }
}

TEST_CASE("GenerationPipeline: strategy errors propagate", "[pipeline]") {
  std::ostringstream log;
  GenerationPipeline pipeline(log);

  REQUIRE_THROWS_AS(pipeline.run(GenerationRequest(2, 0.0, GenerationMethod::Mvn, 1ULL), VitalsRecordList{}),
                    InsufficientDataError);
}
