// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "GenerationPipeline.h"
#include "ConstraintEnforcer.h"
#include "DescriptiveStats.h"
#include "GeneratorFactory.h"
#include "RngUtils.h"
#include "TreatmentEffectInjector.h"
#include <iomanip>
#include <sstream>

namespace trialsynth
{
  GenerationPipeline::GenerationPipeline(std::ostream& log)
    : mLog(log)
  {}

  GenerationResult GenerationPipeline::run(const GenerationRequest& request,
					   const VitalsRecordList& reference) const
  {
    const uint64_t seed = request.getSeed() ? *request.getSeed() : rng_utils::fresh_master_seed();
    const std::string methodName = methodToString(request.getMethod());

    mLog << "   [GenerationPipeline] method=" << methodName
	 << " n_per_arm=" << request.getSubjectsPerArm()
	 << " target_effect=" << request.getTargetEffect()
	 << " endpoint=" << visitToString(request.getEndpointVisit())
	 << " onset=" << onsetToString(request.getEffectOnset())
	 << " mode=" << modeToString(request.getEffectMode())
	 << " seed=" << seed
	 << (request.getSeed() ? "" : " (auto)") << "\n";

    auto generator = GeneratorFactory::create(request.getMethod());
    VitalsRecordList records = generator->generate(request, reference, seed);
    mLog << "   [GenerationPipeline] " << records.size() << " records sampled from "
	 << reference.size() << " reference records\n";

    records = ConstraintEnforcer::enforce(records);
    records = TreatmentEffectInjector::inject(records, request);
    ConstraintEnforcer::verify(records);

    const Visit endpoint = request.getEndpointVisit();
    const double activeMean = DescriptiveStats::computeMean(
      columnValues(records, VitalsColumn::SystolicBP, endpoint, TreatmentArm::Active));
    const double placeboMean = DescriptiveStats::computeMean(
      columnValues(records, VitalsColumn::SystolicBP, endpoint, TreatmentArm::Placebo));

    std::ostringstream summary;
    summary << std::fixed << std::setprecision(2)
	    << "   [GenerationPipeline] " << visitToString(endpoint)
	    << " SystolicBP Active-Placebo=" << (activeMean - placeboMean)
	    << " (target " << request.getTargetEffect() << ")\n";
    mLog << summary.str();

    GenerationResult result;
    result.records = std::move(records);
    result.seedUsed = seed;
    result.method = request.getMethod();
    return result;
  }
} // namespace trialsynth
