// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "IVitalsGenerator.h"
#include "ConstraintEnforcer.h"
#include "RngUtils.h"
#include <iomanip>
#include <sstream>

namespace trialsynth
{
  VitalsRecordList IVitalsGenerator::generate(const GenerationRequest& request,
					      const VitalsRecordList& reference,
					      uint64_t masterSeed) const
  {
    std::unique_ptr<IStratumSampler> sampler = createSampler(request, reference);

    const std::size_t nPerArm = request.getSubjectsPerArm();
    const rng_utils::CRNKey key(masterSeed,
				{ rng_utils::tag_from_name(methodToString(getMethod())) });
    const rng_utils::CRNEngineProvider<GeneratorEngine> provider(key);

    VitalsRecordList records;
    records.reserve(request.getExpectedRecordCount());

    for (TreatmentArm arm : allArms())
      {
	for (std::size_t i = 0; i < nPerArm; ++i)
	  {
	    const std::size_t subjectIndex = armIndex(arm) * nPerArm + i;
	    const std::string subjectId = subjectIdFor(subjectIndex);
	    GeneratorEngine engine = provider.make_engine(subjectIndex);

	    for (Visit visit : allVisits())
	      records.push_back(ConstraintEnforcer::fromSample(subjectId, visit, arm,
							       sampler->draw(visit, arm, engine)));
	  }
      }

    return records;
  }

  std::string IVitalsGenerator::subjectIdFor(std::size_t subjectIndex)
  {
    std::ostringstream id;
    id << "RA001-" << std::setw(3) << std::setfill('0') << (subjectIndex + 1);
    return id.str();
  }

  VitalsRecordList stratumRecords(const VitalsRecordList& reference, Visit visit, TreatmentArm arm)
  {
    VitalsRecordList rows;
    for (const auto& record : reference)
      {
	if (record.visit == visit && record.arm == arm)
	  rows.push_back(record);
      }

    return rows;
  }
} // namespace trialsynth
