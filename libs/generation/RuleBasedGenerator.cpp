// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "RuleBasedGenerator.h"
#include "PriorParameters.h"
#include "RngUtils.h"

namespace trialsynth
{
  namespace
  {
    class IndependentNormalSampler : public IStratumSampler
    {
    public:
      explicit IndependentNormalSampler(const PriorParameters& prior)
	: mPrior(prior)
      {}

      VitalsSample draw(Visit, TreatmentArm, GeneratorEngine& engine) const override
      {
	VitalsSample sample;
	for (std::size_t c = 0; c < kNumNumericColumns; ++c)
	  sample[c] = rng_utils::get_random_normal(engine, mPrior.mean[c], mPrior.stdDev[c]);

	return sample;
      }

    private:
      PriorParameters mPrior;
    };
  }

  std::unique_ptr<IStratumSampler>
  RuleBasedGenerator::createSampler(const GenerationRequest& request, const VitalsRecordList&) const
  {
    return std::make_unique<IndependentNormalSampler>(PriorParameters::fromBaseline(request.getBaseline()));
  }
} // namespace trialsynth
