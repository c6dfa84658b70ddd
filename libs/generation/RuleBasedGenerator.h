// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_RULE_BASED_GENERATOR_H
#define __TRIALSYNTH_RULE_BASED_GENERATOR_H 1

#include "IVitalsGenerator.h"

namespace trialsynth
{
  /**
   * @class RuleBasedGenerator
   * @brief Draws each field independently from a fixed normal distribution.
   * Needs no reference data; baseline overrides replace the defaults.
   */
  class RuleBasedGenerator : public IVitalsGenerator
  {
  public:
    GenerationMethod getMethod() const override
    {
      return GenerationMethod::Rules;
    }

  protected:
    std::unique_ptr<IStratumSampler>
    createSampler(const GenerationRequest& request, const VitalsRecordList& reference) const override;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_RULE_BASED_GENERATOR_H
