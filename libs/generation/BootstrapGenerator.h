// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_BOOTSTRAP_GENERATOR_H
#define __TRIALSYNTH_BOOTSTRAP_GENERATOR_H 1

#include "IVitalsGenerator.h"

namespace trialsynth
{
  /**
   * @class BootstrapGenerator
   * @brief Resamples reference rows with replacement within each (visit, arm)
   * stratum and adds independent Gaussian jitter of
   * jitterFraction x (stratum sample standard deviation) to every column.
   */
  class BootstrapGenerator : public IVitalsGenerator
  {
  public:
    GenerationMethod getMethod() const override
    {
      return GenerationMethod::Bootstrap;
    }

  protected:
    /// @throws InsufficientDataError for an empty reference or an empty stratum
    std::unique_ptr<IStratumSampler>
    createSampler(const GenerationRequest& request, const VitalsRecordList& reference) const override;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_BOOTSTRAP_GENERATOR_H
