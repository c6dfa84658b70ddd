// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_PRIOR_PARAMETERS_H
#define __TRIALSYNTH_PRIOR_PARAMETERS_H 1

#include <optional>
#include "GenerationRequest.h"
#include "IVitalsGenerator.h"

namespace trialsynth
{
  /**
   * @brief Fixed per-column normal parameters used by the rule-based strategy
   * and by MVN strata too thin to estimate a covariance.
   */
  struct PriorParameters
  {
    VitalsSample mean   { 130.0, 80.0, 75.0, 36.8 };
    VitalsSample stdDev {  10.0,  8.0,  8.0,  0.3 };

    /// Defaults with any supplied baseline columns substituted.
    static PriorParameters fromBaseline(const std::optional<BaselineStatistics>& baseline)
    {
      PriorParameters prior;
      if (baseline)
	{
	  for (const auto& entry : *baseline)
	    {
	      prior.mean[columnIndex(entry.first)] = entry.second.mean;
	      prior.stdDev[columnIndex(entry.first)] = entry.second.stdDev;
	    }
	}

      return prior;
    }
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_PRIOR_PARAMETERS_H
