// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_MVN_GENERATOR_H
#define __TRIALSYNTH_MVN_GENERATOR_H 1

#include "IVitalsGenerator.h"
#include "VitalsMatrix.h"

namespace trialsynth
{
  /**
   * @brief Lower Cholesky factor of a covariance matrix.
   *
   * Adds kInitialJitter to the diagonal and retries the LLT with the jitter
   * multiplied by ten until it succeeds. After kMaxJitterAttempts the factor of
   * the jittered diagonal alone is returned, so the call never fails.
   */
  Matrix4 regularizedCholesky(const Matrix4& covariance);

  /**
   * @class MvnGenerator
   * @brief Samples each (visit, arm) stratum from a multivariate normal with
   * the stratum's mean vector and sample covariance.
   *
   * Strata with fewer than kMinStratumRows rows use the prior parameters
   * (baseline overrides when supplied) with a diagonal covariance.
   */
  class MvnGenerator : public IVitalsGenerator
  {
  public:
    static constexpr std::size_t kMinStratumRows = 8;
    static constexpr double kInitialJitter = 1e-6;
    static constexpr int kMaxJitterAttempts = 12;

    GenerationMethod getMethod() const override
    {
      return GenerationMethod::Mvn;
    }

  protected:
    /// @throws InsufficientDataError for an empty reference
    std::unique_ptr<IStratumSampler>
    createSampler(const GenerationRequest& request, const VitalsRecordList& reference) const override;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_MVN_GENERATOR_H
