// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_FIDELITY_SCORER_H
#define __TRIALSYNTH_FIDELITY_SCORER_H 1

#include <cstddef>
#include <cstdint>
#include <string>
#include "QualityReport.h"
#include "VitalsMatrix.h"
#include "VitalsRecord.h"

namespace trialsynth
{
  /**
   * @brief Knobs of the K-NN imputation check and its execution.
   */
  struct ScorerOptions
  {
    double maskFraction = 0.2;
    std::size_t maxMaskedRows = 500;
    uint64_t maskSeed = 42;
    // 0 or 1 runs inline; larger values use a thread pool of that size
    std::size_t threads = 1;
  };

  /**
   * @class FidelityScorer
   * @brief Scores how closely synthetic vitals reproduce a reference dataset.
   *
   * Composite score = 0.25 * (1 / (1 + mean Wasserstein / 5))
   *                 + 0.25 * (1 / (1 + mean RMSE / 10))
   *                 + 0.25 * correlation preservation
   *                 + 0.25 * K-NN imputation score
   *
   * Scoring is deterministic for identical inputs, k and options, whatever
   * the thread count.
   */
  class FidelityScorer
  {
  public:
    static constexpr double kExcellentThreshold = 0.85;
    static constexpr double kGoodThreshold = 0.70;

    explicit FidelityScorer(const ScorerOptions& options = ScorerOptions());

    /**
     * @throws InsufficientDataError if k is zero or either dataset has fewer than k rows
     */
    QualityReport score(const VitalsRecordList& reference,
			const VitalsRecordList& synthetic,
			std::size_t k = 5) const;

    const ScorerOptions& getOptions() const
    {
      return mOptions;
    }

    static double correlationPreservation(const VitalsMatrix& reference,
					  const VitalsMatrix& synthetic);

    /// sqrt((mean_ref - mean_syn)^2 + (sd_ref - sd_syn)^2), population sd
    static double momentRmse(const std::vector<double>& reference,
			     const std::vector<double>& synthetic);

    static QualityLevel classify(double overallScore);

    /// e.g. "EXCELLENT - Quality score: 0.93 - Production ready"
    static std::string summarize(double overallScore);

  private:
    ScorerOptions mOptions;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_FIDELITY_SCORER_H
