// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_TREATMENT_EFFECT_ANALYZER_H
#define __TRIALSYNTH_TREATMENT_EFFECT_ANALYZER_H 1

#include <cstddef>
#include <string>
#include <vector>
#include "VitalsRecord.h"

namespace trialsynth
{
  struct ArmSummary
  {
    std::size_t n = 0;
    double mean = 0.0;
    double stdDev = 0.0;          // sample (n - 1) standard deviation
    double standardError = 0.0;
  };

  enum class EffectSize { Negligible, Small, Medium, Large };

  std::string effectSizeToString(EffectSize size);

  /**
   * @brief Welch two-sample comparison of Active against Placebo at one visit.
   * difference is mean(Active) - mean(Placebo).
   */
  struct TreatmentEffectResult
  {
    Visit visit = Visit::Week12;
    VitalsColumn field = VitalsColumn::SystolicBP;
    ArmSummary active;
    ArmSummary placebo;
    double difference = 0.0;
    double seDifference = 0.0;
    double tStatistic = 0.0;
    double degreesOfFreedom = 0.0;
    double pValue = 1.0;
    double ci95Lower = 0.0;
    double ci95Upper = 0.0;
    bool significant = false;
    double cohensD = 0.0;
    EffectSize effectSize = EffectSize::Negligible;
    std::string clinicalRelevance;
  };

  /**
   * @class TreatmentEffectAnalyzer
   * @brief Welch's t-test with Welch-Satterthwaite degrees of freedom.
   *
   * The p-value is two-sided from the Student t distribution and the 95%
   * interval is difference +/- t(0.975, df) * seDifference. significant is
   * p < 0.05. When both arms have zero variance the statistic is 0 with p = 1
   * if the means agree, otherwise infinite with p = 0.
   */
  class TreatmentEffectAnalyzer
  {
  public:
    static constexpr double kSignificanceLevel = 0.05;
    static constexpr double kClinicalThreshold = 5.0;   // mmHg

    /**
     * @throws InsufficientDataError when either arm has fewer than two records at the visit
     */
    static TreatmentEffectResult analyze(const VitalsRecordList& records,
					 Visit visit = Visit::Week12,
					 VitalsColumn field = VitalsColumn::SystolicBP);

    static TreatmentEffectResult compare(const std::vector<double>& active,
					 const std::vector<double>& placebo);

    static EffectSize classifyEffectSize(double cohensD);

  private:
    TreatmentEffectAnalyzer() = delete;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_TREATMENT_EFFECT_ANALYZER_H
