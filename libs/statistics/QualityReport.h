// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_QUALITY_REPORT_H
#define __TRIALSYNTH_QUALITY_REPORT_H 1

#include <map>
#include <string>
#include "VitalsRecord.h"

namespace trialsynth
{
  enum class QualityLevel { Excellent, Good, NeedsImprovement };

  /// "EXCELLENT", "GOOD", "NEEDS IMPROVEMENT"
  std::string qualityLevelToString(QualityLevel level);

  struct NearestNeighborStats
  {
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stdDev = 0.0;
  };

  using ColumnMetrics = std::map<VitalsColumn, double>;

  /**
   * @brief Fidelity of a synthetic dataset against its reference.
   *
   * Every score lies in [0, 1], higher is better; distances and RMSE are in
   * the column's own units, lower is better.
   */
  struct QualityReport
  {
    ColumnMetrics wassersteinDistances;
    ColumnMetrics ksDistances;
    ColumnMetrics rmseByColumn;
    double correlationPreservation = 0.0;
    double knnImputationScore = 0.0;
    double overallQualityScore = 0.0;
    QualityLevel qualityLevel = QualityLevel::NeedsImprovement;
    std::string summary;
    NearestNeighborStats nearestNeighborDistances;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_QUALITY_REPORT_H
