// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_DESCRIPTIVE_STATS_H
#define __TRIALSYNTH_DESCRIPTIVE_STATS_H 1

#include <cstddef>
#include <vector>

namespace trialsynth
{
  /**
   * @brief Location and spread of one sample.
   *
   * stdDev is the population standard deviation (divide by n), the form used
   * by the fidelity metrics; sampleStdDev divides by n - 1 and is zero for n < 2.
   */
  struct SummaryStats
  {
    std::size_t count = 0;
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    double stdDev = 0.0;
    double sampleStdDev = 0.0;
  };

  struct DescriptiveStats
  {
    static double computeMean(const std::vector<double>& values);

    static double computePopulationStdDev(const std::vector<double>& values);

    static double computeSampleStdDev(const std::vector<double>& values);

    // Exact median (average of the two middle values for even n); 0 for an empty sample.
    static double computeMedian(std::vector<double> values);

    static SummaryStats summarize(const std::vector<double>& values);
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_DESCRIPTIVE_STATS_H
