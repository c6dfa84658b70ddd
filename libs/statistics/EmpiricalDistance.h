// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_EMPIRICAL_DISTANCE_H
#define __TRIALSYNTH_EMPIRICAL_DISTANCE_H 1

#include <vector>

namespace trialsynth
{
  /**
   * @brief Distances between the empirical distributions of two 1-D samples.
   *
   * Both metrics walk the merged, sorted support of the two samples, so
   * swapping the arguments yields bit-identical results.
   */
  class EmpiricalDistance
  {
  public:
    /**
     * @brief 1-Wasserstein (earth mover's) distance, the exact integral of
     * |F_a(x) - F_b(x)| over the real line.
     * @throws InsufficientDataError if either sample is empty
     */
    static double wasserstein(const std::vector<double>& a, const std::vector<double>& b);

    /**
     * @brief Two-sample Kolmogorov-Smirnov statistic, sup |F_a(x) - F_b(x)|.
     * @throws InsufficientDataError if either sample is empty
     */
    static double kolmogorovSmirnov(const std::vector<double>& a, const std::vector<double>& b);

  private:
    template <class Visitor>
    static void walkSupport(const std::vector<double>& a, const std::vector<double>& b,
			    Visitor visit);
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_EMPIRICAL_DISTANCE_H
