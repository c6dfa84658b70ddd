// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "EmpiricalDistance.h"
#include "VitalsException.h"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace trialsynth
{
  // Calls visit(|F_a(x_k) - F_b(x_k)|, x_{k+1} - x_k) for each consecutive pair
  // of the merged support; the last point is visited with a zero width.
  template <class Visitor>
  void EmpiricalDistance::walkSupport(const std::vector<double>& a, const std::vector<double>& b,
				      Visitor visit)
  {
    if (a.empty() || b.empty())
      throw InsufficientDataError("empirical distance needs two non-empty samples");

    std::vector<double> sortedA(a);
    std::vector<double> sortedB(b);
    std::sort(sortedA.begin(), sortedA.end());
    std::sort(sortedB.begin(), sortedB.end());

    std::vector<double> support;
    support.reserve(a.size() + b.size());
    std::merge(sortedA.begin(), sortedA.end(), sortedB.begin(), sortedB.end(),
	       std::back_inserter(support));

    const double na = static_cast<double>(sortedA.size());
    const double nb = static_cast<double>(sortedB.size());
    std::size_t i = 0;
    std::size_t j = 0;

    for (std::size_t k = 0; k < support.size(); ++k)
      {
	const double x = support[k];
	while (i < sortedA.size() && sortedA[i] <= x)
	  ++i;
	while (j < sortedB.size() && sortedB[j] <= x)
	  ++j;

	const double gap = std::fabs(static_cast<double>(i) / na - static_cast<double>(j) / nb);
	const double width = (k + 1 < support.size()) ? support[k + 1] - x : 0.0;
	visit(gap, width);
      }
  }

  double EmpiricalDistance::wasserstein(const std::vector<double>& a, const std::vector<double>& b)
  {
    double area = 0.0;
    walkSupport(a, b, [&area](double gap, double width) { area += gap * width; });
    return area;
  }

  double EmpiricalDistance::kolmogorovSmirnov(const std::vector<double>& a,
					      const std::vector<double>& b)
  {
    double supremum = 0.0;
    walkSupport(a, b, [&supremum](double gap, double) { supremum = std::max(supremum, gap); });
    return supremum;
  }
} // namespace trialsynth
