// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "DescriptiveStats.h"
#include <algorithm>
#include <cmath>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace trialsynth
{
  using boost::accumulators::accumulator_set;
  using boost::accumulators::stats;

  typedef boost::accumulators::tag::mean mean_tag;
  typedef boost::accumulators::tag::variance variance_tag;
  typedef boost::accumulators::tag::min min_tag;
  typedef boost::accumulators::tag::max max_tag;
  typedef boost::accumulators::tag::count count_tag;

  double DescriptiveStats::computeMean(const std::vector<double>& values)
  {
    if (values.empty())
      return 0.0;

    accumulator_set<double, stats<mean_tag>> acc;
    for (double v : values)
      acc(v);

    return boost::accumulators::mean(acc);
  }

  double DescriptiveStats::computePopulationStdDev(const std::vector<double>& values)
  {
    if (values.size() < 2)
      return 0.0;

    // boost's variance statistic is the population (1/n) variance
    accumulator_set<double, stats<variance_tag>> acc;
    for (double v : values)
      acc(v);

    return std::sqrt(std::max(0.0, boost::accumulators::variance(acc)));
  }

  double DescriptiveStats::computeSampleStdDev(const std::vector<double>& values)
  {
    const std::size_t n = values.size();
    if (n < 2)
      return 0.0;

    const double populationSd = computePopulationStdDev(values);
    return populationSd * std::sqrt(static_cast<double>(n) / static_cast<double>(n - 1));
  }

  double DescriptiveStats::computeMedian(std::vector<double> values)
  {
    if (values.empty())
      return 0.0;

    const std::size_t n = values.size();
    const std::size_t mid = n / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    const double upper = values[mid];

    if (n % 2 == 1)
      return upper;

    const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lower + upper);
  }

  SummaryStats DescriptiveStats::summarize(const std::vector<double>& values)
  {
    SummaryStats summary;
    if (values.empty())
      return summary;

    accumulator_set<double, stats<count_tag, mean_tag, variance_tag, min_tag, max_tag>> acc;
    for (double v : values)
      acc(v);

    summary.count = boost::accumulators::count(acc);
    summary.mean = boost::accumulators::mean(acc);
    summary.min = boost::accumulators::min(acc);
    summary.max = boost::accumulators::max(acc);
    summary.median = computeMedian(values);

    if (summary.count > 1)
      {
	const double variance = std::max(0.0, boost::accumulators::variance(acc));
	summary.stdDev = std::sqrt(variance);
	summary.sampleStdDev = std::sqrt(variance * static_cast<double>(summary.count) /
					 static_cast<double>(summary.count - 1));
      }

    return summary;
  }
} // namespace trialsynth
