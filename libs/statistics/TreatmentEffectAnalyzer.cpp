// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "TreatmentEffectAnalyzer.h"
#include "DescriptiveStats.h"
#include "VitalsException.h"
#include <cmath>
#include <limits>
#include <boost/math/distributions/students_t.hpp>

namespace trialsynth
{
  namespace
  {
    ArmSummary summarizeArm(const std::vector<double>& values)
    {
      ArmSummary arm;
      arm.n = values.size();
      arm.mean = DescriptiveStats::computeMean(values);
      arm.stdDev = DescriptiveStats::computeSampleStdDev(values);
      arm.standardError = arm.stdDev / std::sqrt(static_cast<double>(arm.n));
      return arm;
    }
  }

  std::string effectSizeToString(EffectSize size)
  {
    switch (size)
      {
      case EffectSize::Negligible:
	return "negligible";
      case EffectSize::Small:
	return "small";
      case EffectSize::Medium:
	return "medium";
      case EffectSize::Large:
	return "large";
      }
    return "unknown";
  }

  EffectSize TreatmentEffectAnalyzer::classifyEffectSize(double cohensD)
  {
    const double d = std::fabs(cohensD);
    if (d < 0.2)
      return EffectSize::Negligible;
    if (d < 0.5)
      return EffectSize::Small;
    if (d < 0.8)
      return EffectSize::Medium;

    return EffectSize::Large;
  }

  TreatmentEffectResult TreatmentEffectAnalyzer::compare(const std::vector<double>& active,
							 const std::vector<double>& placebo)
  {
    if (active.size() < 2 || placebo.size() < 2)
      throw InsufficientDataError("Welch test needs at least two observations per arm (Active " +
				  std::to_string(active.size()) + ", Placebo " +
				  std::to_string(placebo.size()) + ")");

    TreatmentEffectResult result;
    result.active = summarizeArm(active);
    result.placebo = summarizeArm(placebo);

    const double n1 = static_cast<double>(result.active.n);
    const double n2 = static_cast<double>(result.placebo.n);
    const double v1 = result.active.stdDev * result.active.stdDev / n1;
    const double v2 = result.placebo.stdDev * result.placebo.stdDev / n2;

    result.difference = result.active.mean - result.placebo.mean;
    result.seDifference = std::sqrt(v1 + v2);

    if (result.seDifference > 0.0)
      {
	result.degreesOfFreedom = (v1 + v2) * (v1 + v2) /
	  (v1 * v1 / (n1 - 1.0) + v2 * v2 / (n2 - 1.0));
	result.tStatistic = result.difference / result.seDifference;

	boost::math::students_t dist(result.degreesOfFreedom);
	result.pValue = 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(result.tStatistic)));

	const double tCrit = boost::math::quantile(boost::math::complement(dist, 0.025));
	result.ci95Lower = result.difference - tCrit * result.seDifference;
	result.ci95Upper = result.difference + tCrit * result.seDifference;
      }
    else
      {
	// Both arms constant: the comparison is exact.
	result.degreesOfFreedom = n1 + n2 - 2.0;
	if (result.difference == 0.0)
	  {
	    result.tStatistic = 0.0;
	    result.pValue = 1.0;
	  }
	else
	  {
	    result.tStatistic = std::copysign(std::numeric_limits<double>::infinity(), result.difference);
	    result.pValue = 0.0;
	  }
	result.ci95Lower = result.difference;
	result.ci95Upper = result.difference;
      }

    result.significant = result.pValue < kSignificanceLevel;

    const double pooledVar = ((n1 - 1.0) * result.active.stdDev * result.active.stdDev +
			      (n2 - 1.0) * result.placebo.stdDev * result.placebo.stdDev) /
      (n1 + n2 - 2.0);
    const double pooledSd = std::sqrt(pooledVar);
    result.cohensD = (pooledSd > 0.0) ? std::fabs(result.difference) / pooledSd : 0.0;
    result.effectSize = classifyEffectSize(result.cohensD);

    if (std::fabs(result.difference) >= kClinicalThreshold && result.significant)
      result.clinicalRelevance = "clinically significant";
    else if (std::fabs(result.difference) >= kClinicalThreshold)
      result.clinicalRelevance = "borderline";
    else
      result.clinicalRelevance = "not clinically meaningful";

    return result;
  }

  TreatmentEffectResult TreatmentEffectAnalyzer::analyze(const VitalsRecordList& records,
							 Visit visit,
							 VitalsColumn field)
  {
    const std::vector<double> active = columnValues(records, field, visit, TreatmentArm::Active);
    const std::vector<double> placebo = columnValues(records, field, visit, TreatmentArm::Placebo);

    if (active.size() < 2 || placebo.size() < 2)
      throw InsufficientDataError("need at least two subjects per arm at " + visitToString(visit) +
				  " (Active " + std::to_string(active.size()) + ", Placebo " +
				  std::to_string(placebo.size()) + ")");

    TreatmentEffectResult result = compare(active, placebo);
    result.visit = visit;
    result.field = field;
    return result;
  }
} // namespace trialsynth
