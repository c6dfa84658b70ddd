// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "FidelityScorer.h"
#include "DescriptiveStats.h"
#include "EmpiricalDistance.h"
#include "KnnImputation.h"
#include "ParallelExecutors.h"
#include "VitalsException.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace trialsynth
{
  std::string qualityLevelToString(QualityLevel level)
  {
    switch (level)
      {
      case QualityLevel::Excellent:
	return "EXCELLENT";
      case QualityLevel::Good:
	return "GOOD";
      case QualityLevel::NeedsImprovement:
	return "NEEDS IMPROVEMENT";
      }
    return "UNKNOWN";
  }

  FidelityScorer::FidelityScorer(const ScorerOptions& options)
    : mOptions(options)
  {}

  double FidelityScorer::correlationPreservation(const VitalsMatrix& reference,
						 const VitalsMatrix& synthetic)
  {
    const Matrix4 diff = pearsonCorrelation(reference) - pearsonCorrelation(synthetic);
    const double preservation = 1.0 - diff.cwiseAbs().mean() / 2.0;
    return std::min(1.0, std::max(0.0, preservation));
  }

  double FidelityScorer::momentRmse(const std::vector<double>& reference,
				    const std::vector<double>& synthetic)
  {
    const double meanDiff = DescriptiveStats::computeMean(reference) -
      DescriptiveStats::computeMean(synthetic);
    const double sdDiff = DescriptiveStats::computePopulationStdDev(reference) -
      DescriptiveStats::computePopulationStdDev(synthetic);

    return std::sqrt(meanDiff * meanDiff + sdDiff * sdDiff);
  }

  QualityLevel FidelityScorer::classify(double overallScore)
  {
    if (overallScore >= kExcellentThreshold)
      return QualityLevel::Excellent;
    if (overallScore >= kGoodThreshold)
      return QualityLevel::Good;

    return QualityLevel::NeedsImprovement;
  }

  std::string FidelityScorer::summarize(double overallScore)
  {
    const QualityLevel level = classify(overallScore);

    std::ostringstream os;
    os << qualityLevelToString(level) << " - Quality score: "
       << std::fixed << std::setprecision(2) << overallScore << " - ";

    switch (level)
      {
      case QualityLevel::Excellent:
	os << "Production ready";
	break;
      case QualityLevel::Good:
	os << "Minor adjustments needed";
	break;
      case QualityLevel::NeedsImprovement:
	os << "Review parameters";
	break;
      }

    return os.str();
  }

  QualityReport FidelityScorer::score(const VitalsRecordList& reference,
				      const VitalsRecordList& synthetic,
				      std::size_t k) const
  {
    if (k == 0)
      throw InsufficientDataError("fidelity scoring needs k >= 1");

    if (reference.size() < k || synthetic.size() < k)
      {
	std::ostringstream os;
	os << "fidelity scoring needs at least k = " << k << " rows in each dataset (reference "
	   << reference.size() << ", synthetic " << synthetic.size() << ")";
	throw InsufficientDataError(os.str());
      }

    QualityReport report;

    double wassersteinSum = 0.0;
    double rmseSum = 0.0;
    for (VitalsColumn column : numericColumns())
      {
	const std::vector<double> ref = columnValues(reference, column);
	const std::vector<double> syn = columnValues(synthetic, column);

	const double w = EmpiricalDistance::wasserstein(ref, syn);
	const double rmse = momentRmse(ref, syn);

	report.wassersteinDistances[column] = w;
	report.ksDistances[column] = EmpiricalDistance::kolmogorovSmirnov(ref, syn);
	report.rmseByColumn[column] = rmse;
	wassersteinSum += w;
	rmseSum += rmse;
      }

    const VitalsMatrix refMatrix = toVitalsMatrix(reference);
    const VitalsMatrix synMatrix = toVitalsMatrix(synthetic);

    report.correlationPreservation = correlationPreservation(refMatrix, synMatrix);

    KnnImputationEvaluator knn(k, mOptions.maskFraction, mOptions.maxMaskedRows, mOptions.maskSeed);
    auto executor = concurrency::makeExecutor(mOptions.threads);
    report.knnImputationScore = knn.evaluate(refMatrix, synMatrix, *executor).score;

    const SummaryStats nn = DescriptiveStats::summarize(nearestNeighborDistances(refMatrix, synMatrix));
    report.nearestNeighborDistances = NearestNeighborStats{nn.mean, nn.median, nn.min, nn.max, nn.stdDev};

    const double columns = static_cast<double>(kNumNumericColumns);
    const double wassersteinScore = 1.0 / (1.0 + (wassersteinSum / columns) / 5.0);
    const double rmseScore = 1.0 / (1.0 + (rmseSum / columns) / 10.0);

    const double overall = 0.25 * wassersteinScore + 0.25 * rmseScore +
      0.25 * report.correlationPreservation + 0.25 * report.knnImputationScore;

    report.overallQualityScore = std::min(1.0, std::max(0.0, overall));
    report.qualityLevel = classify(report.overallQualityScore);
    report.summary = summarize(report.overallQualityScore);

    return report;
  }
} // namespace trialsynth
