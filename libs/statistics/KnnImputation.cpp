// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "KnnImputation.h"
#include "ParallelFor.h"
#include "RngUtils.h"
#include "VitalsException.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace trialsynth
{
  namespace
  {
    double safeScale(double sd)
    {
      return (sd > 0.0) ? sd : 1.0;
    }
  }

  KnnImputationEvaluator::KnnImputationEvaluator(std::size_t k,
						 double maskFraction,
						 std::size_t maxMaskedRows,
						 uint64_t maskSeed)
    : mK(k),
      mMaskFraction(maskFraction),
      mMaxMaskedRows(maxMaskedRows),
      mMaskSeed(maskSeed)
  {
    if (mK == 0)
      throw InsufficientDataError("K-NN imputation needs k >= 1");

    if (!(mMaskFraction > 0.0) || mMaskFraction > 1.0)
      throw SchemaError("mask fraction must lie in (0, 1]");

    if (mMaxMaskedRows == 0)
      throw SchemaError("K-NN imputation needs max masked rows >= 1");
  }

  std::vector<MaskedCell> KnnImputationEvaluator::selectMaskedCells(std::size_t referenceRows) const
  {
    std::vector<MaskedCell> cells;
    if (referenceRows == 0)
      return cells;

    std::size_t count = static_cast<std::size_t>(std::llround(mMaskFraction * referenceRows));
    count = std::max<std::size_t>(count, 1);
    count = std::min(count, std::min(mMaxMaskedRows, referenceRows));

    rng_utils::CRNEngineProvider<> provider(
      rng_utils::CRNKey(mMaskSeed, {rng_utils::tag_from_name("knn-mask")}));
    auto engine = provider.make_engine(0);

    // Partial Fisher-Yates: the first `count` slots become the masked rows.
    std::vector<std::size_t> rows(referenceRows);
    std::iota(rows.begin(), rows.end(), 0);
    for (std::size_t i = 0; i < count; ++i)
      {
	const std::size_t j = i + rng_utils::get_random_index(engine, referenceRows - i);
	std::swap(rows[i], rows[j]);
      }

    cells.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
      cells.push_back(MaskedCell{rows[i], rng_utils::get_random_index(engine, kNumNumericColumns)});

    return cells;
  }

  KnnImputationResult KnnImputationEvaluator::evaluate(const VitalsMatrix& reference,
						       const VitalsMatrix& synthetic,
						       concurrency::IParallelExecutor& executor) const
  {
    const Eigen::Index n = reference.rows();
    const Eigen::Index m = synthetic.rows();

    if (static_cast<std::size_t>(n) < mK || static_cast<std::size_t>(m) < mK)
      throw InsufficientDataError("K-NN imputation needs at least k rows in each dataset");

    const Eigen::RowVector4d mean = reference.colwise().mean();
    Eigen::RowVector4d scale;
    for (Eigen::Index c = 0; c < 4; ++c)
      {
	const double var = (reference.col(c).array() - mean(c)).square().mean();
	scale(c) = safeScale(std::sqrt(var));
      }

    VitalsMatrix pool(n + m, 4);
    pool.topRows(n) = reference;
    pool.bottomRows(m) = synthetic;
    const VitalsMatrix zPool = ((pool.rowwise() - mean).array().rowwise() / scale.array()).matrix();

    const std::vector<MaskedCell> cells = selectMaskedCells(static_cast<std::size_t>(n));
    std::vector<double> squaredErrors(cells.size(), 0.0);

    concurrency::parallel_for(static_cast<uint32_t>(cells.size()), executor,
      [&](uint32_t slot) {
	const MaskedCell& cell = cells[slot];
	const Eigen::Index row = static_cast<Eigen::Index>(cell.row);
	const Eigen::Index masked = static_cast<Eigen::Index>(cell.maskedColumn);

	Eigen::RowVector4d featureMask = Eigen::RowVector4d::Ones();
	featureMask(masked) = 0.0;

	const Eigen::RowVector4d query = zPool.row(row);
	const Eigen::VectorXd distances =
	  ((zPool.rowwise() - query).array().rowwise() * featureMask.array())
	  .square().rowwise().sum().sqrt().matrix();

	std::vector<Eigen::Index> candidates;
	candidates.reserve(static_cast<std::size_t>(zPool.rows()));
	for (Eigen::Index i = 0; i < zPool.rows(); ++i)
	  if (i != row)
	    candidates.push_back(i);

	const std::size_t k = std::min(mK, candidates.size());
	std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(k),
			  candidates.end(),
			  [&distances](Eigen::Index a, Eigen::Index b) {
			    if (distances(a) != distances(b))
			      return distances(a) < distances(b);
			    return a < b;
			  });

	double imputed = 0.0;
	if (distances(candidates[0]) == 0.0)
	  {
	    double sum = 0.0;
	    std::size_t exact = 0;
	    for (std::size_t i = 0; i < k && distances(candidates[i]) == 0.0; ++i, ++exact)
	      sum += pool(candidates[i], masked);
	    imputed = sum / static_cast<double>(exact);
	  }
	else
	  {
	    double weighted = 0.0;
	    double totalWeight = 0.0;
	    for (std::size_t i = 0; i < k; ++i)
	      {
		const double w = 1.0 / distances(candidates[i]);
		weighted += w * pool(candidates[i], masked);
		totalWeight += w;
	      }
	    imputed = weighted / totalWeight;
	  }

	const double error = (imputed - reference(row, masked)) / scale(masked);
	squaredErrors[slot] = error * error;
      });

    double sum = 0.0;
    for (double e : squaredErrors)
      sum += e;

    const double nrmse = cells.empty() ? 0.0 : std::sqrt(sum / static_cast<double>(cells.size()));
    return KnnImputationResult{1.0 / (1.0 + nrmse), nrmse, cells.size()};
  }

  std::vector<double> nearestNeighborDistances(const VitalsMatrix& reference,
					       const VitalsMatrix& synthetic,
					       std::size_t maxReferenceRows)
  {
    std::vector<double> distances;
    if (reference.rows() == 0 || synthetic.rows() == 0)
      return distances;

    const Eigen::Index rows = std::min<Eigen::Index>(reference.rows(),
						     static_cast<Eigen::Index>(maxReferenceRows));
    distances.reserve(static_cast<std::size_t>(rows));

    for (Eigen::Index r = 0; r < rows; ++r)
      {
	const Eigen::RowVector4d point = reference.row(r);
	distances.push_back(std::sqrt((synthetic.rowwise() - point).rowwise().squaredNorm().minCoeff()));
      }

    return distances;
  }
} // namespace trialsynth
