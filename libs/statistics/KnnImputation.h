// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_KNN_IMPUTATION_H
#define __TRIALSYNTH_KNN_IMPUTATION_H 1

#include <cstddef>
#include <cstdint>
#include <vector>
#include "VitalsMatrix.h"
#include "IParallelExecutor.h"

namespace trialsynth
{
  /**
   * @brief One reference row whose value in maskedColumn is withheld.
   */
  struct MaskedCell
  {
    std::size_t row;
    std::size_t maskedColumn;
  };

  struct KnnImputationResult
  {
    double score;              // 1 / (1 + normalizedRmse)
    double normalizedRmse;
    std::size_t maskedCells;
  };

  /**
   * @class KnnImputationEvaluator
   * @brief Measures how well synthetic rows help recover withheld reference values.
   *
   * A seeded subset of reference rows has one field hidden each. Every hidden
   * value is imputed from the k nearest rows of the pool (all other reference
   * rows plus every synthetic row), using Euclidean distance on the three
   * remaining fields after z-scoring with the reference mean and standard
   * deviation. Neighbours are weighted by inverse distance; when any of them
   * sits at distance zero only the exact matches contribute. Ties in distance
   * are broken by pool index, so the result does not depend on the executor.
   */
  class KnnImputationEvaluator
  {
  public:
    /**
     * @throws InsufficientDataError if k is zero
     * @throws SchemaError if maskFraction is outside (0, 1] or maxMaskedRows is zero
     */
    KnnImputationEvaluator(std::size_t k,
			   double maskFraction,
			   std::size_t maxMaskedRows,
			   uint64_t maskSeed);

    /**
     * @brief Picks the masked cells for a reference of referenceRows rows.
     * Deterministic for a given seed; at least one row is masked.
     */
    std::vector<MaskedCell> selectMaskedCells(std::size_t referenceRows) const;

    KnnImputationResult evaluate(const VitalsMatrix& reference,
				 const VitalsMatrix& synthetic,
				 concurrency::IParallelExecutor& executor) const;

  private:
    std::size_t mK;
    double mMaskFraction;
    std::size_t mMaxMaskedRows;
    uint64_t mMaskSeed;
  };

  /**
   * @brief Distance from each of the first maxReferenceRows reference rows to
   * its nearest synthetic row, in raw units over all four columns.
   */
  std::vector<double> nearestNeighborDistances(const VitalsMatrix& reference,
					       const VitalsMatrix& synthetic,
					       std::size_t maxReferenceRows = 100);
} // namespace trialsynth

#endif // __TRIALSYNTH_KNN_IMPUTATION_H
