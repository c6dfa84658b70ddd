// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_VITALS_MATRIX_H
#define __TRIALSYNTH_VITALS_MATRIX_H 1

#include <Eigen/Dense>
#include "VitalsRecord.h"

namespace trialsynth
{
  using VitalsMatrix = Eigen::Matrix<double, Eigen::Dynamic, 4>;
  using Matrix4 = Eigen::Matrix4d;
  using Vector4 = Eigen::Vector4d;

  /// One row per record, one column per VitalsColumn in numericColumns() order.
  inline VitalsMatrix toVitalsMatrix(const VitalsRecordList& records)
  {
    VitalsMatrix m(static_cast<Eigen::Index>(records.size()), 4);
    for (std::size_t r = 0; r < records.size(); ++r)
      for (VitalsColumn column : numericColumns())
	m(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(columnIndex(column))) =
	  records[r].getValue(column);

    return m;
  }

  /**
   * @brief Pearson correlation matrix of the four vitals columns.
   *
   * A column with zero variance has correlation 0 with every other column and
   * 1 with itself. Fewer than two rows yields the identity.
   */
  Matrix4 pearsonCorrelation(const VitalsMatrix& data);

  /// Unbiased (n - 1) covariance; zero for fewer than two rows.
  Matrix4 sampleCovariance(const VitalsMatrix& data);
} // namespace trialsynth

#endif // __TRIALSYNTH_VITALS_MATRIX_H
