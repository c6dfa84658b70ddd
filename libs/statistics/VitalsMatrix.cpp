// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "VitalsMatrix.h"
#include <cmath>

namespace trialsynth
{
  namespace
  {
    Matrix4 centeredCrossProduct(const VitalsMatrix& data)
    {
      const Eigen::RowVector4d mean = data.colwise().mean();
      const VitalsMatrix centered = data.rowwise() - mean;
      return centered.transpose() * centered;
    }
  }

  Matrix4 sampleCovariance(const VitalsMatrix& data)
  {
    const Eigen::Index n = data.rows();
    if (n < 2)
      return Matrix4::Zero();

    return centeredCrossProduct(data) / static_cast<double>(n - 1);
  }

  Matrix4 pearsonCorrelation(const VitalsMatrix& data)
  {
    Matrix4 corr = Matrix4::Identity();
    if (data.rows() < 2)
      return corr;

    const Matrix4 cross = centeredCrossProduct(data);

    for (Eigen::Index i = 0; i < 4; ++i)
      for (Eigen::Index j = 0; j < 4; ++j)
	{
	  if (i == j)
	    continue;

	  const double denom = std::sqrt(cross(i, i) * cross(j, j));
	  corr(i, j) = (denom > 0.0) ? cross(i, j) / denom : 0.0;
	}

    return corr;
  }
} // namespace trialsynth
