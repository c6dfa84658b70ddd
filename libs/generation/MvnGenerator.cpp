// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "MvnGenerator.h"
#include "PriorParameters.h"
#include "RngUtils.h"
#include "VitalsException.h"
#include <algorithm>
#include <cmath>

namespace trialsynth
{
  Matrix4 regularizedCholesky(const Matrix4& covariance)
  {
    double jitter = MvnGenerator::kInitialJitter;

    for (int attempt = 0; attempt < MvnGenerator::kMaxJitterAttempts; ++attempt)
      {
	const Matrix4 jittered = covariance + jitter * Matrix4::Identity();
	Eigen::LLT<Matrix4> llt(jittered);
	if (llt.info() == Eigen::Success)
	  return Matrix4(llt.matrixL());

	jitter *= 10.0;
      }

    Matrix4 factor = Matrix4::Zero();
    for (Eigen::Index i = 0; i < 4; ++i)
      factor(i, i) = std::sqrt(std::max(covariance(i, i), 0.0) + jitter);

    return factor;
  }

  namespace
  {
    struct MvnStratum
    {
      Vector4 mean;
      Matrix4 choleskyFactor;
    };

    class MultivariateNormalSampler : public IStratumSampler
    {
    public:
      explicit MultivariateNormalSampler(std::vector<MvnStratum> strata)
	: mStrata(std::move(strata))
      {}

      VitalsSample draw(Visit visit, TreatmentArm arm, GeneratorEngine& engine) const override
      {
	const MvnStratum& stratum = mStrata[stratumIndex(visit, arm)];

	Vector4 z;
	for (Eigen::Index c = 0; c < 4; ++c)
	  z(c) = rng_utils::get_random_normal(engine, 0.0, 1.0);

	const Vector4 x = stratum.mean + stratum.choleskyFactor * z;

	VitalsSample sample;
	for (std::size_t c = 0; c < kNumNumericColumns; ++c)
	  sample[c] = x(static_cast<Eigen::Index>(c));

	return sample;
      }

    private:
      std::vector<MvnStratum> mStrata;
    };

    MvnStratum priorStratum(const PriorParameters& prior)
    {
      MvnStratum stratum;
      Matrix4 covariance = Matrix4::Zero();
      for (std::size_t c = 0; c < kNumNumericColumns; ++c)
	{
	  const auto i = static_cast<Eigen::Index>(c);
	  stratum.mean(i) = prior.mean[c];
	  covariance(i, i) = prior.stdDev[c] * prior.stdDev[c];
	}

      stratum.choleskyFactor = regularizedCholesky(covariance);
      return stratum;
    }
  }

  std::unique_ptr<IStratumSampler>
  MvnGenerator::createSampler(const GenerationRequest& request,
			      const VitalsRecordList& reference) const
  {
    if (reference.empty())
      throw InsufficientDataError("MVN generation needs a non-empty reference dataset");

    const PriorParameters prior = PriorParameters::fromBaseline(request.getBaseline());
    std::vector<MvnStratum> strata(kNumStrata);

    for (Visit visit : allVisits())
      {
	for (TreatmentArm arm : allArms())
	  {
	    const VitalsRecordList rows = stratumRecords(reference, visit, arm);
	    MvnStratum& stratum = strata[stratumIndex(visit, arm)];

	    if (rows.size() < kMinStratumRows)
	      {
		stratum = priorStratum(prior);
		continue;
	      }

	    const VitalsMatrix data = toVitalsMatrix(rows);
	    stratum.mean = data.colwise().mean().transpose();
	    stratum.choleskyFactor = regularizedCholesky(sampleCovariance(data));
	  }
      }

    return std::make_unique<MultivariateNormalSampler>(std::move(strata));
  }
} // namespace trialsynth
