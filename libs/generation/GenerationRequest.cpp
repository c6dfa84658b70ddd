// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "GenerationRequest.h"
#include "VitalsException.h"
#include <boost/algorithm/string.hpp>
#include <cmath>

namespace trialsynth
{
  std::string methodToString(GenerationMethod method)
  {
    switch (method)
      {
      case GenerationMethod::Mvn:
	return "mvn";
      case GenerationMethod::Bootstrap:
	return "bootstrap";
      case GenerationMethod::Rules:
	return "rules";
      }
    throw SchemaError("methodToString: unknown method value");
  }

  GenerationMethod stringToMethod(const std::string& text)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (key == "mvn")
      return GenerationMethod::Mvn;
    if (key == "bootstrap")
      return GenerationMethod::Bootstrap;
    if (key == "rules")
      return GenerationMethod::Rules;

    throw SchemaError("unknown generation method '" + text + "' (expected mvn, bootstrap or rules)");
  }

  std::string onsetToString(EffectOnset onset)
  {
    return (onset == EffectOnset::Linear) ? "linear" : "endpoint-only";
  }

  EffectOnset stringToOnset(const std::string& text)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (key == "endpoint-only")
      return EffectOnset::EndpointOnly;
    if (key == "linear")
      return EffectOnset::Linear;

    throw SchemaError("unknown effect onset '" + text + "' (expected endpoint-only or linear)");
  }

  std::string modeToString(EffectMode mode)
  {
    return (mode == EffectMode::Snap) ? "snap" : "additive";
  }

  EffectMode stringToMode(const std::string& text)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (key == "additive")
      return EffectMode::Additive;
    if (key == "snap")
      return EffectMode::Snap;

    throw SchemaError("unknown effect mode '" + text + "' (expected additive or snap)");
  }

  GenerationRequest::GenerationRequest(std::size_t nPerArm,
				       double targetEffect,
				       GenerationMethod method,
				       std::optional<uint64_t> seed,
				       std::optional<double> jitterFraction,
				       Visit endpointVisit,
				       EffectOnset onset,
				       EffectMode mode,
				       std::optional<BaselineStatistics> baseline)
    : mSubjectsPerArm(nPerArm),
      mTargetEffect(targetEffect),
      mMethod(method),
      mSeed(seed),
      mJitterFraction(jitterFraction),
      mEndpointVisit(endpointVisit),
      mOnset(onset),
      mMode(mode),
      mBaseline(std::move(baseline))
  {
    if (mSubjectsPerArm == 0)
      throw SchemaError("n_per_arm must be at least 1");

    if (!std::isfinite(mTargetEffect))
      throw SchemaError("target_effect must be a finite number");

    if (mJitterFraction)
      {
	if (mMethod != GenerationMethod::Bootstrap)
	  throw SchemaError("jitter_frac applies only to the bootstrap method, not " +
			    methodToString(mMethod));

	if (!(*mJitterFraction >= 0.0 && *mJitterFraction <= 1.0))
	  throw SchemaError("jitter_frac must lie in [0, 1]");
      }

    if (mBaseline)
      {
	for (const auto& entry : *mBaseline)
	  {
	    if (!std::isfinite(entry.second.mean) || !(entry.second.stdDev > 0.0) ||
		!std::isfinite(entry.second.stdDev))
	      throw SchemaError("baseline for " + columnName(entry.first) +
				" needs a finite mean and a positive standard deviation");
	  }
      }
  }

  GenerationRequest GenerationRequest::withSeed(uint64_t seed) const
  {
    GenerationRequest copy(*this);
    copy.mSeed = seed;
    return copy;
  }
} // namespace trialsynth
