// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_GENERATION_REQUEST_H
#define __TRIALSYNTH_GENERATION_REQUEST_H 1

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include "VitalsRecord.h"

namespace trialsynth
{
  enum class GenerationMethod { Mvn, Bootstrap, Rules };

  /// "mvn", "bootstrap", "rules"
  std::string methodToString(GenerationMethod method);

  /// @throws SchemaError for an unknown method name
  GenerationMethod stringToMethod(const std::string& text);

  /**
   * @brief How the effect builds up over the visits before the endpoint.
   * EndpointOnly shifts the endpoint visit alone; Linear scales the shift by
   * visitIndex / endpointIndex and carries the full shift after the endpoint.
   */
  enum class EffectOnset { EndpointOnly, Linear };

  std::string onsetToString(EffectOnset onset);
  EffectOnset stringToOnset(const std::string& text);

  /**
   * @brief Additive adds targetEffect to Active SystolicBP; Snap adds
   * targetEffect - (mean Active - mean Placebo) so that the observed endpoint
   * difference lands on the target.
   */
  enum class EffectMode { Additive, Snap };

  std::string modeToString(EffectMode mode);
  EffectMode stringToMode(const std::string& text);

  struct ColumnBaseline
  {
    double mean;
    double stdDev;
  };

  /// Per-column baseline parameters supplied by an upstream provider; may be partial.
  using BaselineStatistics = std::map<VitalsColumn, ColumnBaseline>;

  /**
   * @class GenerationRequest
   * @brief Immutable, validated description of one generation call.
   */
  class GenerationRequest
  {
  public:
    static constexpr double kDefaultJitterFraction = 0.1;

    /**
     * @throws SchemaError if nPerArm is zero, targetEffect is not finite,
     * jitterFraction is given for a method other than bootstrap or lies
     * outside [0, 1], or a baseline has a non-finite mean or non-positive sd
     */
    GenerationRequest(std::size_t nPerArm,
		      double targetEffect,
		      GenerationMethod method,
		      std::optional<uint64_t> seed = std::nullopt,
		      std::optional<double> jitterFraction = std::nullopt,
		      Visit endpointVisit = Visit::Week12,
		      EffectOnset onset = EffectOnset::EndpointOnly,
		      EffectMode mode = EffectMode::Additive,
		      std::optional<BaselineStatistics> baseline = std::nullopt);

    std::size_t getSubjectsPerArm() const
    {
      return mSubjectsPerArm;
    }

    std::size_t getExpectedRecordCount() const
    {
      return mSubjectsPerArm * kNumArms * kNumVisits;
    }

    double getTargetEffect() const
    {
      return mTargetEffect;
    }

    GenerationMethod getMethod() const
    {
      return mMethod;
    }

    const std::optional<uint64_t>& getSeed() const
    {
      return mSeed;
    }

    /// The explicit jitter fraction, or the default for bootstrap requests.
    double getJitterFraction() const
    {
      return mJitterFraction.value_or(kDefaultJitterFraction);
    }

    Visit getEndpointVisit() const
    {
      return mEndpointVisit;
    }

    EffectOnset getEffectOnset() const
    {
      return mOnset;
    }

    EffectMode getEffectMode() const
    {
      return mMode;
    }

    const std::optional<BaselineStatistics>& getBaseline() const
    {
      return mBaseline;
    }

    /// Returns the same request with the seed replaced.
    GenerationRequest withSeed(uint64_t seed) const;

  private:
    std::size_t mSubjectsPerArm;
    double mTargetEffect;
    GenerationMethod mMethod;
    std::optional<uint64_t> mSeed;
    std::optional<double> mJitterFraction;
    Visit mEndpointVisit;
    EffectOnset mOnset;
    EffectMode mMode;
    std::optional<BaselineStatistics> mBaseline;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_GENERATION_REQUEST_H
