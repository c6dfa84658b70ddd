// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_IVITALS_GENERATOR_H
#define __TRIALSYNTH_IVITALS_GENERATOR_H 1

#include <array>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include "GenerationRequest.h"
#include "VitalsRecord.h"

namespace trialsynth
{
  using GeneratorEngine = std::mt19937_64;

  using VitalsSample = std::array<double, kNumNumericColumns>;

  /**
   * @brief Draws unrounded vitals for one stratum (visit, arm).
   *
   * A sampler is built for a single generate call and discarded afterwards;
   * it holds only the parameters estimated from that call's reference.
   */
  class IStratumSampler
  {
  public:
    virtual ~IStratumSampler() = default;

    virtual VitalsSample draw(Visit visit, TreatmentArm arm, GeneratorEngine& engine) const = 0;
  };

  /**
   * @class IVitalsGenerator
   * @brief Common driver for the generation strategies.
   *
   * generate() lays out subjects RA001-001 .. RA001-{2n} with the Active arm
   * first and emits records ordered arm, subject, visit. Subject i draws all of
   * its visits from its own engine seeded from (masterSeed, method tag, i), so
   * the output depends only on the request, the reference and the seed.
   */
  class IVitalsGenerator
  {
  public:
    virtual ~IVitalsGenerator() = default;

    virtual GenerationMethod getMethod() const = 0;

    /**
     * @brief Produces exactly subjectsPerArm x 2 x 4 enforced records.
     * @throws InsufficientDataError when the strategy needs reference rows it
     * does not have
     */
    VitalsRecordList generate(const GenerationRequest& request,
			      const VitalsRecordList& reference,
			      uint64_t masterSeed) const;

    /// "RA001-001" for subject index 0
    static std::string subjectIdFor(std::size_t subjectIndex);

  protected:
    virtual std::unique_ptr<IStratumSampler>
    createSampler(const GenerationRequest& request, const VitalsRecordList& reference) const = 0;
  };

  /// Index into per-stratum tables: visit-major, arm-minor.
  inline std::size_t stratumIndex(Visit visit, TreatmentArm arm)
  {
    return visitIndex(visit) * kNumArms + armIndex(arm);
  }

  constexpr std::size_t kNumStrata = kNumVisits * kNumArms;

  /// Reference rows that fall in one stratum.
  VitalsRecordList stratumRecords(const VitalsRecordList& reference, Visit visit, TreatmentArm arm);
} // namespace trialsynth

#endif // __TRIALSYNTH_IVITALS_GENERATOR_H
