// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_CONSTRAINT_ENFORCER_H
#define __TRIALSYNTH_CONSTRAINT_ENFORCER_H 1

#include <array>
#include <string>
#include "VitalsRecord.h"

namespace trialsynth
{
  /**
   * @class ConstraintEnforcer
   * @brief Forces records into the clinically valid region.
   *
   * Two steps in fixed order:
   *  1. clip every numeric field to its ClinicalLimits range
   *  2. if SystolicBP - DiastolicBP < MinPulsePressure, swap the two pressures
   *     when the swap alone resolves it, otherwise set DiastolicBP to
   *     SystolicBP - MinPulsePressure and clip DiastolicBP again.
   *
   * Stateless; every method is a pure function of its arguments.
   */
  class ConstraintEnforcer
  {
  public:
    static VitalsRecord enforce(const VitalsRecord& record);
    static VitalsRecordList enforce(const VitalsRecordList& records);

    /**
     * @brief Builds a record from unrounded sample values (column order of
     * numericColumns()), rounding to native precision and enforcing.
     */
    static VitalsRecord fromSample(const std::string& subjectId,
				   Visit visit,
				   TreatmentArm arm,
				   const std::array<double, kNumNumericColumns>& values);

    /// true when every range and the BP differential hold
    static bool satisfies(const VitalsRecord& record) noexcept;

    /**
     * @brief Checks every invariant.
     * @throws RangeViolationError naming the record index, subject, visit and field
     */
    static void verify(const VitalsRecordList& records);
    static void verify(const VitalsRecord& record, std::size_t recordIndex = 0);

  private:
    ConstraintEnforcer() = delete;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_CONSTRAINT_ENFORCER_H
