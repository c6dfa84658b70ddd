// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_CLINICAL_LIMITS_H
#define __TRIALSYNTH_CLINICAL_LIMITS_H 1

#include <algorithm>
#include <string>
#include "VitalsRecord.h"

namespace trialsynth
{
  /**
   * @brief Closed interval of clinically valid values for one column.
   */
  struct FieldRange
  {
    double min;
    double max;

    bool contains(double value) const noexcept
    {
      return value >= min && value <= max;
    }

    double clamp(double value) const noexcept
    {
      return std::min(std::max(value, min), max);
    }
  };

  struct ClinicalLimits
  {
    static constexpr FieldRange SystolicBP  { 95.0, 200.0 };
    static constexpr FieldRange DiastolicBP { 55.0, 130.0 };
    static constexpr FieldRange HeartRate   { 50.0, 120.0 };
    static constexpr FieldRange Temperature { 35.0, 40.0 };

    // SystolicBP must exceed DiastolicBP by at least this many mmHg.
    static constexpr int MinPulsePressure = 5;

    static const FieldRange& rangeFor(VitalsColumn column)
    {
      switch (column)
	{
	case VitalsColumn::SystolicBP:
	  return SystolicBP;
	case VitalsColumn::DiastolicBP:
	  return DiastolicBP;
	case VitalsColumn::HeartRate:
	  return HeartRate;
	case VitalsColumn::Temperature:
	  break;
	}
      return Temperature;
    }

    static std::string unitFor(VitalsColumn column)
    {
      if (column == VitalsColumn::HeartRate)
	return "bpm";
      if (column == VitalsColumn::Temperature)
	return "C";
      return "mmHg";
    }
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_CLINICAL_LIMITS_H
