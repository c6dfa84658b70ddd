// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ConstraintEnforcer.h"
#include "ClinicalLimits.h"
#include "VitalsException.h"
#include <sstream>

namespace trialsynth
{
  namespace
  {
    std::string describe(const VitalsRecord& record, std::size_t recordIndex)
    {
      std::ostringstream os;
      os << "record " << recordIndex << " (" << record.subjectId << ", "
	 << visitToString(record.visit) << ")";
      return os.str();
    }
  }

  VitalsRecord ConstraintEnforcer::enforce(const VitalsRecord& record)
  {
    VitalsRecord result(record);

    for (VitalsColumn column : numericColumns())
      {
	const FieldRange& range = ClinicalLimits::rangeFor(column);
	result.setValue(column, range.clamp(result.getValue(column)));
      }

    const int minGap = ClinicalLimits::MinPulsePressure;
    if (result.systolicBP - result.diastolicBP >= minGap)
      return result;

    // A swap is accepted only if both pressures remain inside their ranges.
    const int swappedSystolic = result.diastolicBP;
    const int swappedDiastolic = result.systolicBP;
    if (swappedSystolic - swappedDiastolic >= minGap &&
	ClinicalLimits::SystolicBP.contains(swappedSystolic) &&
	ClinicalLimits::DiastolicBP.contains(swappedDiastolic))
      {
	result.systolicBP = swappedSystolic;
	result.diastolicBP = swappedDiastolic;
	return result;
      }

    result.setValue(VitalsColumn::DiastolicBP,
		    ClinicalLimits::DiastolicBP.clamp(result.systolicBP - minGap));
    return result;
  }

  VitalsRecordList ConstraintEnforcer::enforce(const VitalsRecordList& records)
  {
    VitalsRecordList result;
    result.reserve(records.size());

    for (const auto& record : records)
      result.push_back(enforce(record));

    return result;
  }

  VitalsRecord ConstraintEnforcer::fromSample(const std::string& subjectId,
					      Visit visit,
					      TreatmentArm arm,
					      const std::array<double, kNumNumericColumns>& values)
  {
    VitalsRecord record;
    record.subjectId = subjectId;
    record.visit = visit;
    record.arm = arm;

    for (VitalsColumn column : numericColumns())
      record.setValue(column, values[columnIndex(column)]);

    return enforce(record);
  }

  bool ConstraintEnforcer::satisfies(const VitalsRecord& record) noexcept
  {
    for (VitalsColumn column : numericColumns())
      {
	if (!ClinicalLimits::rangeFor(column).contains(record.getValue(column)))
	  return false;
      }

    return record.systolicBP - record.diastolicBP >= ClinicalLimits::MinPulsePressure;
  }

  void ConstraintEnforcer::verify(const VitalsRecord& record, std::size_t recordIndex)
  {
    for (VitalsColumn column : numericColumns())
      {
	const FieldRange& range = ClinicalLimits::rangeFor(column);
	const double value = record.getValue(column);

	if (!range.contains(value))
	  {
	    std::ostringstream os;
	    os << describe(record, recordIndex) << " field " << columnName(column)
	       << " value " << value << " outside [" << range.min << ", " << range.max << "]";
	    throw RangeViolationError(os.str());
	  }
      }

    if (record.systolicBP - record.diastolicBP < ClinicalLimits::MinPulsePressure)
      {
	std::ostringstream os;
	os << describe(record, recordIndex) << " field DiastolicBP: SystolicBP "
	   << record.systolicBP << " does not exceed DiastolicBP " << record.diastolicBP
	   << " by " << ClinicalLimits::MinPulsePressure;
	throw RangeViolationError(os.str());
      }
  }

  void ConstraintEnforcer::verify(const VitalsRecordList& records)
  {
    for (std::size_t i = 0; i < records.size(); ++i)
      verify(records[i], i);
  }
} // namespace trialsynth
