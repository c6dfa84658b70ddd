// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "VitalsRecord.h"
#include "VitalsException.h"
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace trialsynth
{
  const std::array<Visit, kNumVisits>& allVisits()
  {
    static const std::array<Visit, kNumVisits> visits =
      { Visit::Screening, Visit::Day1, Visit::Week4, Visit::Week12 };
    return visits;
  }

  const std::array<TreatmentArm, kNumArms>& allArms()
  {
    static const std::array<TreatmentArm, kNumArms> arms =
      { TreatmentArm::Active, TreatmentArm::Placebo };
    return arms;
  }

  const std::array<VitalsColumn, kNumNumericColumns>& numericColumns()
  {
    static const std::array<VitalsColumn, kNumNumericColumns> columns =
      { VitalsColumn::SystolicBP, VitalsColumn::DiastolicBP,
	VitalsColumn::HeartRate, VitalsColumn::Temperature };
    return columns;
  }

  std::string visitToString(Visit visit)
  {
    switch (visit)
      {
      case Visit::Screening:
	return "Screening";
      case Visit::Day1:
	return "Day 1";
      case Visit::Week4:
	return "Week 4";
      case Visit::Week12:
	return "Week 12";
      }
    throw SchemaError("visitToString: unknown visit value");
  }

  std::optional<Visit> tryParseVisit(const std::string& text)
  {
    // Compare on the trimmed, lower-cased text with inner blanks removed so that
    // "Week 12", "week12" and " WEEK 12 " all resolve.
    std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
    boost::algorithm::erase_all(key, " ");

    if (key == "screening")
      return Visit::Screening;
    if (key == "day1")
      return Visit::Day1;
    if (key == "week4")
      return Visit::Week4;
    if (key == "week12")
      return Visit::Week12;

    return std::nullopt;
  }

  Visit stringToVisit(const std::string& text)
  {
    auto visit = tryParseVisit(text);
    if (!visit)
      throw SchemaError("unknown VisitName '" + text + "'");

    return *visit;
  }

  std::string armToString(TreatmentArm arm)
  {
    return (arm == TreatmentArm::Active) ? "Active" : "Placebo";
  }

  std::optional<TreatmentArm> tryParseArm(const std::string& text)
  {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));

    if (key == "active")
      return TreatmentArm::Active;
    if (key == "placebo")
      return TreatmentArm::Placebo;

    return std::nullopt;
  }

  TreatmentArm stringToArm(const std::string& text)
  {
    auto arm = tryParseArm(text);
    if (!arm)
      throw SchemaError("unknown TreatmentArm '" + text + "'");

    return *arm;
  }

  std::string columnName(VitalsColumn column)
  {
    switch (column)
      {
      case VitalsColumn::SystolicBP:
	return "SystolicBP";
      case VitalsColumn::DiastolicBP:
	return "DiastolicBP";
      case VitalsColumn::HeartRate:
	return "HeartRate";
      case VitalsColumn::Temperature:
	return "Temperature";
      }
    throw SchemaError("columnName: unknown column value");
  }

  std::optional<VitalsColumn> tryParseColumn(const std::string& text)
  {
    const std::string key = boost::algorithm::trim_copy(text);
    for (VitalsColumn column : numericColumns())
      {
	if (boost::algorithm::iequals(key, columnName(column)))
	  return column;
      }

    return std::nullopt;
  }

  double roundToNativePrecision(VitalsColumn column, double value)
  {
    if (column == VitalsColumn::Temperature)
      return std::round(value * 10.0) / 10.0;

    return std::round(value);
  }

  double VitalsRecord::getValue(VitalsColumn column) const
  {
    switch (column)
      {
      case VitalsColumn::SystolicBP:
	return static_cast<double>(systolicBP);
      case VitalsColumn::DiastolicBP:
	return static_cast<double>(diastolicBP);
      case VitalsColumn::HeartRate:
	return static_cast<double>(heartRate);
      case VitalsColumn::Temperature:
	return temperature;
      }
    throw SchemaError("VitalsRecord::getValue: unknown column value");
  }

  namespace
  {
    // Saturates at the int range so narrowing never overflows; the clinical
    // clamp in the constraint enforcer then lands on the nearest bound.
    int toStoredInt(double rounded)
    {
      const double lo = static_cast<double>(std::numeric_limits<int>::min());
      const double hi = static_cast<double>(std::numeric_limits<int>::max());
      return static_cast<int>(std::min(std::max(rounded, lo), hi));
    }
  }

  void VitalsRecord::setValue(VitalsColumn column, double value)
  {
    if (std::isnan(value))
      throw RangeViolationError(subjectId + " " + columnName(column) + ": value is not a number");

    const double rounded = roundToNativePrecision(column, value);

    switch (column)
      {
      case VitalsColumn::SystolicBP:
	systolicBP = toStoredInt(rounded);
	break;
      case VitalsColumn::DiastolicBP:
	diastolicBP = toStoredInt(rounded);
	break;
      case VitalsColumn::HeartRate:
	heartRate = toStoredInt(rounded);
	break;
      case VitalsColumn::Temperature:
	temperature = rounded;
	break;
      }
  }

  bool VitalsRecord::operator==(const VitalsRecord& rhs) const
  {
    return subjectId == rhs.subjectId &&
      visit == rhs.visit &&
      arm == rhs.arm &&
      systolicBP == rhs.systolicBP &&
      diastolicBP == rhs.diastolicBP &&
      heartRate == rhs.heartRate &&
      temperature == rhs.temperature;
  }

  std::optional<double> RawVitalsRecord::getValue(VitalsColumn column) const
  {
    switch (column)
      {
      case VitalsColumn::SystolicBP:
	return systolicBP;
      case VitalsColumn::DiastolicBP:
	return diastolicBP;
      case VitalsColumn::HeartRate:
	return heartRate;
      case VitalsColumn::Temperature:
	return temperature;
      }
    return std::nullopt;
  }

  void RawVitalsRecord::setValue(VitalsColumn column, std::optional<double> value)
  {
    switch (column)
      {
      case VitalsColumn::SystolicBP:
	systolicBP = value;
	break;
      case VitalsColumn::DiastolicBP:
	diastolicBP = value;
	break;
      case VitalsColumn::HeartRate:
	heartRate = value;
	break;
      case VitalsColumn::Temperature:
	temperature = value;
	break;
      }
  }

  RawVitalsRecord toRawRecord(const VitalsRecord& record)
  {
    RawVitalsRecord raw;
    raw.subjectId = record.subjectId;
    raw.visitName = visitToString(record.visit);
    raw.treatmentArm = armToString(record.arm);

    for (VitalsColumn column : numericColumns())
      raw.setValue(column, record.getValue(column));

    return raw;
  }

  RawVitalsRecordList toRawRecords(const VitalsRecordList& records)
  {
    RawVitalsRecordList raw;
    raw.reserve(records.size());
    for (const auto& record : records)
      raw.push_back(toRawRecord(record));

    return raw;
  }

  std::vector<double> columnValues(const VitalsRecordList& records,
				   VitalsColumn column,
				   std::optional<Visit> visit,
				   std::optional<TreatmentArm> arm)
  {
    std::vector<double> values;
    values.reserve(records.size());

    for (const auto& record : records)
      {
	if (visit && record.visit != *visit)
	  continue;
	if (arm && record.arm != *arm)
	  continue;

	values.push_back(record.getValue(column));
      }

    return values;
  }
} // namespace trialsynth
