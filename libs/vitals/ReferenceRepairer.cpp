// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ReferenceRepairer.h"
#include "ClinicalLimits.h"
#include "ConstraintEnforcer.h"
#include "VitalsException.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <set>
#include <sstream>

namespace trialsynth
{
  namespace
  {
    struct WorkingRecord
    {
      std::string subjectId;
      Visit visit;
      TreatmentArm arm;
      std::array<std::optional<double>, kNumNumericColumns> values;
    };

    std::string formatValue(VitalsColumn column, double value)
    {
      std::ostringstream os;
      if (column == VitalsColumn::Temperature)
	os << value;
      else
	os << static_cast<long long>(std::llround(value));
      return os.str();
    }

    double median(std::vector<double> values)
    {
      std::sort(values.begin(), values.end());
      const std::size_t n = values.size();
      if (n % 2 == 1)
	return values[n / 2];

      return 0.5 * (values[n / 2 - 1] + values[n / 2]);
    }

    [[noreturn]] void throwSchema(std::size_t recordIndex, const std::string& field,
				  const std::string& problem)
    {
      std::ostringstream os;
      os << "record " << recordIndex << " field " << field << ": " << problem;
      throw SchemaError(os.str());
    }

    std::vector<WorkingRecord> parseIdentity(const RawVitalsRecordList& rawRecords)
    {
      std::vector<WorkingRecord> working;
      working.reserve(rawRecords.size());

      for (std::size_t i = 0; i < rawRecords.size(); ++i)
	{
	  const RawVitalsRecord& raw = rawRecords[i];

	  if (!raw.subjectId || raw.subjectId->empty())
	    throwSchema(i, "SubjectID", "missing");
	  if (!raw.visitName)
	    throwSchema(i, "VisitName", "missing");
	  if (!raw.treatmentArm)
	    throwSchema(i, "TreatmentArm", "missing");

	  auto visit = tryParseVisit(*raw.visitName);
	  if (!visit)
	    throwSchema(i, "VisitName", "unrecognised value '" + *raw.visitName + "'");

	  auto arm = tryParseArm(*raw.treatmentArm);
	  if (!arm)
	    throwSchema(i, "TreatmentArm", "unrecognised value '" + *raw.treatmentArm + "'");

	  WorkingRecord record{*raw.subjectId, *visit, *arm, {}};
	  for (VitalsColumn column : numericColumns())
	    {
	      auto value = raw.getValue(column);
	      if (value && std::isfinite(*value))
		record.values[columnIndex(column)] = value;
	    }

	  working.push_back(std::move(record));
	}

      return working;
    }

    std::vector<WorkingRecord> removeDuplicates(const std::vector<WorkingRecord>& records,
						RepairReport& report)
    {
      std::vector<WorkingRecord> unique;
      std::set<std::pair<std::string, Visit>> seen;

      for (const auto& record : records)
	{
	  if (seen.insert(std::make_pair(record.subjectId, record.visit)).second)
	    unique.push_back(record);
	  else
	    report.push_back(RepairAction{RepairKind::DuplicateRemoved, record.subjectId,
					  record.visit, "", "duplicate", ""});
	}

      return unique;
    }

    void resolveArms(std::vector<WorkingRecord>& records, RepairReport& report)
    {
      struct ArmTally
      {
	std::array<std::size_t, kNumArms> counts{};
	TreatmentArm firstArm;
      };

      std::map<std::string, ArmTally> tallies;
      for (const auto& record : records)
	{
	  auto it = tallies.find(record.subjectId);
	  if (it == tallies.end())
	    it = tallies.emplace(record.subjectId, ArmTally{{}, record.arm}).first;

	  it->second.counts[armIndex(record.arm)]++;
	}

      for (auto& record : records)
	{
	  const ArmTally& tally = tallies.at(record.subjectId);
	  const std::size_t active = tally.counts[armIndex(TreatmentArm::Active)];
	  const std::size_t placebo = tally.counts[armIndex(TreatmentArm::Placebo)];

	  TreatmentArm resolved = tally.firstArm;
	  if (active > placebo)
	    resolved = TreatmentArm::Active;
	  else if (placebo > active)
	    resolved = TreatmentArm::Placebo;

	  if (record.arm != resolved)
	    {
	      report.push_back(RepairAction{RepairKind::ArmCorrected, record.subjectId, record.visit,
					    "TreatmentArm", armToString(record.arm),
					    armToString(resolved)});
	      record.arm = resolved;
	    }
	}
    }

    void imputeMissing(std::vector<WorkingRecord>& records, RepairReport& report)
    {
      for (VitalsColumn column : numericColumns())
	{
	  const std::size_t c = columnIndex(column);

	  std::vector<double> cohort;
	  std::map<std::string, std::vector<double>> bySubject;
	  bool anyMissing = false;

	  for (const auto& record : records)
	    {
	      if (record.values[c])
		{
		  cohort.push_back(*record.values[c]);
		  bySubject[record.subjectId].push_back(*record.values[c]);
		}
	      else
		anyMissing = true;
	    }

	  if (!anyMissing)
	    continue;

	  if (cohort.empty())
	    throw InsufficientDataError("no observed values for field " + columnName(column) +
					" to impute from");

	  const double cohortMedian = median(cohort);

	  for (auto& record : records)
	    {
	      if (record.values[c])
		continue;

	      auto it = bySubject.find(record.subjectId);
	      const double imputed = (it != bySubject.end()) ? median(it->second) : cohortMedian;
	      const double rounded = roundToNativePrecision(column, imputed);

	      record.values[c] = rounded;
	      report.push_back(RepairAction{RepairKind::ValueImputed, record.subjectId, record.visit,
					    columnName(column), "missing",
					    formatValue(column, rounded)});
	    }
	}
    }

    void clipField(WorkingRecord& record, VitalsColumn column, RepairReport& report)
    {
      const std::size_t c = columnIndex(column);
      const FieldRange& range = ClinicalLimits::rangeFor(column);
      const double value = *record.values[c];

      if (range.contains(value))
	return;

      const double clipped = range.clamp(value);
      report.push_back(RepairAction{RepairKind::ValueClipped, record.subjectId, record.visit,
				    columnName(column), formatValue(column, value),
				    formatValue(column, clipped)});
      record.values[c] = clipped;
    }

    void repairDifferential(WorkingRecord& record, RepairReport& report)
    {
      const std::size_t s = columnIndex(VitalsColumn::SystolicBP);
      const std::size_t d = columnIndex(VitalsColumn::DiastolicBP);
      const double minGap = ClinicalLimits::MinPulsePressure;

      if (*record.values[s] <= *record.values[d])
	{
	  const double systolic = *record.values[s];
	  const double diastolic = *record.values[d];

	  report.push_back(RepairAction{RepairKind::PressuresSwapped, record.subjectId, record.visit,
					"SystolicBP/DiastolicBP",
					formatValue(VitalsColumn::SystolicBP, systolic) + "/" +
					formatValue(VitalsColumn::DiastolicBP, diastolic),
					formatValue(VitalsColumn::SystolicBP, diastolic) + "/" +
					formatValue(VitalsColumn::DiastolicBP, systolic)});

	  record.values[s] = diastolic;
	  record.values[d] = systolic;
	  clipField(record, VitalsColumn::SystolicBP, report);
	  clipField(record, VitalsColumn::DiastolicBP, report);
	}

      if (*record.values[s] - *record.values[d] < minGap)
	{
	  const double lowered =
	    ClinicalLimits::DiastolicBP.clamp(*record.values[s] - minGap);

	  report.push_back(RepairAction{RepairKind::DiastolicLowered, record.subjectId, record.visit,
					"DiastolicBP",
					formatValue(VitalsColumn::DiastolicBP, *record.values[d]),
					formatValue(VitalsColumn::DiastolicBP, lowered)});
	  record.values[d] = lowered;
	}
    }

    // Sample standard deviation; zero for fewer than two values.
    double sampleStdDev(const std::vector<double>& values, double mean)
    {
      if (values.size() < 2)
	return 0.0;

      double sum = 0.0;
      for (double v : values)
	sum += (v - mean) * (v - mean);

      return std::sqrt(sum / static_cast<double>(values.size() - 1));
    }
  }

  std::string repairKindToString(RepairKind kind)
  {
    switch (kind)
      {
      case RepairKind::DuplicateRemoved:
	return "duplicate_removed";
      case RepairKind::ArmCorrected:
	return "arm_corrected";
      case RepairKind::ValueImputed:
	return "value_imputed";
      case RepairKind::ValueClipped:
	return "value_clipped";
      case RepairKind::PressuresSwapped:
	return "pressures_swapped";
      case RepairKind::DiastolicLowered:
	return "diastolic_lowered";
      }
    return "unknown";
  }

  std::string severityToString(IssueSeverity severity)
  {
    switch (severity)
      {
      case IssueSeverity::Critical:
	return "CRITICAL";
      case IssueSeverity::High:
	return "HIGH";
      case IssueSeverity::Medium:
	return "MEDIUM";
      case IssueSeverity::Low:
	return "LOW";
      }
    return "UNKNOWN";
  }

  std::size_t ValidationReport::countBySeverity(IssueSeverity severity) const
  {
    return static_cast<std::size_t>(std::count_if(mIssues.begin(), mIssues.end(),
						  [severity](const ValidationIssue& issue) {
						    return issue.severity == severity;
						  }));
  }

  ReferenceDataset ReferenceRepairer::repair(const RawVitalsRecordList& rawRecords)
  {
    RepairReport report;

    std::vector<WorkingRecord> working = removeDuplicates(parseIdentity(rawRecords), report);
    resolveArms(working, report);
    imputeMissing(working, report);

    VitalsRecordList clean;
    clean.reserve(working.size());

    for (auto& record : working)
      {
	for (VitalsColumn column : numericColumns())
	  {
	    clipField(record, column, report);

	    const std::size_t c = columnIndex(column);
	    record.values[c] = roundToNativePrecision(column, *record.values[c]);
	  }

	repairDifferential(record, report);

	VitalsRecord out;
	out.subjectId = record.subjectId;
	out.visit = record.visit;
	out.arm = record.arm;
	for (VitalsColumn column : numericColumns())
	  out.setValue(column, *record.values[columnIndex(column)]);

	clean.push_back(std::move(out));
      }

    ConstraintEnforcer::verify(clean);
    return ReferenceDataset(std::move(clean), std::move(report));
  }

  ValidationReport ReferenceRepairer::validate(const RawVitalsRecordList& rawRecords)
  {
    ValidationReport report(rawRecords.size());

    std::size_t missingIdentity = 0;
    std::size_t unknownIdentity = 0;
    std::array<std::size_t, kNumNumericColumns> missing{};
    std::array<std::size_t, kNumNumericColumns> outOfRange{};
    std::array<std::vector<double>, kNumNumericColumns> observed;
    std::size_t invertedPressure = 0;
    std::size_t narrowPressure = 0;
    std::size_t duplicates = 0;

    std::set<std::pair<std::string, std::string>> seenVisits;
    std::map<std::string, std::set<Visit>> visitsBySubject;
    std::map<std::string, std::set<TreatmentArm>> armsBySubject;

    for (const auto& raw : rawRecords)
      {
	const bool hasIdentity = raw.subjectId && !raw.subjectId->empty() &&
	  raw.visitName && raw.treatmentArm;
	if (!hasIdentity)
	  missingIdentity++;
	else
	  {
	    auto visit = tryParseVisit(*raw.visitName);
	    auto arm = tryParseArm(*raw.treatmentArm);
	    if (!visit || !arm)
	      unknownIdentity++;

	    if (visit)
	      {
		if (!seenVisits.insert(std::make_pair(*raw.subjectId, visitToString(*visit))).second)
		  duplicates++;
		visitsBySubject[*raw.subjectId].insert(*visit);
	      }
	    if (arm)
	      armsBySubject[*raw.subjectId].insert(*arm);
	  }

	for (VitalsColumn column : numericColumns())
	  {
	    const std::size_t c = columnIndex(column);
	    auto value = raw.getValue(column);
	    if (!value || !std::isfinite(*value))
	      {
		missing[c]++;
		continue;
	      }

	    observed[c].push_back(*value);
	    if (!ClinicalLimits::rangeFor(column).contains(*value))
	      outOfRange[c]++;
	  }

	if (raw.systolicBP && raw.diastolicBP)
	  {
	    const double gap = *raw.systolicBP - *raw.diastolicBP;
	    if (gap <= 0.0)
	      invertedPressure++;
	    else if (gap < ClinicalLimits::MinPulsePressure)
	      narrowPressure++;
	  }
      }

    if (missingIdentity > 0)
      report.addIssue(IssueSeverity::Critical, "missing_identity",
		      "records without SubjectID, VisitName or TreatmentArm", missingIdentity);
    if (unknownIdentity > 0)
      report.addIssue(IssueSeverity::Critical, "unknown_identity",
		      "records with an unrecognised VisitName or TreatmentArm", unknownIdentity);

    for (VitalsColumn column : numericColumns())
      {
	const std::size_t c = columnIndex(column);
	if (missing[c] > 0)
	  report.addIssue(IssueSeverity::High, "missing_values",
			  columnName(column) + " has missing values", missing[c]);
	if (outOfRange[c] > 0)
	  {
	    const FieldRange& range = ClinicalLimits::rangeFor(column);
	    std::ostringstream os;
	    os << columnName(column) << " outside [" << range.min << ", " << range.max << "] "
	       << ClinicalLimits::unitFor(column);
	    report.addIssue(IssueSeverity::High, "out_of_range", os.str(), outOfRange[c]);
	  }
      }

    if (invertedPressure > 0)
      report.addIssue(IssueSeverity::Critical, "bp_inverted",
		      "SystolicBP <= DiastolicBP", invertedPressure);
    if (narrowPressure > 0)
      report.addIssue(IssueSeverity::Medium, "bp_differential",
		      "SystolicBP - DiastolicBP below 5 mmHg", narrowPressure);
    if (duplicates > 0)
      report.addIssue(IssueSeverity::High, "duplicates",
		      "duplicate (SubjectID, VisitName) pairs", duplicates);

    std::size_t incomplete = 0;
    for (const auto& entry : visitsBySubject)
      {
	if (entry.second.size() < kNumVisits)
	  incomplete++;
      }
    if (incomplete > 0)
      report.addIssue(IssueSeverity::Medium, "incomplete_visits",
		      "subjects missing one or more visits", incomplete);

    std::size_t inconsistent = 0;
    for (const auto& entry : armsBySubject)
      {
	if (entry.second.size() > 1)
	  inconsistent++;
      }
    if (inconsistent > 0)
      report.addIssue(IssueSeverity::High, "inconsistent_arms",
		      "subjects recorded in more than one arm", inconsistent);

    for (VitalsColumn column : numericColumns())
      {
	const std::vector<double>& values = observed[columnIndex(column)];
	if (values.size() < 3)
	  continue;

	double mean = 0.0;
	for (double v : values)
	  mean += v;
	mean /= static_cast<double>(values.size());

	const double sd = sampleStdDev(values, mean);
	if (sd <= 0.0)
	  continue;

	const auto outliers = std::count_if(values.begin(), values.end(), [mean, sd](double v) {
	    return std::fabs(v - mean) > 3.0 * sd;
	  });
	if (outliers > 0)
	  report.addIssue(IssueSeverity::Low, "outliers",
			  columnName(column) + " values beyond 3 standard deviations",
			  static_cast<std::size_t>(outliers));
      }

    return report;
  }
} // namespace trialsynth
