// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_VITALS_RECORD_H
#define __TRIALSYNTH_VITALS_RECORD_H 1

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trialsynth
{
  /**
   * @brief Canonical visit sequence of the study. The underlying value is the
   * visit index used for onset interpolation.
   */
  enum class Visit { Screening = 0, Day1 = 1, Week4 = 2, Week12 = 3 };

  enum class TreatmentArm { Active = 0, Placebo = 1 };

  /**
   * @brief Numeric vital-sign columns, in the stable serialisation order.
   */
  enum class VitalsColumn { SystolicBP = 0, DiastolicBP = 1, HeartRate = 2, Temperature = 3 };

  constexpr std::size_t kNumVisits = 4;
  constexpr std::size_t kNumArms = 2;
  constexpr std::size_t kNumNumericColumns = 4;

  const std::array<Visit, kNumVisits>& allVisits();
  const std::array<TreatmentArm, kNumArms>& allArms();
  const std::array<VitalsColumn, kNumNumericColumns>& numericColumns();

  inline std::size_t visitIndex(Visit visit)
  {
    return static_cast<std::size_t>(visit);
  }

  inline std::size_t armIndex(TreatmentArm arm)
  {
    return static_cast<std::size_t>(arm);
  }

  inline std::size_t columnIndex(VitalsColumn column)
  {
    return static_cast<std::size_t>(column);
  }

  /// "Screening", "Day 1", "Week 4", "Week 12"
  std::string visitToString(Visit visit);

  /// Accepts the canonical names and the compact forms ("Day1", "Week12").
  std::optional<Visit> tryParseVisit(const std::string& text);

  /// @throws SchemaError when the text names no known visit
  Visit stringToVisit(const std::string& text);

  std::string armToString(TreatmentArm arm);
  std::optional<TreatmentArm> tryParseArm(const std::string& text);

  /// @throws SchemaError when the text names no known arm
  TreatmentArm stringToArm(const std::string& text);

  std::string columnName(VitalsColumn column);
  std::optional<VitalsColumn> tryParseColumn(const std::string& text);

  /**
   * @brief Rounds a value to the column's native precision: whole units for
   * blood pressure and heart rate, one decimal for temperature.
   */
  double roundToNativePrecision(VitalsColumn column, double value);

  /**
   * @brief One clean vital-signs observation for one subject at one visit.
   */
  struct VitalsRecord
  {
    std::string subjectId;
    Visit visit = Visit::Screening;
    TreatmentArm arm = TreatmentArm::Placebo;
    int systolicBP = 0;
    int diastolicBP = 0;
    int heartRate = 0;
    double temperature = 0.0;

    double getValue(VitalsColumn column) const;

    // Rounds to native precision before storing.
    void setValue(VitalsColumn column, double value);

    bool operator==(const VitalsRecord& rhs) const;
    bool operator!=(const VitalsRecord& rhs) const
    {
      return !(*this == rhs);
    }
  };

  using VitalsRecordList = std::vector<VitalsRecord>;

  /**
   * @brief Untrusted input form of a record.
   *
   * An absent identity field is a schema problem; an absent numeric field is a
   * missing observation that the repairer imputes.
   */
  struct RawVitalsRecord
  {
    std::optional<std::string> subjectId;
    std::optional<std::string> visitName;
    std::optional<std::string> treatmentArm;
    std::optional<double> systolicBP;
    std::optional<double> diastolicBP;
    std::optional<double> heartRate;
    std::optional<double> temperature;

    std::optional<double> getValue(VitalsColumn column) const;
    void setValue(VitalsColumn column, std::optional<double> value);
  };

  using RawVitalsRecordList = std::vector<RawVitalsRecord>;

  RawVitalsRecord toRawRecord(const VitalsRecord& record);
  RawVitalsRecordList toRawRecords(const VitalsRecordList& records);

  /// Values of one column at one visit for one arm, in record order.
  std::vector<double> columnValues(const VitalsRecordList& records,
				   VitalsColumn column,
				   std::optional<Visit> visit = std::nullopt,
				   std::optional<TreatmentArm> arm = std::nullopt);
} // namespace trialsynth

#endif // __TRIALSYNTH_VITALS_RECORD_H
