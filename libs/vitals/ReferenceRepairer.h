// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_REFERENCE_REPAIRER_H
#define __TRIALSYNTH_REFERENCE_REPAIRER_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "VitalsRecord.h"

namespace trialsynth
{
  enum class RepairKind
  {
    DuplicateRemoved,
    ArmCorrected,
    ValueImputed,
    ValueClipped,
    PressuresSwapped,
    DiastolicLowered
  };

  std::string repairKindToString(RepairKind kind);

  /**
   * @brief One fix applied by the repairer. Before/after hold the textual
   * value ("missing" for an imputed value, empty for a removed record).
   */
  struct RepairAction
  {
    RepairKind kind;
    std::string subjectId;
    std::optional<Visit> visit;
    std::string field;
    std::string before;
    std::string after;
  };

  using RepairReport = std::vector<RepairAction>;

  /**
   * @brief Clean reference records plus the report of every fix that produced them.
   */
  class ReferenceDataset
  {
  public:
    ReferenceDataset(VitalsRecordList records, RepairReport report)
      : mRecords(std::move(records)),
	mReport(std::move(report))
    {}

    const VitalsRecordList& getRecords() const
    {
      return mRecords;
    }

    const RepairReport& getReport() const
    {
      return mReport;
    }

    std::size_t size() const
    {
      return mRecords.size();
    }

    bool empty() const
    {
      return mRecords.empty();
    }

  private:
    VitalsRecordList mRecords;
    RepairReport mReport;
  };

  enum class IssueSeverity { Critical, High, Medium, Low };

  std::string severityToString(IssueSeverity severity);

  struct ValidationIssue
  {
    IssueSeverity severity;
    std::string category;
    std::string message;
    std::size_t count;
  };

  /**
   * @brief Read-only audit of a raw dataset.
   */
  class ValidationReport
  {
  public:
    explicit ValidationReport(std::size_t recordCount)
      : mRecordCount(recordCount),
	mIssues()
    {}

    void addIssue(IssueSeverity severity, const std::string& category,
		  const std::string& message, std::size_t count)
    {
      mIssues.push_back(ValidationIssue{severity, category, message, count});
    }

    const std::vector<ValidationIssue>& getIssues() const
    {
      return mIssues;
    }

    std::size_t getRecordCount() const
    {
      return mRecordCount;
    }

    std::size_t countBySeverity(IssueSeverity severity) const;

    bool isClean() const
    {
      return mIssues.empty();
    }

  private:
    std::size_t mRecordCount;
    std::vector<ValidationIssue> mIssues;
  };

  /**
   * @class ReferenceRepairer
   * @brief Turns untrusted reference records into a clean ReferenceDataset.
   *
   * Fixes are applied in this order:
   *  - duplicate (SubjectID, VisitName) pairs removed, first kept
   *  - per-subject arm set to the most frequent arm (tie: first record's arm)
   *  - missing numerics imputed with the subject median, else the cohort median
   *  - out-of-range numerics clipped to the nearest bound
   *  - BP differential repaired (swap when SBP <= DBP, then DBP = SBP - 5)
   *
   * Values are rounded to native precision; rounding is not reported. Running
   * the repairer on its own output returns the same records and an empty report.
   */
  class ReferenceRepairer
  {
  public:
    /**
     * @throws SchemaError if an identity field is absent or unrecognised
     * @throws InsufficientDataError if a numeric field has no observed value at all
     */
    static ReferenceDataset repair(const RawVitalsRecordList& rawRecords);

    /// Audit without modifying anything. Unrecognised identity values are reported, not thrown.
    static ValidationReport validate(const RawVitalsRecordList& rawRecords);

  private:
    ReferenceRepairer() = delete;
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_REFERENCE_REPAIRER_H
