// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_VITALS_JSON_SERIALIZER_H
#define __TRIALSYNTH_VITALS_JSON_SERIALIZER_H 1

#include <string>
#include "VitalsRecord.h"
#include "ReferenceRepairer.h"

namespace trialsynth
{
  /**
   * @brief JSON encoding of record lists and repair/validation reports.
   *
   * Records are objects keyed SubjectID, VisitName, TreatmentArm, SystolicBP,
   * DiastolicBP, HeartRate, Temperature. A numeric member that is null or
   * absent is read as a missing value.
   */
  class VitalsJsonSerializer
  {
  public:
    static std::string recordsToJson(const VitalsRecordList& records);

    /**
     * @brief Parses either a bare array of records or an object whose
     * "records" member is that array.
     * @throws SchemaError on a JSON parse error or a non-numeric vital sign
     */
    static RawVitalsRecordList parseRecords(const std::string& jsonStr);

    static RawVitalsRecordList loadRecordsFromFile(const std::string& filePath);
    static void saveRecordsToFile(const VitalsRecordList& records, const std::string& filePath);

    static std::string repairReportToJson(const RepairReport& report);
    static std::string validationReportToJson(const ValidationReport& report);
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_VITALS_JSON_SERIALIZER_H
