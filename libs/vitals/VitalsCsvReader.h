// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __TRIALSYNTH_VITALS_CSV_READER_H
#define __TRIALSYNTH_VITALS_CSV_READER_H 1

#include <istream>
#include <string>
#include "VitalsRecord.h"
#include "csv.h"

namespace trialsynth
{
  /**
   * @brief Reads vital-signs records from a CSV file with the header
   * SubjectID, VisitName, TreatmentArm, SystolicBP, DiastolicBP, HeartRate, Temperature.
   *
   * Extra columns are ignored. An empty cell becomes an absent value so that
   * the repairer can decide what to do with it; a missing column or a
   * non-numeric value raises SchemaError.
   */
  class VitalsCsvReader
  {
  public:
    explicit VitalsCsvReader(const std::string& fileName);

    // fileName is only used in error messages
    VitalsCsvReader(const std::string& fileName, std::istream& in);

    VitalsCsvReader(const VitalsCsvReader& rhs) = delete;
    VitalsCsvReader& operator=(const VitalsCsvReader& rhs) = delete;

    RawVitalsRecordList readFile();

  private:
    std::string mFileName;
    io::CSVReader<7, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>> mCsvFile;
  };

  /**
   * @brief Writes clean records with the same header; Temperature keeps one decimal.
   */
  class VitalsCsvWriter
  {
  public:
    static void write(std::ostream& os, const VitalsRecordList& records);
    static void writeFile(const std::string& fileName, const VitalsRecordList& records);
  };
} // namespace trialsynth

#endif // __TRIALSYNTH_VITALS_CSV_READER_H
