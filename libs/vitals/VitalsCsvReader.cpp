// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "VitalsCsvReader.h"
#include "VitalsException.h"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <iomanip>
#include <optional>

namespace trialsynth
{
  namespace
  {
    std::optional<std::string> textCell(const std::string& cell)
    {
      if (cell.empty())
	return std::nullopt;

      return cell;
    }

    std::optional<double> numericCell(const std::string& cell,
				      const std::string& fileName,
				      std::size_t rowIndex,
				      const char *column)
    {
      if (cell.empty())
	return std::nullopt;

      try
	{
	  return boost::lexical_cast<double>(cell);
	}
      catch (const boost::bad_lexical_cast&)
	{
	  throw SchemaError(fileName + ": record " + std::to_string(rowIndex) + " field " +
			    column + ": '" + cell + "' is not a number");
	}
    }
  }

  VitalsCsvReader::VitalsCsvReader(const std::string& fileName)
    : mFileName(fileName),
      mCsvFile(fileName.c_str())
  {}

  VitalsCsvReader::VitalsCsvReader(const std::string& fileName, std::istream& in)
    : mFileName(fileName),
      mCsvFile(fileName, in)
  {}

  RawVitalsRecordList VitalsCsvReader::readFile()
  {
    RawVitalsRecordList records;
    std::string subjectId, visitName, arm;
    std::string systolic, diastolic, heartRate, temperature;

    try
      {
	mCsvFile.read_header(io::ignore_extra_column,
			     "SubjectID", "VisitName", "TreatmentArm",
			     "SystolicBP", "DiastolicBP", "HeartRate", "Temperature");

	while (mCsvFile.read_row(subjectId, visitName, arm, systolic, diastolic, heartRate, temperature))
	  {
	    const std::size_t rowIndex = records.size();

	    RawVitalsRecord record;
	    record.subjectId = textCell(subjectId);
	    record.visitName = textCell(visitName);
	    record.treatmentArm = textCell(arm);
	    record.systolicBP = numericCell(systolic, mFileName, rowIndex, "SystolicBP");
	    record.diastolicBP = numericCell(diastolic, mFileName, rowIndex, "DiastolicBP");
	    record.heartRate = numericCell(heartRate, mFileName, rowIndex, "HeartRate");
	    record.temperature = numericCell(temperature, mFileName, rowIndex, "Temperature");

	    records.push_back(std::move(record));
	  }
      }
    catch (const io::error::base& e)
      {
	throw SchemaError(mFileName + ": " + e.what());
      }

    return records;
  }

  void VitalsCsvWriter::write(std::ostream& os, const VitalsRecordList& records)
  {
    os << "SubjectID,VisitName,TreatmentArm,SystolicBP,DiastolicBP,HeartRate,Temperature\n";

    for (const auto& record : records)
      {
	os << record.subjectId << ','
	   << visitToString(record.visit) << ','
	   << armToString(record.arm) << ','
	   << record.systolicBP << ','
	   << record.diastolicBP << ','
	   << record.heartRate << ','
	   << std::fixed << std::setprecision(1) << record.temperature
	   << std::defaultfloat << '\n';
      }
  }

  void VitalsCsvWriter::writeFile(const std::string& fileName, const VitalsRecordList& records)
  {
    std::ofstream csvFile(fileName);
    if (!csvFile)
      throw TrialSynthException("VitalsCsvWriter: unable to open " + fileName + " for writing");

    write(csvFile, records);
  }
} // namespace trialsynth
