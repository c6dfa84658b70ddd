// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "VitalsJsonSerializer.h"
#include "VitalsException.h"
#include <fstream>
#include <sstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace trialsynth
{
  namespace
  {
    std::string toPrettyString(const Document& doc)
    {
      StringBuffer buffer;
      PrettyWriter<StringBuffer> writer(buffer);
      doc.Accept(writer);
      return buffer.GetString();
    }

    std::optional<std::string> readText(const Value& json, const char *name, std::size_t index)
    {
      if (!json.HasMember(name) || json[name].IsNull())
	return std::nullopt;

      if (!json[name].IsString())
	throw SchemaError("record " + std::to_string(index) + " field " + name + ": not a string");

      return std::string(json[name].GetString());
    }

    std::optional<double> readNumber(const Value& json, const char *name, std::size_t index)
    {
      if (!json.HasMember(name) || json[name].IsNull())
	return std::nullopt;

      if (!json[name].IsNumber())
	throw SchemaError("record " + std::to_string(index) + " field " + name + ": not a number");

      return json[name].GetDouble();
    }

    Value recordToValue(const VitalsRecord& record, Document::AllocatorType& allocator)
    {
      Value json(kObjectType);
      json.AddMember("SubjectID", Value(record.subjectId.c_str(), allocator), allocator);
      json.AddMember("VisitName", Value(visitToString(record.visit).c_str(), allocator), allocator);
      json.AddMember("TreatmentArm", Value(armToString(record.arm).c_str(), allocator), allocator);
      json.AddMember("SystolicBP", record.systolicBP, allocator);
      json.AddMember("DiastolicBP", record.diastolicBP, allocator);
      json.AddMember("HeartRate", record.heartRate, allocator);
      json.AddMember("Temperature", record.temperature, allocator);
      return json;
    }
  }

  std::string VitalsJsonSerializer::recordsToJson(const VitalsRecordList& records)
  {
    Document doc;
    doc.SetArray();
    Document::AllocatorType& allocator = doc.GetAllocator();

    for (const auto& record : records)
      doc.PushBack(recordToValue(record, allocator), allocator);

    return toPrettyString(doc);
  }

  RawVitalsRecordList VitalsJsonSerializer::parseRecords(const std::string& jsonStr)
  {
    Document doc;
    doc.Parse(jsonStr.c_str());

    if (doc.HasParseError())
      {
	std::ostringstream os;
	os << "JSON parse error at offset " << doc.GetErrorOffset() << ": "
	   << GetParseError_En(doc.GetParseError());
	throw SchemaError(os.str());
      }

    const Value *array = nullptr;
    if (doc.IsArray())
      array = &doc;
    else if (doc.IsObject() && doc.HasMember("records") && doc["records"].IsArray())
      array = &doc["records"];
    else
      throw SchemaError("expected an array of records or an object with a \"records\" array");

    RawVitalsRecordList records;
    records.reserve(array->Size());

    for (SizeType i = 0; i < array->Size(); ++i)
      {
	const Value& json = (*array)[i];
	if (!json.IsObject())
	  throw SchemaError("record " + std::to_string(i) + " is not an object");

	RawVitalsRecord record;
	record.subjectId = readText(json, "SubjectID", i);
	record.visitName = readText(json, "VisitName", i);
	record.treatmentArm = readText(json, "TreatmentArm", i);
	record.systolicBP = readNumber(json, "SystolicBP", i);
	record.diastolicBP = readNumber(json, "DiastolicBP", i);
	record.heartRate = readNumber(json, "HeartRate", i);
	record.temperature = readNumber(json, "Temperature", i);

	records.push_back(std::move(record));
      }

    return records;
  }

  RawVitalsRecordList VitalsJsonSerializer::loadRecordsFromFile(const std::string& filePath)
  {
    std::ifstream file(filePath);
    if (!file.is_open())
      throw TrialSynthException("Could not open records file: " + filePath);

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseRecords(buffer.str());
  }

  void VitalsJsonSerializer::saveRecordsToFile(const VitalsRecordList& records,
					       const std::string& filePath)
  {
    std::ofstream file(filePath);
    if (!file.is_open())
      throw TrialSynthException("Could not open file for writing: " + filePath);

    file << recordsToJson(records);
  }

  std::string VitalsJsonSerializer::repairReportToJson(const RepairReport& report)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value actions(kArrayType);
    for (const auto& action : report)
      {
	Value json(kObjectType);
	json.AddMember("kind", Value(repairKindToString(action.kind).c_str(), allocator), allocator);
	json.AddMember("subjectId", Value(action.subjectId.c_str(), allocator), allocator);
	if (action.visit)
	  json.AddMember("visit", Value(visitToString(*action.visit).c_str(), allocator), allocator);
	else
	  json.AddMember("visit", Value(kNullType), allocator);
	json.AddMember("field", Value(action.field.c_str(), allocator), allocator);
	json.AddMember("before", Value(action.before.c_str(), allocator), allocator);
	json.AddMember("after", Value(action.after.c_str(), allocator), allocator);
	actions.PushBack(json, allocator);
      }

    doc.AddMember("fixCount", static_cast<uint64_t>(report.size()), allocator);
    doc.AddMember("actions", actions, allocator);
    return toPrettyString(doc);
  }

  std::string VitalsJsonSerializer::validationReportToJson(const ValidationReport& report)
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("recordCount", static_cast<uint64_t>(report.getRecordCount()), allocator);
    doc.AddMember("clean", report.isClean(), allocator);

    Value issues(kArrayType);
    for (const auto& issue : report.getIssues())
      {
	Value json(kObjectType);
	json.AddMember("severity", Value(severityToString(issue.severity).c_str(), allocator), allocator);
	json.AddMember("category", Value(issue.category.c_str(), allocator), allocator);
	json.AddMember("message", Value(issue.message.c_str(), allocator), allocator);
	json.AddMember("count", static_cast<uint64_t>(issue.count), allocator);
	issues.PushBack(json, allocator);
      }
    doc.AddMember("issues", issues, allocator);

    return toPrettyString(doc);
  }
} // namespace trialsynth
