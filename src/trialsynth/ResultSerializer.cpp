#include "ResultSerializer.h"
#include "VitalsException.h"
#include "VitalsJsonSerializer.h"
#include <cmath>
#include <fstream>
#include <limits>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace trialsynth {

namespace {

std::string toPrettyString(const Document& doc) {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

// JSON has no infinity; a degenerate t statistic is written as +/-1e308.
double finiteOrClamped(double value) {
    if (std::isinf(value)) {
        return value > 0 ? std::numeric_limits<double>::max() : std::numeric_limits<double>::lowest();
    }
    return value;
}

Value columnMetricsToValue(const ColumnMetrics& metrics, Document::AllocatorType& allocator) {
    Value json(kObjectType);
    for (VitalsColumn column : numericColumns()) {
        auto it = metrics.find(column);
        if (it != metrics.end()) {
            json.AddMember(Value(columnName(column).c_str(), allocator), it->second, allocator);
        }
    }
    return json;
}

Value armSummaryToValue(const ArmSummary& arm, Document::AllocatorType& allocator) {
    Value json(kObjectType);
    json.AddMember("n", static_cast<uint64_t>(arm.n), allocator);
    json.AddMember("mean", arm.mean, allocator);
    json.AddMember("std", arm.stdDev, allocator);
    json.AddMember("standard_error", arm.standardError, allocator);
    return json;
}

} // namespace

std::string ResultSerializer::qualityReportToJson(const QualityReport& report) {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("wasserstein_distances", columnMetricsToValue(report.wassersteinDistances, allocator), allocator);
    doc.AddMember("ks_distances", columnMetricsToValue(report.ksDistances, allocator), allocator);
    doc.AddMember("rmse_by_column", columnMetricsToValue(report.rmseByColumn, allocator), allocator);
    doc.AddMember("correlation_preservation", report.correlationPreservation, allocator);
    doc.AddMember("knn_imputation_score", report.knnImputationScore, allocator);
    doc.AddMember("overall_quality_score", report.overallQualityScore, allocator);
    doc.AddMember("quality_level", Value(qualityLevelToString(report.qualityLevel).c_str(), allocator), allocator);
    doc.AddMember("summary", Value(report.summary.c_str(), allocator), allocator);

    Value nn(kObjectType);
    nn.AddMember("mean", report.nearestNeighborDistances.mean, allocator);
    nn.AddMember("median", report.nearestNeighborDistances.median, allocator);
    nn.AddMember("min", report.nearestNeighborDistances.min, allocator);
    nn.AddMember("max", report.nearestNeighborDistances.max, allocator);
    nn.AddMember("std", report.nearestNeighborDistances.stdDev, allocator);
    doc.AddMember("nearest_neighbor_distances", nn, allocator);

    return toPrettyString(doc);
}

std::string ResultSerializer::treatmentEffectToJson(const TreatmentEffectResult& result) {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("visit", Value(visitToString(result.visit).c_str(), allocator), allocator);
    doc.AddMember("field", Value(columnName(result.field).c_str(), allocator), allocator);
    doc.AddMember("active", armSummaryToValue(result.active, allocator), allocator);
    doc.AddMember("placebo", armSummaryToValue(result.placebo, allocator), allocator);
    doc.AddMember("difference", result.difference, allocator);
    doc.AddMember("se_difference", result.seDifference, allocator);
    doc.AddMember("t_statistic", finiteOrClamped(result.tStatistic), allocator);
    doc.AddMember("degrees_of_freedom", result.degreesOfFreedom, allocator);
    doc.AddMember("p_value", result.pValue, allocator);
    doc.AddMember("ci_95_lower", result.ci95Lower, allocator);
    doc.AddMember("ci_95_upper", result.ci95Upper, allocator);
    doc.AddMember("significant", result.significant, allocator);
    doc.AddMember("cohens_d", finiteOrClamped(result.cohensD), allocator);
    doc.AddMember("effect_size", Value(effectSizeToString(result.effectSize).c_str(), allocator), allocator);
    doc.AddMember("clinical_relevance", Value(result.clinicalRelevance.c_str(), allocator), allocator);

    return toPrettyString(doc);
}

std::string ResultSerializer::generationResultToJson(const GenerationResult& result) {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("seed_used", result.seedUsed, allocator);
    doc.AddMember("method", Value(methodToString(result.method).c_str(), allocator), allocator);
    doc.AddMember("record_count", static_cast<uint64_t>(result.records.size()), allocator);

    // Records use the same encoding as the record files.
    Document records;
    records.Parse(VitalsJsonSerializer::recordsToJson(result.records).c_str());
    doc.AddMember("records", Value(records, allocator), allocator);

    return toPrettyString(doc);
}

void ResultSerializer::writeToFile(const std::string& json, const std::string& filePath) {
    std::ofstream file(filePath);
    if (!file.is_open()) {
        throw TrialSynthException("Could not open file for writing: " + filePath);
    }
    file << json << "\n";
}

} // namespace trialsynth
