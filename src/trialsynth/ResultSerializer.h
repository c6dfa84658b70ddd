#pragma once

#include <string>
#include "GenerationPipeline.h"
#include "QualityReport.h"
#include "TreatmentEffectAnalyzer.h"

namespace trialsynth {

/**
 * @brief JSON encodings of the pipeline outputs
 *
 * Column maps are objects keyed by column name in SystolicBP, DiastolicBP,
 * HeartRate, Temperature order.
 */
class ResultSerializer {
public:
    static std::string qualityReportToJson(const QualityReport& report);
    static std::string treatmentEffectToJson(const TreatmentEffectResult& result);

    /**
     * @brief {"seed_used", "method", "record_count", "records": [...]}
     */
    static std::string generationResultToJson(const GenerationResult& result);

    static void writeToFile(const std::string& json, const std::string& filePath);
};

} // namespace trialsynth
