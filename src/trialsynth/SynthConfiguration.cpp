#include "SynthConfiguration.h"
#include "VitalsException.h"
#include <cmath>
#include <fstream>
#include <sstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace rapidjson;

namespace trialsynth {

namespace {

const Value* findMember(const Value& object, const char* name) {
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() || it->value.IsNull()) {
        return nullptr;
    }
    return &it->value;
}

double requireNumber(const Value& value, const std::string& path) {
    if (!value.IsNumber()) {
        throw SchemaError("'" + path + "' must be a number");
    }
    return value.GetDouble();
}

uint64_t requireUnsigned(const Value& value, const std::string& path) {
    if (!value.IsUint64()) {
        throw SchemaError("'" + path + "' must be a non-negative integer");
    }
    return value.GetUint64();
}

std::string requireString(const Value& value, const std::string& path) {
    if (!value.IsString()) {
        throw SchemaError("'" + path + "' must be a string");
    }
    return value.GetString();
}

void parseGeneration(const Value& json, GenerationSettings& settings) {
    if (const Value* v = findMember(json, "n_per_arm")) {
        settings.nPerArm = static_cast<std::size_t>(requireUnsigned(*v, "generation.n_per_arm"));
    }
    if (const Value* v = findMember(json, "target_effect")) {
        settings.targetEffect = requireNumber(*v, "generation.target_effect");
    }
    if (const Value* v = findMember(json, "seed")) {
        settings.seed = requireUnsigned(*v, "generation.seed");
    }
    if (const Value* v = findMember(json, "method")) {
        settings.method = stringToMethod(requireString(*v, "generation.method"));
    }
    if (const Value* v = findMember(json, "jitter_frac")) {
        settings.jitterFraction = requireNumber(*v, "generation.jitter_frac");
    }
    if (const Value* v = findMember(json, "endpoint_visit")) {
        settings.endpointVisit = stringToVisit(requireString(*v, "generation.endpoint_visit"));
    }
    if (const Value* v = findMember(json, "effect_onset")) {
        settings.effectOnset = stringToOnset(requireString(*v, "generation.effect_onset"));
    }
    if (const Value* v = findMember(json, "effect_mode")) {
        settings.effectMode = stringToMode(requireString(*v, "generation.effect_mode"));
    }
    if (const Value* v = findMember(json, "baseline")) {
        if (!v->IsObject()) {
            throw SchemaError("'generation.baseline' must be an object");
        }
        for (auto it = v->MemberBegin(); it != v->MemberEnd(); ++it) {
            const std::string columnText = it->name.GetString();
            auto column = tryParseColumn(columnText);
            if (!column) {
                throw SchemaError("unknown baseline column '" + columnText + "'");
            }
            if (!it->value.IsObject() || !it->value.HasMember("mean") || !it->value.HasMember("std")) {
                throw SchemaError("baseline '" + columnText + "' needs 'mean' and 'std'");
            }
            ColumnBaseline baseline;
            baseline.mean = requireNumber(it->value["mean"], "baseline." + columnText + ".mean");
            baseline.stdDev = requireNumber(it->value["std"], "baseline." + columnText + ".std");
            settings.baseline[*column] = baseline;
        }
    }
}

void parseScoring(const Value& json, ScoringSettings& settings) {
    if (const Value* v = findMember(json, "k")) {
        settings.k = static_cast<std::size_t>(requireUnsigned(*v, "scoring.k"));
    }
    if (const Value* v = findMember(json, "mask_fraction")) {
        settings.options.maskFraction = requireNumber(*v, "scoring.mask_fraction");
    }
    if (const Value* v = findMember(json, "max_masked_rows")) {
        settings.options.maxMaskedRows = static_cast<std::size_t>(requireUnsigned(*v, "scoring.max_masked_rows"));
    }
    if (const Value* v = findMember(json, "mask_seed")) {
        settings.options.maskSeed = requireUnsigned(*v, "scoring.mask_seed");
    }
    if (const Value* v = findMember(json, "threads")) {
        settings.options.threads = static_cast<std::size_t>(requireUnsigned(*v, "scoring.threads"));
    }
}

} // namespace

SynthConfiguration::SynthConfiguration() {
    generation_ = GenerationSettings();
    scoring_ = ScoringSettings();
}

bool SynthConfiguration::loadFromFile(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open configuration file: " + configPath);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return loadFromString(buffer.str());
}

bool SynthConfiguration::loadFromString(const std::string& jsonContent) {
    return parseJson(jsonContent);
}

bool SynthConfiguration::saveToFile(const std::string& configPath) const {
    std::ofstream file(configPath);
    if (!file.is_open()) {
        setError("Could not open file for writing: " + configPath);
        return false;
    }

    file << toJsonString();
    file.close();
    return true;
}

std::vector<std::string> SynthConfiguration::validate() const {
    std::vector<std::string> errors;

    if (generation_.nPerArm == 0) {
        errors.push_back("generation.n_per_arm must be at least 1");
    }
    if (!std::isfinite(generation_.targetEffect)) {
        errors.push_back("generation.target_effect must be finite");
    }
    if (generation_.jitterFraction) {
        if (generation_.method != GenerationMethod::Bootstrap) {
            errors.push_back("generation.jitter_frac is only valid with the bootstrap method");
        }
        if (!(*generation_.jitterFraction >= 0.0 && *generation_.jitterFraction <= 1.0)) {
            errors.push_back("generation.jitter_frac must lie in [0, 1]");
        }
    }
    for (const auto& entry : generation_.baseline) {
        if (!(entry.second.stdDev > 0.0)) {
            errors.push_back("baseline std for " + columnName(entry.first) + " must be positive");
        }
    }
    if (scoring_.k == 0) {
        errors.push_back("scoring.k must be at least 1");
    }
    if (!(scoring_.options.maskFraction > 0.0 && scoring_.options.maskFraction <= 1.0)) {
        errors.push_back("scoring.mask_fraction must lie in (0, 1]");
    }
    if (scoring_.options.maxMaskedRows == 0) {
        errors.push_back("scoring.max_masked_rows must be at least 1");
    }

    return errors;
}

GenerationRequest SynthConfiguration::toGenerationRequest() const {
    std::optional<BaselineStatistics> baseline;
    if (!generation_.baseline.empty()) {
        baseline = generation_.baseline;
    }

    return GenerationRequest(generation_.nPerArm,
                             generation_.targetEffect,
                             generation_.method,
                             generation_.seed,
                             generation_.jitterFraction,
                             generation_.endpointVisit,
                             generation_.effectOnset,
                             generation_.effectMode,
                             baseline);
}

SynthConfiguration SynthConfiguration::createDefault() {
    SynthConfiguration config;

    config.generation_.nPerArm = 50;
    config.generation_.targetEffect = -5.0;
    config.generation_.method = GenerationMethod::Mvn;
    config.generation_.endpointVisit = Visit::Week12;

    config.scoring_.k = 5;
    config.scoring_.options.maskFraction = 0.2;
    config.scoring_.options.maxMaskedRows = 500;
    config.scoring_.options.maskSeed = 42;
    config.scoring_.options.threads = 1;

    return config;
}

bool SynthConfiguration::parseJson(const std::string& jsonContent) {
    Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError()) {
        setError(std::string("JSON parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
                 ": " + GetParseError_En(doc.GetParseError()));
        return false;
    }
    if (!doc.IsObject()) {
        setError("Configuration root must be a JSON object");
        return false;
    }

    GenerationSettings generation = generation_;
    ScoringSettings scoring = scoring_;

    try {
        if (const Value* v = findMember(doc, "generation")) {
            if (!v->IsObject()) {
                throw SchemaError("'generation' must be an object");
            }
            parseGeneration(*v, generation);
        }
        if (const Value* v = findMember(doc, "scoring")) {
            if (!v->IsObject()) {
                throw SchemaError("'scoring' must be an object");
            }
            parseScoring(*v, scoring);
        }
    } catch (const TrialSynthException& e) {
        setError(e.what());
        return false;
    }

    generation_ = generation;
    scoring_ = scoring;
    return true;
}

std::string SynthConfiguration::toJsonString() const {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    Value generation(kObjectType);
    generation.AddMember("n_per_arm", static_cast<uint64_t>(generation_.nPerArm), allocator);
    generation.AddMember("target_effect", generation_.targetEffect, allocator);
    if (generation_.seed) {
        generation.AddMember("seed", *generation_.seed, allocator);
    }
    generation.AddMember("method", Value(methodToString(generation_.method).c_str(), allocator), allocator);
    if (generation_.jitterFraction) {
        generation.AddMember("jitter_frac", *generation_.jitterFraction, allocator);
    }
    generation.AddMember("endpoint_visit", Value(visitToString(generation_.endpointVisit).c_str(), allocator), allocator);
    generation.AddMember("effect_onset", Value(onsetToString(generation_.effectOnset).c_str(), allocator), allocator);
    generation.AddMember("effect_mode", Value(modeToString(generation_.effectMode).c_str(), allocator), allocator);

    if (!generation_.baseline.empty()) {
        Value baseline(kObjectType);
        for (const auto& entry : generation_.baseline) {
            Value column(kObjectType);
            column.AddMember("mean", entry.second.mean, allocator);
            column.AddMember("std", entry.second.stdDev, allocator);
            baseline.AddMember(Value(columnName(entry.first).c_str(), allocator), column, allocator);
        }
        generation.AddMember("baseline", baseline, allocator);
    }
    doc.AddMember("generation", generation, allocator);

    Value scoring(kObjectType);
    scoring.AddMember("k", static_cast<uint64_t>(scoring_.k), allocator);
    scoring.AddMember("mask_fraction", scoring_.options.maskFraction, allocator);
    scoring.AddMember("max_masked_rows", static_cast<uint64_t>(scoring_.options.maxMaskedRows), allocator);
    scoring.AddMember("mask_seed", scoring_.options.maskSeed, allocator);
    scoring.AddMember("threads", static_cast<uint64_t>(scoring_.options.threads), allocator);
    doc.AddMember("scoring", scoring, allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
}

} // namespace trialsynth
