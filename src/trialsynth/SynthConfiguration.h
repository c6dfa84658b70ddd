#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "FidelityScorer.h"
#include "GenerationRequest.h"

namespace trialsynth {

/**
 * @brief Settings for the generate sub-command
 */
struct GenerationSettings {
    std::size_t nPerArm = 50;
    double targetEffect = -5.0;
    std::optional<uint64_t> seed;
    GenerationMethod method = GenerationMethod::Mvn;
    std::optional<double> jitterFraction;
    Visit endpointVisit = Visit::Week12;
    EffectOnset effectOnset = EffectOnset::EndpointOnly;
    EffectMode effectMode = EffectMode::Additive;
    BaselineStatistics baseline;

    GenerationSettings() = default;
};

/**
 * @brief Settings for the score sub-command
 */
struct ScoringSettings {
    std::size_t k = 5;
    ScorerOptions options;

    ScoringSettings() = default;
};

/**
 * @brief JSON configuration for trialsynth runs
 *
 * Layout:
 *   { "generation": { "n_per_arm", "target_effect", "seed", "method",
 *                     "jitter_frac", "endpoint_visit", "effect_onset",
 *                     "effect_mode", "baseline": { "<column>": { "mean", "std" } } },
 *     "scoring":    { "k", "mask_fraction", "max_masked_rows", "mask_seed", "threads" } }
 *
 * Every member is optional; absent members keep their defaults.
 */
class SynthConfiguration {
public:
    SynthConfiguration();

    /**
     * @brief Load configuration from JSON file
     * @return true if loaded successfully, false otherwise (see getLastError)
     */
    bool loadFromFile(const std::string& configPath);

    /**
     * @brief Load configuration from JSON string
     * @return true if parsed successfully, false otherwise (see getLastError)
     */
    bool loadFromString(const std::string& jsonContent);

    bool saveToFile(const std::string& configPath) const;

    const GenerationSettings& getGenerationSettings() const { return generation_; }
    GenerationSettings& getGenerationSettings() { return generation_; }
    void setGenerationSettings(const GenerationSettings& settings) { generation_ = settings; }

    const ScoringSettings& getScoringSettings() const { return scoring_; }
    ScoringSettings& getScoringSettings() { return scoring_; }
    void setScoringSettings(const ScoringSettings& settings) { scoring_ = settings; }

    /**
     * @brief Validate the settings without building anything
     * @return Vector of validation errors (empty if valid)
     */
    std::vector<std::string> validate() const;

    /**
     * @brief Build the immutable request for the generation pipeline
     * @throws SchemaError for an invalid combination of settings
     */
    GenerationRequest toGenerationRequest() const;

    const std::string& getLastError() const { return lastError_; }

    static SynthConfiguration createDefault();

    /**
     * @brief Convert configuration to JSON string
     */
    std::string toJsonString() const;

private:
    GenerationSettings generation_;
    ScoringSettings scoring_;
    mutable std::string lastError_;

    bool parseJson(const std::string& jsonContent);

    void setError(const std::string& error) const { lastError_ = error; }
};

} // namespace trialsynth
