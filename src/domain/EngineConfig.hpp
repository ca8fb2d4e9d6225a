/**
 * @file EngineConfig.hpp
 * @brief Construction-time configuration of the scoring engine and per-call options.
 */

#pragma once

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/AnnotationInstance.hpp"
#include "domain/AnnotationSchema.hpp"

namespace annobench::domain {

/**
 * @struct EngineConfig
 * @brief Immutable settings of one engine instance. Persisted as settings JSON by ConfigLoader.
 */
struct EngineConfig {
    double matchingThreshold = 0.7;
    bool verbose = false;                 ///< Progress logging on stdout.
    bool includeDetails = true;           ///< Emit per-pair detailed_results.
    double penaltyPerIssue = 0.05;
    double maxPenalty = 0.3;
    size_t maxDifficultPairs = 10;
    double difficultFieldThreshold = 0.3;
    std::optional<std::string> candidateKey; ///< Restrict candidate pairs to equal values of this field.

    /** @throws std::invalid_argument when a value is out of range. */
    void validate() const {
        if (!(matchingThreshold >= 0.0 && matchingThreshold <= 1.0)) {
            throw std::invalid_argument("EngineConfig: matchingThreshold must lie in [0, 1].");
        }
        if (!(penaltyPerIssue >= 0.0 && penaltyPerIssue <= 1.0)) {
            throw std::invalid_argument("EngineConfig: penaltyPerIssue must lie in [0, 1].");
        }
        if (!(maxPenalty >= 0.0 && maxPenalty <= 1.0)) {
            throw std::invalid_argument("EngineConfig: maxPenalty must lie in [0, 1].");
        }
        if (!(difficultFieldThreshold >= 0.0 && difficultFieldThreshold <= 1.0)) {
            throw std::invalid_argument("EngineConfig: difficultFieldThreshold must lie in [0, 1].");
        }
        if (candidateKey && candidateKey->empty()) {
            throw std::invalid_argument("EngineConfig: candidateKey cannot be empty.");
        }
    }
};

/**
 * @struct EvaluationOptions
 * @brief Per-call overrides. Everything is optional.
 */
struct EvaluationOptions {
    std::optional<WeightMap> fieldWeights;          ///< Absent fields keep the schema weight.
    std::optional<double> threshold;                ///< Overrides EngineConfig::matchingThreshold.
    std::vector<AnnotationInstance> related;        ///< Records for referential-integrity checks.
};

} // namespace annobench::domain
