/**
 * @file AnnotationBenchmark.hpp
 * @brief Entry point of the engine: matching, scoring, consistency penalties and aggregation.
 */

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "application/Aggregator.hpp"
#include "domain/AnnotationInstance.hpp"
#include "domain/AnnotationSchema.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/PairScore.hpp"
#include "domain/ScoreReport.hpp"
#include "domain/scoring/PairScorer.hpp"

namespace annobench::application {

/**
 * @class AnnotationBenchmark
 * @brief Benchmarks predicted annotations against ground truth for one schema.
 *
 * Immutable after construction; every call builds its scorer, matcher and validator
 * fresh, so one instance may be shared between threads.
 */
class AnnotationBenchmark {
public:
    /** @throws std::invalid_argument when the configuration is out of range. */
    explicit AnnotationBenchmark(domain::AnnotationSchema schema, domain::EngineConfig config = {});

    /**
     * @brief Single-pair mode: scores one prediction against one ground truth, no matching step.
     */
    domain::ScoreReport EvaluatePair(const domain::AnnotationInstance& groundTruth,
                                     const domain::AnnotationInstance& prediction,
                                     const domain::EvaluationOptions& options = {}) const;

    /**
     * @brief Set mode: pairs predictions to ground truths, then scores and penalizes the pairs.
     *
     * Both lists empty yields overall 1.0 with status both_empty; exactly one empty
     * yields 0.0 with status one_empty.
     */
    domain::ScoreReport EvaluateSet(const std::vector<domain::AnnotationInstance>& groundTruths,
                                    const std::vector<domain::AnnotationInstance>& predictions,
                                    const domain::EvaluationOptions& options = {}) const;

    /**
     * @brief JSON contract: samples is [groundTruth, prediction], both objects (pair mode)
     *        or both arrays of objects (set mode).
     * @throws std::invalid_argument for any other shape.
     */
    domain::ScoreReport Evaluate(const nlohmann::json& samples, const domain::EvaluationOptions& options = {}) const;

    domain::ReportSummary Summarize(const domain::ScoreReport& report) const;

    const domain::AnnotationSchema& getSchema() const { return m_schema; }
    const domain::EngineConfig& getConfig() const { return m_config; }

private:
    double ResolveThreshold(const domain::EvaluationOptions& options) const;

    domain::ScoreReport ScorePairs(std::vector<domain::PairScore> pairs,
                                   const std::vector<domain::AnnotationInstance>& predictions,
                                   const std::vector<domain::AnnotationInstance>& groundTruths,
                                   const domain::scoring::PairScorer& scorer,
                                   const domain::EvaluationOptions& options) const;

    domain::AnnotationSchema m_schema;
    domain::EngineConfig m_config;
};

} // namespace annobench::application
