/**
 * @file Aggregator.hpp
 * @brief Reduces scored pairs into field-level and run-level statistics.
 */

#pragma once

#include <vector>

#include "domain/AnnotationInstance.hpp"
#include "domain/AnnotationSchema.hpp"
#include "domain/ConsistencyIssue.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/PairScore.hpp"
#include "domain/ScoreReport.hpp"

namespace annobench::application {

/**
 * @struct EvaluatedPair
 * @brief A matched pair after consistency penalties, with the records that produced it.
 *
 * The record pointers refer into the caller's input lists and are only read during Aggregate().
 */
struct EvaluatedPair {
    domain::PairScore score;
    const domain::AnnotationInstance* prediction = nullptr;
    const domain::AnnotationInstance* groundTruth = nullptr;
    std::vector<domain::ConsistencyIssue> issues;
    domain::PenaltyInfo penalty;
};

/**
 * @class Aggregator
 * @brief Builds the ScoreReport: per-field means and error histograms, run statistics,
 *        and optionally the per-pair detail.
 */
class Aggregator {
public:
    Aggregator(const domain::AnnotationSchema& schema, domain::WeightMap weights, const domain::EngineConfig& config);

    domain::ScoreReport Aggregate(const std::vector<EvaluatedPair>& pairs) const;

    /**
     * @brief Condensed report: low-scoring fields with the values behind them, unique issues
     *        and per-pair penalty summaries. Identifier fields of the schema are left out.
     */
    domain::ReportSummary Summarize(const domain::ScoreReport& report) const;

private:
    std::vector<domain::FieldStatistics> BuildFieldStatistics(const std::vector<EvaluatedPair>& pairs) const;
    domain::RunStatistics BuildRunStatistics(const std::vector<EvaluatedPair>& pairs, double meanWeightedScore) const;

    const domain::AnnotationSchema& m_schema;
    domain::WeightMap m_weights;
    const domain::EngineConfig& m_config;
};

} // namespace annobench::application
