/**
 * @file Aggregator.cpp
 * @brief Implementation of Aggregator.
 */

#include "application/Aggregator.hpp"

#include <algorithm>
#include <numeric>

#include "domain/scoring/FieldEvaluators.hpp"
#include "domain/scoring/PairScorer.hpp"

namespace annobench::application {

using domain::FieldStatistics;
using domain::ScoreReport;
using domain::scoring::FieldEvaluators;

namespace {

std::optional<std::string> RenderValue(const domain::FieldValue& value) {
    if (value.isAbsent()) return std::nullopt;
    return value.toString();
}

double Mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

} // namespace

Aggregator::Aggregator(const domain::AnnotationSchema& schema, domain::WeightMap weights, const domain::EngineConfig& config)
    : m_schema(schema), m_weights(std::move(weights)), m_config(config) {}

std::vector<FieldStatistics> Aggregator::BuildFieldStatistics(const std::vector<EvaluatedPair>& pairs) const {
    std::vector<FieldStatistics> stats;
    stats.reserve(m_schema.getFields().size());

    for (const auto& spec : m_schema.getFields()) {
        FieldStatistics field;
        field.field = spec.name;
        for (const auto& pair : pairs) {
            const double score = pair.score.fieldScore(spec.name);
            field.scores.push_back(score);

            const domain::FieldValue predicted = pair.prediction ? pair.prediction->get(spec.name) : domain::FieldValue();
            const domain::FieldValue expected = pair.groundTruth ? pair.groundTruth->get(spec.name) : domain::FieldValue();
            if (FieldEvaluators::exactMatch(predicted, expected) == 1.0) {
                ++field.exactMatches;
            }
            // Error types come from the unpenalized metric.
            const double rawScore = FieldEvaluators::evaluate(spec, predicted, expected);
            if (auto error = FieldEvaluators::classifyError(predicted, expected, rawScore)) {
                ++field.errorTypes[*error];
            }
        }
        field.meanScore = Mean(field.scores);
        field.exactMatchRate = pairs.empty() ? 0.0 : static_cast<double>(field.exactMatches) / static_cast<double>(pairs.size());
        stats.push_back(std::move(field));
    }
    return stats;
}

domain::RunStatistics Aggregator::BuildRunStatistics(const std::vector<EvaluatedPair>& pairs, double meanWeightedScore) const {
    domain::RunStatistics run;
    run.matchedPairs = static_cast<int>(pairs.size());
    run.meanWeightedScore = meanWeightedScore;
    if (pairs.empty()) return run;

    std::vector<double> overall;
    overall.reserve(pairs.size());
    for (const auto& pair : pairs) overall.push_back(pair.score.aggregate);

    run.meanOverallScore = Mean(overall);
    run.minScore = *std::min_element(overall.begin(), overall.end());
    run.maxScore = *std::max_element(overall.begin(), overall.end());

    for (double score : overall) {
        if (score >= 0.9) ++run.distribution.excellent;
        else if (score >= 0.7) ++run.distribution.good;
        else if (score >= 0.5) ++run.distribution.fair;
        else ++run.distribution.poor;
    }

    std::vector<size_t> order(pairs.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t lhs, size_t rhs) { return overall[lhs] < overall[rhs]; });
    const size_t count = std::min(order.size(), m_config.maxDifficultPairs);
    for (size_t k = 0; k < count; ++k) {
        const auto& pair = pairs[order[k]];
        domain::DifficultPair difficult;
        difficult.sampleId = static_cast<int>(order[k]);
        difficult.score = pair.score.aggregate;
        for (const auto& [field, score] : pair.score.fieldScores) {
            if (score < m_config.difficultFieldThreshold) difficult.mainIssues.push_back(field);
        }
        run.difficultPairs.push_back(std::move(difficult));
    }
    return run;
}

ScoreReport Aggregator::Aggregate(const std::vector<EvaluatedPair>& pairs) const {
    ScoreReport report;
    report.totalSamples = static_cast<int>(pairs.size());
    report.fieldStatistics = BuildFieldStatistics(pairs);

    std::vector<std::pair<std::string, double>> fieldMeans;
    for (const auto& stats : report.fieldStatistics) {
        report.fieldScores.push_back({stats.field, stats.meanScore, stats.scores});
        fieldMeans.emplace_back(stats.field, stats.meanScore);
    }
    report.overallScore = pairs.empty() ? 0.0 : domain::scoring::PairScorer::computeWeightedScore(fieldMeans, m_weights);
    report.runStatistics = BuildRunStatistics(pairs, report.overallScore);

    if (!m_config.includeDetails) return report;

    for (size_t i = 0; i < pairs.size(); ++i) {
        const auto& pair = pairs[i];
        domain::PairDetail detail;
        detail.sampleId = static_cast<int>(i);
        detail.predictionIndex = pair.score.predictionIndex;
        detail.groundTruthIndex = pair.score.groundTruthIndex;
        detail.matchScore = pair.score.aggregate;
        detail.rawMatchScore = pair.score.rawAggregate;
        detail.fieldScores = pair.score.fieldScores;
        for (const auto& spec : m_schema.getFields()) {
            domain::FieldValuePair values;
            if (pair.groundTruth) values.groundTruth = RenderValue(pair.groundTruth->get(spec.name));
            if (pair.prediction) values.prediction = RenderValue(pair.prediction->get(spec.name));
            detail.fieldValues.emplace_back(spec.name, std::move(values));
        }
        for (const auto& issue : pair.issues) detail.dependencyIssues.push_back(issue.message);
        detail.penaltyInfo = pair.penalty;
        report.detailedResults.push_back(std::move(detail));
    }
    return report;
}

domain::ReportSummary Aggregator::Summarize(const ScoreReport& report) const {
    domain::ReportSummary summary;
    summary.overallScore = report.overallScore;
    summary.totalSamples = report.totalSamples;
    summary.status = report.status;
    summary.fieldScores = report.fieldScores;

    const auto& excluded = m_schema.getRoles().identifiers;
    std::vector<domain::FieldScoreSummary> sorted = report.fieldScores;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.meanScore > rhs.meanScore; });
    if (!report.detailedResults.empty()) {
        for (const auto& field : sorted) {
            if (field.meanScore >= 1.0) continue;
            if (std::find(excluded.begin(), excluded.end(), field.field) != excluded.end()) continue;
            domain::LowScoringField low;
            low.field = field.field;
            low.meanScore = field.meanScore;
            low.scores = field.scores;
            for (const auto& detail : report.detailedResults) {
                for (const auto& [name, values] : detail.fieldValues) {
                    if (name == field.field) low.sampleValues.push_back(values);
                }
            }
            summary.lowScoringFields.push_back(std::move(low));
        }
    }

    for (const auto& detail : report.detailedResults) {
        for (const auto& issue : detail.dependencyIssues) {
            if (std::find(summary.dependencyIssues.begin(), summary.dependencyIssues.end(), issue) ==
                summary.dependencyIssues.end()) {
                summary.dependencyIssues.push_back(issue);
            }
        }
        if (detail.penaltyInfo.totalPenalty > 0.0) {
            domain::PenaltySummary penalty;
            penalty.totalPenalty = detail.penaltyInfo.totalPenalty;
            for (const auto& entry : detail.penaltyInfo.penalizedFields) penalty.penalizedFields.push_back(entry.first);
            penalty.issuesCount = static_cast<int>(detail.penaltyInfo.issuesByField.size());
            summary.penalties.push_back(std::move(penalty));
        }
    }
    return summary;
}

} // namespace annobench::application
