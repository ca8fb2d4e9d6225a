/**
 * @file AnnotationBenchmark.cpp
 * @brief Implementation of AnnotationBenchmark.
 */

#include "application/AnnotationBenchmark.hpp"

#include <iostream>
#include <stdexcept>

#include "application/ConsistencyValidator.hpp"
#include "application/InstanceMatcher.hpp"
#include "infrastructure/AnnotationJson.hpp"

namespace annobench::application {

using domain::AnnotationInstance;
using domain::EvaluationOptions;
using domain::ScoreReport;
using infrastructure::AnnotationJson;

AnnotationBenchmark::AnnotationBenchmark(domain::AnnotationSchema schema, domain::EngineConfig config)
    : m_schema(std::move(schema)), m_config(std::move(config)) {
    m_config.validate();
}

double AnnotationBenchmark::ResolveThreshold(const EvaluationOptions& options) const {
    const double threshold = options.threshold.value_or(m_config.matchingThreshold);
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("Matching threshold must lie in [0, 1].");
    }
    return threshold;
}

ScoreReport AnnotationBenchmark::EvaluatePair(const AnnotationInstance& groundTruth, const AnnotationInstance& prediction,
                                              const EvaluationOptions& options) const {
    const domain::scoring::PairScorer scorer(m_schema, m_schema.effectiveWeights(options.fieldWeights));
    const std::vector<AnnotationInstance> predictions{prediction};
    const std::vector<AnnotationInstance> groundTruths{groundTruth};

    std::vector<domain::PairScore> pairs;
    pairs.push_back(scorer.score(prediction, groundTruth, 0, 0));
    return ScorePairs(std::move(pairs), predictions, groundTruths, scorer, options);
}

ScoreReport AnnotationBenchmark::EvaluateSet(const std::vector<AnnotationInstance>& groundTruths,
                                             const std::vector<AnnotationInstance>& predictions,
                                             const EvaluationOptions& options) const {
    const double threshold = ResolveThreshold(options);
    const domain::scoring::PairScorer scorer(m_schema, m_schema.effectiveWeights(options.fieldWeights));

    if (groundTruths.empty() && predictions.empty()) {
        ScoreReport report;
        report.overallScore = 1.0;
        report.status = domain::status::BothEmpty;
        return report;
    }
    if (groundTruths.empty() || predictions.empty()) {
        ScoreReport report;
        report.overallScore = 0.0;
        report.status = domain::status::OneEmpty;
        report.unmatchedPredictions = static_cast<int>(predictions.size());
        report.unmatchedGroundTruths = static_cast<int>(groundTruths.size());
        if (m_config.verbose) {
            std::cout << "[AnnotationBenchmark] " << m_schema.getName() << ": " << groundTruths.size()
                      << " ground truths vs " << predictions.size() << " predictions, nothing to pair." << std::endl;
        }
        return report;
    }

    const InstanceMatcher matcher(scorer, threshold, m_config.candidateKey, m_config.verbose);
    domain::MatchSet matches = matcher.Match(predictions, groundTruths);

    ScoreReport report = ScorePairs(std::move(matches.pairs), predictions, groundTruths, scorer, options);
    report.unmatchedPredictions = static_cast<int>(matches.unmatchedPredictions.size());
    report.unmatchedGroundTruths = static_cast<int>(matches.unmatchedGroundTruths.size());
    return report;
}

ScoreReport AnnotationBenchmark::ScorePairs(std::vector<domain::PairScore> pairs,
                                            const std::vector<AnnotationInstance>& predictions,
                                            const std::vector<AnnotationInstance>& groundTruths,
                                            const domain::scoring::PairScorer& scorer,
                                            const EvaluationOptions& options) const {
    const ConsistencyValidator validator(m_schema, m_config.penaltyPerIssue, m_config.maxPenalty);

    std::vector<EvaluatedPair> evaluated;
    evaluated.reserve(pairs.size());
    size_t issueCount = 0;
    for (auto& pair : pairs) {
        EvaluatedPair entry;
        entry.prediction = &predictions.at(pair.predictionIndex);
        entry.groundTruth = &groundTruths.at(pair.groundTruthIndex);
        entry.issues = validator.Validate(*entry.prediction, options.related);
        entry.penalty = validator.ApplyPenalties(pair, entry.issues, scorer);
        entry.score = std::move(pair);
        issueCount += entry.issues.size();
        evaluated.push_back(std::move(entry));
    }

    const Aggregator aggregator(m_schema, scorer.getWeights(), m_config);
    ScoreReport report = aggregator.Aggregate(evaluated);

    if (m_config.verbose) {
        std::cout << "[AnnotationBenchmark] " << m_schema.getName() << ": " << evaluated.size()
                  << " pairs scored, " << issueCount << " consistency issues, overall "
                  << report.overallScore << "." << std::endl;
    }
    return report;
}

ScoreReport AnnotationBenchmark::Evaluate(const nlohmann::json& samples, const EvaluationOptions& options) const {
    if (!samples.is_array() || samples.size() != 2) {
        throw std::invalid_argument("Samples must be a two-element array [ground_truth, prediction].");
    }
    const auto& groundTruth = samples[0];
    const auto& prediction = samples[1];

    if (groundTruth.is_object() && prediction.is_object()) {
        return EvaluatePair(AnnotationJson::InstanceFromJson(groundTruth), AnnotationJson::InstanceFromJson(prediction),
                            options);
    }
    if (groundTruth.is_array() && prediction.is_array()) {
        return EvaluateSet(AnnotationJson::InstancesFromJson(groundTruth), AnnotationJson::InstancesFromJson(prediction),
                           options);
    }
    throw std::invalid_argument("Ground truth and prediction must both be objects or both be arrays.");
}

domain::ReportSummary AnnotationBenchmark::Summarize(const ScoreReport& report) const {
    const Aggregator aggregator(m_schema, m_schema.defaultWeights(), m_config);
    return aggregator.Summarize(report);
}

} // namespace annobench::application
