/**
 * @file InstanceMatcher.cpp
 * @brief Implementation of InstanceMatcher.
 */

#include "application/InstanceMatcher.hpp"

#include <algorithm>
#include <iostream>

#include "domain/scoring/FieldEvaluators.hpp"

namespace annobench::application {

using domain::AnnotationInstance;
using domain::MatchSet;
using domain::PairScore;

InstanceMatcher::InstanceMatcher(const domain::scoring::PairScorer& scorer, double threshold,
                                 std::optional<std::string> candidateKey, bool verbose)
    : m_scorer(scorer), m_threshold(threshold), m_candidateKey(std::move(candidateKey)), m_verbose(verbose) {}

bool InstanceMatcher::IsCandidate(const AnnotationInstance& prediction, const AnnotationInstance& groundTruth) const {
    if (!m_candidateKey) return true;
    const auto& predKey = prediction.get(*m_candidateKey);
    const auto& gtKey = groundTruth.get(*m_candidateKey);
    if (predKey.isAbsent() || gtKey.isAbsent()) return false;
    return domain::scoring::FieldEvaluators::exactMatch(predKey, gtKey) == 1.0;
}

MatchSet InstanceMatcher::Match(const std::vector<AnnotationInstance>& predictions,
                                const std::vector<AnnotationInstance>& groundTruths) const {
    MatchSet result;
    if (predictions.empty() || groundTruths.empty()) {
        for (size_t i = 0; i < predictions.size(); ++i) result.unmatchedPredictions.push_back(i);
        for (size_t j = 0; j < groundTruths.size(); ++j) result.unmatchedGroundTruths.push_back(j);
        return result;
    }

    // Candidates are generated prediction-major, so a stable sort keeps index order on ties.
    std::vector<PairScore> candidates;
    for (size_t i = 0; i < predictions.size(); ++i) {
        for (size_t j = 0; j < groundTruths.size(); ++j) {
            if (!IsCandidate(predictions[i], groundTruths[j])) continue;
            PairScore pair = m_scorer.score(predictions[i], groundTruths[j], i, j);
            if (pair.aggregate >= m_threshold) {
                candidates.push_back(std::move(pair));
            }
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const PairScore& lhs, const PairScore& rhs) { return lhs.aggregate > rhs.aggregate; });

    std::vector<bool> predictionAssigned(predictions.size(), false);
    std::vector<bool> groundTruthUsed(groundTruths.size(), false);
    for (auto& candidate : candidates) {
        if (predictionAssigned[candidate.predictionIndex]) continue;
        predictionAssigned[candidate.predictionIndex] = true;
        groundTruthUsed[candidate.groundTruthIndex] = true;
        result.pairs.push_back(std::move(candidate));
    }

    for (size_t i = 0; i < predictions.size(); ++i) {
        if (!predictionAssigned[i]) result.unmatchedPredictions.push_back(i);
    }
    for (size_t j = 0; j < groundTruths.size(); ++j) {
        if (!groundTruthUsed[j]) result.unmatchedGroundTruths.push_back(j);
    }

    if (m_verbose) {
        std::cout << "[InstanceMatcher] " << predictions.size() << " predictions x " << groundTruths.size()
                  << " ground truths: " << candidates.size() << " candidates >= " << m_threshold << ", "
                  << result.pairs.size() << " matched, " << result.unmatchedPredictions.size()
                  << " predictions and " << result.unmatchedGroundTruths.size() << " ground truths unmatched."
                  << std::endl;
    }
    return result;
}

} // namespace annobench::application
