/**
 * @file InstanceMatcher.hpp
 * @brief Pairs predicted records with ground-truth records that share no identifier.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/AnnotationInstance.hpp"
#include "domain/PairScore.hpp"
#include "domain/scoring/PairScorer.hpp"

namespace annobench::application {

/**
 * @class InstanceMatcher
 * @brief Greedy best-first matching over all candidate pairs above a threshold.
 *
 * Each prediction is assigned at most once; several predictions may land on the same
 * ground truth (a model may split one true fact into several rows).
 */
class InstanceMatcher {
public:
    /**
     * @param scorer Scorer bound to the schema and effective weights; must outlive the matcher.
     * @param threshold Minimum aggregate score for a pair to be eligible.
     * @param candidateKey When set, only pairs agreeing on this field are candidates.
     */
    InstanceMatcher(const domain::scoring::PairScorer& scorer, double threshold,
                    std::optional<std::string> candidateKey = std::nullopt, bool verbose = false);

    /** @brief Scores all P x G combinations and resolves the matching. */
    domain::MatchSet Match(const std::vector<domain::AnnotationInstance>& predictions,
                           const std::vector<domain::AnnotationInstance>& groundTruths) const;

private:
    bool IsCandidate(const domain::AnnotationInstance& prediction, const domain::AnnotationInstance& groundTruth) const;

    const domain::scoring::PairScorer& m_scorer;
    double m_threshold;
    std::optional<std::string> m_candidateKey;
    bool m_verbose;
};

} // namespace annobench::application
