/**
 * @file PairScore.hpp
 * @brief Scoring result for one (prediction, ground truth) pair and the set of accepted pairs.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace annobench::domain {

/**
 * @struct PairScore
 * @brief Per-field scores of one pair, in schema order, plus their weighted mean.
 *
 * rawAggregate is the score the matcher saw; aggregate is updated when consistency
 * penalties are applied afterwards.
 */
struct PairScore {
    size_t predictionIndex = 0;
    size_t groundTruthIndex = 0;
    std::vector<std::pair<std::string, double>> fieldScores;
    double aggregate = 0.0;
    double rawAggregate = 0.0;

    double fieldScore(const std::string& field) const {
        for (const auto& entry : fieldScores) {
            if (entry.first == field) return entry.second;
        }
        return 0.0;
    }

    double* mutableFieldScore(const std::string& field) {
        for (auto& entry : fieldScores) {
            if (entry.first == field) return &entry.second;
        }
        return nullptr;
    }
};

/**
 * @struct MatchSet
 * @brief Pairs chosen by the matcher.
 *
 * Invariant: a prediction index appears in at most one pair. Ground-truth indices may repeat.
 * Unmatched indices are informational and never affect scoring.
 */
struct MatchSet {
    std::vector<PairScore> pairs;
    std::vector<size_t> unmatchedPredictions;
    std::vector<size_t> unmatchedGroundTruths;
};

} // namespace annobench::domain
