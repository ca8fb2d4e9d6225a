/**
 * @file PairScorer.hpp
 * @brief Domain service combining field-level scores of one pair into a weighted match score.
 */

#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/AnnotationInstance.hpp"
#include "domain/AnnotationSchema.hpp"
#include "domain/PairScore.hpp"

namespace annobench::domain::scoring {

/**
 * @class PairScorer
 * @brief Applies each schema field's metric to (prediction, ground truth) and averages with weights.
 *
 * Holds a reference to the schema; the schema must outlive the scorer.
 */
class PairScorer {
public:
    PairScorer(const AnnotationSchema& schema, WeightMap weights);

    /**
     * @brief Scores one pair. Every schema field gets an entry, absent values included.
     * @param predictionIndex Position of the prediction in its input list (bookkeeping only).
     * @param groundTruthIndex Position of the ground truth in its input list (bookkeeping only).
     */
    PairScore score(const AnnotationInstance& prediction, const AnnotationInstance& groundTruth,
                    size_t predictionIndex = 0, size_t groundTruthIndex = 0) const;

    /** @brief Weighted mean of the given field scores using this scorer's weights. */
    double weightedScore(const std::vector<std::pair<std::string, double>>& fieldScores) const;

    /**
     * @brief Weighted mean; fields without an entry in weights count with weight 1.0.
     * @return 0.0 when the total weight is zero.
     */
    static double computeWeightedScore(const std::vector<std::pair<std::string, double>>& fieldScores,
                                       const WeightMap& weights);

    const WeightMap& getWeights() const { return m_weights; }

private:
    const AnnotationSchema& m_schema;
    WeightMap m_weights;
};

} // namespace annobench::domain::scoring
