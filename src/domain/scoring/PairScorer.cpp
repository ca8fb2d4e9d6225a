/**
 * @file PairScorer.cpp
 * @brief Implementation of PairScorer.
 */

#include "domain/scoring/PairScorer.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

#include "domain/scoring/FieldEvaluators.hpp"

namespace annobench::domain::scoring {

PairScorer::PairScorer(const AnnotationSchema& schema, WeightMap weights)
    : m_schema(schema), m_weights(std::move(weights)) {}

PairScore PairScorer::score(const AnnotationInstance& prediction, const AnnotationInstance& groundTruth,
                            size_t predictionIndex, size_t groundTruthIndex) const {
    PairScore result;
    result.predictionIndex = predictionIndex;
    result.groundTruthIndex = groundTruthIndex;
    result.fieldScores.reserve(m_schema.getFields().size());

    for (const auto& spec : m_schema.getFields()) {
        double value = 0.0;
        try {
            value = FieldEvaluators::evaluate(spec, prediction.get(spec.name), groundTruth.get(spec.name));
        } catch (const std::exception& e) {
            std::cerr << "[PairScorer] Evaluator failed for field '" << spec.name << "': " << e.what()
                      << ". Scoring 0." << std::endl;
            value = 0.0;
        }
        result.fieldScores.emplace_back(spec.name, std::clamp(value, 0.0, 1.0));
    }

    result.aggregate = weightedScore(result.fieldScores);
    result.rawAggregate = result.aggregate;
    return result;
}

double PairScorer::weightedScore(const std::vector<std::pair<std::string, double>>& fieldScores) const {
    return computeWeightedScore(fieldScores, m_weights);
}

double PairScorer::computeWeightedScore(const std::vector<std::pair<std::string, double>>& fieldScores,
                                        const WeightMap& weights) {
    double weightedSum = 0.0;
    double totalWeight = 0.0;
    for (const auto& [field, score] : fieldScores) {
        auto it = weights.find(field);
        const double weight = it != weights.end() ? it->second : 1.0;
        weightedSum += score * weight;
        totalWeight += weight;
    }
    return totalWeight > 0.0 ? weightedSum / totalWeight : 0.0;
}

} // namespace annobench::domain::scoring
