#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "application/Aggregator.hpp"
#include "domain/scoring/PairScorer.hpp"

using namespace annobench::domain;
using namespace annobench::domain::scoring;
using annobench::application::Aggregator;
using annobench::application::EvaluatedPair;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

AnnotationSchema TestSchema() {
    FieldRoles roles;
    roles.identifiers = {"Annotation ID"};
    return AnnotationSchema("aggregate", {
        {"Annotation ID", EvaluatorKind::ExactMatch, 0.0, {}},
        {"Gene", EvaluatorKind::ExactMatch, 1.0, {}},
        {"Direction of effect", EvaluatorKind::CategoryEqual, 3.0, {}},
    }, roles);
}

EvaluatedPair Evaluate(const PairScorer& scorer, const AnnotationInstance& prediction, const AnnotationInstance& groundTruth) {
    EvaluatedPair pair;
    pair.score = scorer.score(prediction, groundTruth);
    pair.prediction = &prediction;
    pair.groundTruth = &groundTruth;
    return pair;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Aggregator Test..." << std::endl;

    const AnnotationSchema schema = TestSchema();
    const WeightMap weights = schema.defaultWeights();
    const PairScorer scorer(schema, weights);
    EngineConfig config;

    const AnnotationInstance truthA{{"Annotation ID", "1"}, {"Gene", "CYP2D6"}, {"Direction of effect", "increased"}};
    const AnnotationInstance truthB{{"Annotation ID", "2"}, {"Gene", "TPMT"}, {"Direction of effect", "decreased"}};
    const AnnotationInstance predA{{"Annotation ID", "1"}, {"Gene", "CYP2D6"}, {"Direction of effect", "increased"}};
    const AnnotationInstance predB{{"Annotation ID", "7"}, {"Gene", "TPMT"}, {"Direction of effect", "increased"}};

    std::cout << "[Test] Field means, overall score and details..." << std::endl;
    {
        std::vector<EvaluatedPair> pairs;
        pairs.push_back(Evaluate(scorer, predA, truthA));
        pairs.push_back(Evaluate(scorer, predB, truthB));

        const Aggregator aggregator(schema, weights, config);
        const ScoreReport report = aggregator.Aggregate(pairs);

        assert(report.totalSamples == 2);
        assert(report.fieldScores.size() == 3);
        assert(report.fieldScores[0].field == "Annotation ID" && "Schema order is kept.");
        assert(Near(report.findField("Gene")->meanScore, 1.0));
        assert(Near(report.findField("Direction of effect")->meanScore, 0.5));
        assert(report.findField("Direction of effect")->scores.size() == 2);
        // (1.0 * 1 + 0.5 * 3) / 4, the zero-weight ID does not count
        assert(Near(report.overallScore, 0.625));

        assert(report.detailedResults.size() == 2);
        const PairDetail& second = report.detailedResults[1];
        assert(second.sampleId == 1);
        assert(Near(second.matchScore, 0.25));
        bool sawDirection = false;
        for (const auto& [field, values] : second.fieldValues) {
            if (field != "Direction of effect") continue;
            sawDirection = true;
            assert(values.groundTruth.value() == "decreased");
            assert(values.prediction.value() == "increased");
        }
        assert(sawDirection);

        const FieldStatistics& ids = report.fieldStatistics[0];
        assert(ids.exactMatches == 1 && Near(ids.exactMatchRate, 0.5));
        assert(ids.errorTypes.at("content_mismatch") == 1);

        const RunStatistics& run = report.runStatistics;
        assert(run.matchedPairs == 2);
        assert(Near(run.minScore, 0.25) && Near(run.maxScore, 1.0));
        assert(Near(run.meanOverallScore, 0.625));
        assert(run.distribution.excellent == 1 && run.distribution.poor == 1);
        assert(run.difficultPairs.size() == 2);
        assert(run.difficultPairs[0].sampleId == 1 && "Hardest pair first.");
        assert(run.difficultPairs[0].mainIssues.size() == 2);

        std::cout << "[Test] Summary leaves out identifier fields..." << std::endl;
        const ReportSummary summary = aggregator.Summarize(report);
        assert(summary.lowScoringFields.size() == 1);
        assert(summary.lowScoringFields[0].field == "Direction of effect");
        assert(summary.lowScoringFields[0].sampleValues.size() == 2);
        assert(summary.dependencyIssues.empty() && summary.penalties.empty());
    }

    std::cout << "[Test] Difficult pairs are capped..." << std::endl;
    {
        std::vector<EvaluatedPair> pairs;
        for (int i = 0; i < 4; ++i) pairs.push_back(Evaluate(scorer, predB, truthB));
        EngineConfig capped;
        capped.maxDifficultPairs = 3;
        capped.includeDetails = false;
        const ScoreReport report = Aggregator(schema, weights, capped).Aggregate(pairs);
        assert(report.runStatistics.difficultPairs.size() == 3);
        assert(report.detailedResults.empty());
    }

    std::cout << "[Test] No matched pairs..." << std::endl;
    {
        const ScoreReport report = Aggregator(schema, weights, config).Aggregate({});
        assert(report.totalSamples == 0);
        assert(report.overallScore == 0.0);
        assert(report.fieldScores.size() == 3);
        for (const auto& field : report.fieldScores) {
            assert(field.meanScore == 0.0 && field.scores.empty());
        }
    }

    std::cout << "[Test] Penalties surface in the summary..." << std::endl;
    {
        std::vector<EvaluatedPair> pairs;
        pairs.push_back(Evaluate(scorer, predA, truthA));
        pairs[0].issues.push_back({IssueCode::Unclassified, "Contradiction.", {}});
        pairs[0].penalty.totalPenalty = 0.05;
        pairs[0].penalty.penalizedFields["Gene"] = {1.0, 0.95, 5.0};
        pairs[0].penalty.issuesByField["Gene"] = {"Contradiction."};

        const Aggregator aggregator(schema, weights, config);
        const ReportSummary summary = aggregator.Summarize(aggregator.Aggregate(pairs));
        assert(summary.dependencyIssues.size() == 1);
        assert(summary.penalties.size() == 1);
        assert(summary.penalties[0].penalizedFields.size() == 1 && summary.penalties[0].issuesCount == 1);
    }

    std::cout << "[PASS] Aggregator Test." << std::endl;
    return 0;
}
