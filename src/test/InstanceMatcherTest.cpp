#include <cassert>
#include <iostream>
#include <random>
#include <set>
#include <vector>

#include "application/InstanceMatcher.hpp"
#include "domain/scoring/PairScorer.hpp"

using namespace annobench::domain;
using namespace annobench::domain::scoring;
using annobench::application::InstanceMatcher;

namespace {

AnnotationSchema GeneDrugSchema() {
    return AnnotationSchema("gene_drug", {
        {"Gene", EvaluatorKind::ExactMatch, 1.0, {}},
        {"Drug(s)", EvaluatorKind::ExactMatch, 1.0, {}},
        {"Direction of effect", EvaluatorKind::CategoryEqual, 1.0, {}},
    });
}

AnnotationInstance Record(const std::string& gene, const std::string& drug, const std::string& direction) {
    return AnnotationInstance{{"Gene", gene}, {"Drug(s)", drug}, {"Direction of effect", direction}};
}

void CheckInvariants(const MatchSet& result, size_t predictionCount, size_t groundTruthCount, double threshold) {
    std::set<size_t> seenPredictions;
    for (const auto& pair : result.pairs) {
        assert(pair.aggregate >= threshold && "No pair below threshold.");
        assert(pair.predictionIndex < predictionCount);
        assert(pair.groundTruthIndex < groundTruthCount);
        assert(seenPredictions.insert(pair.predictionIndex).second && "Prediction used twice.");
    }
    for (size_t index : result.unmatchedPredictions) {
        assert(!seenPredictions.count(index));
    }
    assert(result.pairs.size() + result.unmatchedPredictions.size() == predictionCount);
}

} // namespace

int main() {
    std::cout << "[Test] Starting InstanceMatcher Test..." << std::endl;

    const AnnotationSchema schema = GeneDrugSchema();
    const PairScorer scorer(schema, schema.defaultWeights());

    std::cout << "[Test] Pairs out-of-order lists..." << std::endl;
    {
        const std::vector<AnnotationInstance> predictions = {
            Record("CYP2C19", "clopidogrel", "decreased"),
            Record("CYP2D6", "codeine", "increased"),
        };
        const std::vector<AnnotationInstance> groundTruths = {
            Record("CYP2D6", "codeine", "increased"),
            Record("CYP2C19", "clopidogrel", "decreased"),
        };
        const InstanceMatcher matcher(scorer, 0.7);
        const MatchSet result = matcher.Match(predictions, groundTruths);
        assert(result.pairs.size() == 2);
        // Ties at 1.0 keep prediction order.
        assert(result.pairs[0].predictionIndex == 0 && result.pairs[0].groundTruthIndex == 1);
        assert(result.pairs[1].predictionIndex == 1 && result.pairs[1].groundTruthIndex == 0);
        assert(result.unmatchedPredictions.empty() && result.unmatchedGroundTruths.empty());
        CheckInvariants(result, predictions.size(), groundTruths.size(), 0.7);
    }

    std::cout << "[Test] Threshold filters weak candidates..." << std::endl;
    {
        const std::vector<AnnotationInstance> predictions = {Record("TPMT", "thiopurine", "decreased")};
        const std::vector<AnnotationInstance> groundTruths = {Record("CYP2D6", "codeine", "decreased")};
        const MatchSet result = InstanceMatcher(scorer, 0.7).Match(predictions, groundTruths);
        assert(result.pairs.empty());
        assert(result.unmatchedPredictions.size() == 1 && result.unmatchedGroundTruths.size() == 1);

        const MatchSet loose = InstanceMatcher(scorer, 0.3).Match(predictions, groundTruths);
        assert(loose.pairs.size() == 1 && "1/3 agreement clears a 0.3 threshold.");
    }

    std::cout << "[Test] Several predictions may share one ground truth..." << std::endl;
    {
        const std::vector<AnnotationInstance> predictions = {
            Record("CYP2D6", "codeine", "increased"),
            Record("CYP2D6", "codeine", "decreased"),
        };
        const std::vector<AnnotationInstance> groundTruths = {Record("CYP2D6", "codeine", "increased")};
        const MatchSet result = InstanceMatcher(scorer, 0.5).Match(predictions, groundTruths);
        assert(result.pairs.size() == 2);
        assert(result.pairs[0].aggregate == 1.0 && result.pairs[0].predictionIndex == 0);
        assert(result.pairs[1].groundTruthIndex == 0);
        assert(result.unmatchedGroundTruths.empty());
    }

    std::cout << "[Test] Candidate key restricts pairing..." << std::endl;
    {
        const std::vector<AnnotationInstance> predictions = {Record("CYP2D6", "codeine", "increased")};
        const std::vector<AnnotationInstance> groundTruths = {Record("CYP2C9", "codeine", "increased")};
        assert(InstanceMatcher(scorer, 0.5).Match(predictions, groundTruths).pairs.size() == 1);
        assert(InstanceMatcher(scorer, 0.5, std::string("Gene")).Match(predictions, groundTruths).pairs.empty());
    }

    std::cout << "[Test] Empty inputs..." << std::endl;
    {
        const std::vector<AnnotationInstance> none;
        const std::vector<AnnotationInstance> one = {Record("CYP2D6", "codeine", "increased")};
        const MatchSet noPredictions = InstanceMatcher(scorer, 0.7).Match(none, one);
        assert(noPredictions.pairs.empty() && noPredictions.unmatchedGroundTruths.size() == 1);
        const MatchSet noTruths = InstanceMatcher(scorer, 0.7).Match(one, none);
        assert(noTruths.pairs.empty() && noTruths.unmatchedPredictions.size() == 1);
    }

    std::cout << "[Test] Randomized lists keep the matching invariants..." << std::endl;
    {
        const std::vector<std::string> genes = {"CYP2D6", "CYP2C19", "TPMT", "UGT1A1"};
        const std::vector<std::string> drugs = {"codeine", "clopidogrel", "azathioprine", "irinotecan", ""};
        const std::vector<std::string> directions = {"increased", "decreased", ""};
        std::mt19937 rng(42);
        auto pick = [&rng](const std::vector<std::string>& values) {
            std::uniform_int_distribution<size_t> dist(0, values.size() - 1);
            return values[dist(rng)];
        };
        std::uniform_int_distribution<size_t> sizeDist(0, 8);
        std::uniform_real_distribution<double> thresholdDist(0.0, 1.0);

        for (int round = 0; round < 200; ++round) {
            std::vector<AnnotationInstance> predictions(sizeDist(rng));
            std::vector<AnnotationInstance> groundTruths(sizeDist(rng));
            for (auto& record : predictions) record = Record(pick(genes), pick(drugs), pick(directions));
            for (auto& record : groundTruths) record = Record(pick(genes), pick(drugs), pick(directions));

            const double threshold = thresholdDist(rng);
            const MatchSet result = InstanceMatcher(scorer, threshold).Match(predictions, groundTruths);
            CheckInvariants(result, predictions.size(), groundTruths.size(), threshold);

            const MatchSet again = InstanceMatcher(scorer, threshold).Match(predictions, groundTruths);
            assert(again.pairs.size() == result.pairs.size());
            for (size_t k = 0; k < again.pairs.size(); ++k) {
                assert(again.pairs[k].predictionIndex == result.pairs[k].predictionIndex);
                assert(again.pairs[k].groundTruthIndex == result.pairs[k].groundTruthIndex);
            }
        }
    }

    std::cout << "[PASS] InstanceMatcher Test." << std::endl;
    return 0;
}
