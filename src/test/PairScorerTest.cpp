#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "domain/SchemaCatalog.hpp"
#include "domain/scoring/PairScorer.hpp"

using namespace annobench::domain;
using namespace annobench::domain::scoring;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

AnnotationSchema SmallSchema() {
    return AnnotationSchema("small", {
        {"Gene", EvaluatorKind::ExactMatch, 1.0, {}},
        {"Drug(s)", EvaluatorKind::ExactMatch, 1.0, {}},
        {"Direction of effect", EvaluatorKind::CategoryEqual, 2.0, {}},
    });
}

} // namespace

int main() {
    std::cout << "[Test] Starting PairScorer Test..." << std::endl;

    const AnnotationSchema schema = SmallSchema();
    const PairScorer scorer(schema, schema.defaultWeights());

    // Weighted mean over every schema field
    {
        const AnnotationInstance prediction{{"Gene", "CYP2D6"}, {"Drug(s)", "codeine"}, {"Direction of effect", "decreased"}};
        const AnnotationInstance groundTruth{{"Gene", "CYP2D6"}, {"Drug(s)", "Codeine"}, {"Direction of effect", "increased"}};
        const PairScore pair = scorer.score(prediction, groundTruth, 3, 5);
        assert(pair.predictionIndex == 3 && pair.groundTruthIndex == 5);
        assert(pair.fieldScores.size() == 3);
        assert(pair.fieldScores[0].first == "Gene" && pair.fieldScores[2].first == "Direction of effect");
        assert(pair.fieldScore("Direction of effect") == 0.0);
        assert(Near(pair.aggregate, 0.5) && "(1 + 1 + 0 * 2) / 4");
        assert(pair.rawAggregate == pair.aggregate);
    }

    // Missing values are scored, never omitted
    {
        const PairScore pair = scorer.score(AnnotationInstance{{"Gene", "CYP2D6"}}, AnnotationInstance{{"Gene", "CYP2D6"}});
        assert(pair.fieldScores.size() == schema.getFields().size());
        assert(pair.aggregate == 1.0);

        const PairScore extra = scorer.score(AnnotationInstance{{"Unknown", "x"}}, AnnotationInstance{});
        assert(extra.fieldScores.size() == 3 && "Fields outside the schema are ignored.");
    }

    // Uniform weights reduce to the unweighted mean
    {
        const std::vector<std::pair<std::string, double>> scores = {{"a", 0.2}, {"b", 0.4}, {"c", 0.9}};
        assert(Near(PairScorer::computeWeightedScore(scores, {{"a", 3.0}, {"b", 3.0}, {"c", 3.0}}), 0.5));
        assert(Near(PairScorer::computeWeightedScore(scores, {}), 0.5) && "Unweighted fields count as 1.0.");
        assert(PairScorer::computeWeightedScore(scores, {{"a", 0.0}, {"b", 0.0}, {"c", 0.0}}) == 0.0);
        assert(PairScorer::computeWeightedScore({}, {}) == 0.0);
    }

    // Weight overrides
    {
        WeightMap overrides = {{"Direction of effect", 0.0}, {"Not a field", 7.0}};
        const WeightMap weights = schema.effectiveWeights(overrides);
        assert(weights.size() == 3);
        assert(weights.at("Direction of effect") == 0.0);
        assert(weights.at("Gene") == 1.0 && "Fields missing from the override keep the schema weight.");

        const PairScorer overridden(schema, weights);
        const AnnotationInstance prediction{{"Gene", "CYP2D6"}, {"Drug(s)", "codeine"}, {"Direction of effect", "decreased"}};
        const AnnotationInstance groundTruth{{"Gene", "CYP2D6"}, {"Drug(s)", "codeine"}, {"Direction of effect", "increased"}};
        assert(overridden.score(prediction, groundTruth).aggregate == 1.0);

        bool threw = false;
        try {
            schema.effectiveWeights(WeightMap{{"Gene", -1.0}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "Negative weight override must be rejected.");
    }

    // Schema construction contract
    {
        bool duplicate = false;
        try {
            AnnotationSchema("dup", {{"Gene", EvaluatorKind::ExactMatch, 1.0, {}}, {"Gene", EvaluatorKind::ExactMatch, 1.0, {}}});
        } catch (const std::invalid_argument&) {
            duplicate = true;
        }
        assert(duplicate);

        bool negative = false;
        try {
            AnnotationSchema("neg", {{"Gene", EvaluatorKind::ExactMatch, -0.5, {}}});
        } catch (const std::invalid_argument&) {
            negative = true;
        }
        assert(negative);
    }

    // Built-in schemas
    {
        for (const char* family : SchemaCatalog::Families) {
            auto builtIn = SchemaCatalog::ByName(family);
            assert(builtIn && !builtIn->getFields().empty());
        }
        assert(!SchemaCatalog::ByName("unknown").has_value());

        const AnnotationSchema phenotype = SchemaCatalog::Phenotype();
        assert(phenotype.findField("Direction of effect")->weight == 2.0);
        assert(phenotype.findField("Variant/Haplotypes")->kind == EvaluatorKind::VariantIdentity);

        const AnnotationSchema study = SchemaCatalog::StudyParameters();
        assert(study.getFields().size() == 17);
        assert(study.findField("P Value")->kind == EvaluatorKind::CompoundStatistic);
        assert(study.getRoles().pValue.value() == "P Value");
    }

    std::cout << "[PASS] PairScorer Test." << std::endl;
    return 0;
}
