#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "application/AnnotationBenchmark.hpp"
#include "domain/SchemaCatalog.hpp"
#include "infrastructure/AnnotationJson.hpp"

using namespace annobench::domain;
using annobench::application::AnnotationBenchmark;
using annobench::infrastructure::AnnotationJson;
using nlohmann::json;

int main() {
    std::cout << "[Test] Starting AnnotationJson Test..." << std::endl;

    // Records
    {
        const json record = json::parse(R"({"Gene": "CYP2D6", "Study Cases": 120, "Notes": null, "isPlural": true, "Blank": "  "})");
        const AnnotationInstance instance = AnnotationJson::InstanceFromJson(record);
        assert(instance.get("Gene").toString() == "CYP2D6");
        assert(instance.get("Study Cases").asNumber().value() == 120.0);
        assert(instance.get("Notes").isAbsent());
        assert(instance.get("Blank").isAbsent());
        assert(instance.get("isPlural").toString() == "true");

        const json back = AnnotationJson::InstanceToJson(instance);
        assert(back["Gene"] == "CYP2D6");
        assert(back["Notes"].is_null());

        // ordered_json keeps the fields in input order; json lists them sorted.
        const char* text = R"({"Variant/Haplotypes": "rs1065852", "Gene": "CYP2D6", "Alleles": "*4"})";
        const AnnotationInstance ordered = AnnotationJson::InstanceFromJson(nlohmann::ordered_json::parse(text));
        assert(ordered.entries().size() == 3);
        assert(ordered.entries()[0].first == "Variant/Haplotypes");
        assert(ordered.entries()[1].first == "Gene");
        assert(ordered.entries()[2].first == "Alleles");
        const AnnotationInstance sorted = AnnotationJson::InstanceFromJson(json::parse(text));
        assert(sorted.entries()[0].first == "Alleles");
        const auto orderedList = AnnotationJson::InstancesFromJson(nlohmann::ordered_json::parse(std::string("[") + text + "]"));
        assert(orderedList.size() == 1 && orderedList[0].entries()[0].first == "Variant/Haplotypes");

        bool threw = false;
        try {
            AnnotationJson::InstanceFromJson(json::array());
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw && "A record must be an object.");
    }

    // Report layout
    {
        const AnnotationBenchmark benchmark(SchemaCatalog::StudyParameters());
        const json samples = json::parse(R"([
            [{"P Value": "0.01", "Ratio Stat": 1.0}],
            [{"P Value": "0.01", "Ratio Stat": 1.0}]
        ])");
        const ScoreReport report = benchmark.Evaluate(samples);
        const json j = AnnotationJson::ReportToJson(report);

        assert(j["total_samples"] == 1);
        assert(j["field_scores"].contains("P Value"));
        assert(j["field_scores"]["P Value"]["scores"].size() == 1);
        assert(j["overall_score"].is_number());
        assert(!j.contains("status"));
        assert(j["unmatched_predictions"] == 0 && j["unmatched_ground_truths"] == 0);

        const json& detail = j["detailed_results"][0];
        assert(detail["sample_id"] == 0);
        assert(detail["dependency_issues"].size() == 1);
        assert(detail["field_values"]["P Value"]["ground_truth"] == "0.01");
        assert(detail["field_values"]["Study Type"]["prediction"].is_null());
        assert(detail["penalty_info"]["total_penalty"].get<double>() > 0.0);
        assert(detail["penalty_info"]["penalized_fields"].contains("Ratio Stat"));
        assert(j["statistics"]["matched_pairs"] == 1);
        assert(j["statistics"]["field_statistics"].contains("Ratio Stat"));

        const json empty = AnnotationJson::ReportToJson(benchmark.Evaluate(json::parse("[[], []]")));
        assert(empty["status"] == "both_empty");
        assert(empty["overall_score"] == 1.0);

        const json summary = AnnotationJson::SummaryToJson(benchmark.Summarize(report));
        assert(summary["penalties"].size() == 1);
        for (const auto& field : summary["low_scoring_fields"]) {
            assert(field["field"] != "Variant Annotation ID" && field["field"] != "Study Parameters ID");
        }
    }

    // Schema descriptors
    {
        const json descriptor = json::parse(R"({
            "name": "custom",
            "fields": [
                {"name": "Gene", "evaluator": "fuzzy_entity_match", "weight": 2.0},
                {"name": "Odds", "evaluator": "numeric_tolerance_match",
                 "tolerance": {"exact": 1.0, "within_5pct": 0.6, "within_10pct": 0.3}},
                {"name": "P", "evaluator": "compound_statistic_match"}
            ],
            "roles": {"p_value": "P", "ratio_stat": "Odds", "frequencies": []}
        })");
        const AnnotationSchema schema = AnnotationJson::SchemaFromJson(descriptor);
        assert(schema.getName() == "custom");
        assert(schema.getFields().size() == 3);
        assert(schema.findField("Gene")->weight == 2.0);
        assert(schema.findField("Odds")->tolerance.within5Pct == 0.6);
        assert(schema.findField("P")->tolerance.within10Pct == 0.7);
        assert(schema.getRoles().ratioStat.value() == "Odds");
        assert(!schema.getRoles().ciStart.has_value());

        const AnnotationSchema reloaded = AnnotationJson::SchemaFromJson(AnnotationJson::SchemaToJson(SchemaCatalog::StudyParameters()));
        assert(reloaded.fieldNames() == SchemaCatalog::StudyParameters().fieldNames());
        assert(reloaded.getRoles().frequencies.size() == 2);

        bool unknownEvaluator = false;
        try {
            AnnotationJson::SchemaFromJson(json::parse(R"({"name": "x", "fields": [{"name": "a", "evaluator": "cosine"}]})"));
        } catch (const std::invalid_argument&) {
            unknownEvaluator = true;
        }
        assert(unknownEvaluator);

        bool bandOutOfRange = false;
        try {
            AnnotationJson::SchemaFromJson(json::parse(
                R"({"name": "x", "fields": [{"name": "a", "evaluator": "numeric_tolerance_match", "tolerance": {"within_5pct": 1.5}}]})"));
        } catch (const std::invalid_argument&) {
            bandOutOfRange = true;
        }
        assert(bandOutOfRange && "Tolerance bands must lie in [0, 1].");

        bool bandNotNumber = false;
        try {
            AnnotationJson::SchemaFromJson(json::parse(
                R"({"name": "x", "fields": [{"name": "a", "evaluator": "numeric_tolerance_match", "tolerance": {"exact": "high"}}]})"));
        } catch (const std::invalid_argument&) {
            bandNotNumber = true;
        }
        assert(bandNotNumber && "A non-numeric band is a malformed descriptor, not a type_error.");

        bool negativeWeight = false;
        try {
            AnnotationJson::SchemaFromJson(json::parse(R"({"name": "x", "fields": [{"name": "a", "weight": -1}]})"));
        } catch (const std::invalid_argument&) {
            negativeWeight = true;
        }
        assert(negativeWeight);
    }

    // Engine settings and weights
    {
        const EngineConfig config = AnnotationJson::ConfigFromJson(json::parse(R"({"matching_threshold": 0.8, "candidate_key": "Gene"})"));
        assert(config.matchingThreshold == 0.8);
        assert(config.candidateKey.value() == "Gene");
        assert(config.maxPenalty == 0.3 && "Missing keys keep defaults.");

        bool outOfRange = false;
        try {
            AnnotationJson::ConfigFromJson(json::parse(R"({"matching_threshold": 3})"));
        } catch (const std::invalid_argument&) {
            outOfRange = true;
        }
        assert(outOfRange);

        const WeightMap weights = AnnotationJson::WeightsFromJson(json::parse(R"json({"Gene": 2, "Drug(s)": 0.5})json"));
        assert(weights.at("Gene") == 2.0 && weights.at("Drug(s)") == 0.5);

        bool negative = false;
        try {
            AnnotationJson::WeightsFromJson(json::parse(R"({"Gene": -1})"));
        } catch (const std::invalid_argument&) {
            negative = true;
        }
        assert(negative);
    }

    std::cout << "[PASS] AnnotationJson Test." << std::endl;
    return 0;
}
