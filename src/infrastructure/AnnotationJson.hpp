/**
 * @file AnnotationJson.hpp
 * @brief JSON boundary: annotation records in, score reports and schema descriptors out.
 */

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "domain/AnnotationInstance.hpp"
#include "domain/AnnotationSchema.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/ScoreReport.hpp"

namespace annobench::infrastructure {

/**
 * @class AnnotationJson
 * @brief Static conversions between domain types and nlohmann::json.
 *
 * Readers throw std::invalid_argument on a malformed document; writers never throw.
 */
class AnnotationJson {
public:
    /** @brief null -> absent, string/number as is, booleans and nested values as their JSON text. */
    static domain::FieldValue ValueFromJson(const nlohmann::json& value);
    static domain::FieldValue ValueFromJson(const nlohmann::ordered_json& value);
    static nlohmann::json ValueToJson(const domain::FieldValue& value);

    /**
     * @brief nlohmann::json stores object keys sorted, so records read from it list their
     *        fields alphabetically. Parse with nlohmann::ordered_json to keep the input order.
     */
    static domain::AnnotationInstance InstanceFromJson(const nlohmann::json& record);
    static domain::AnnotationInstance InstanceFromJson(const nlohmann::ordered_json& record);
    static std::vector<domain::AnnotationInstance> InstancesFromJson(const nlohmann::json& records);
    static std::vector<domain::AnnotationInstance> InstancesFromJson(const nlohmann::ordered_json& records);
    static nlohmann::json InstanceToJson(const domain::AnnotationInstance& instance);

    /**
     * @brief Report in the benchmark output layout (total_samples, field_scores, overall_score,
     *        detailed_results, status, statistics, unmatched counts).
     */
    static nlohmann::json ReportToJson(const domain::ScoreReport& report);
    static nlohmann::json SummaryToJson(const domain::ReportSummary& summary);

    static domain::AnnotationSchema SchemaFromJson(const nlohmann::json& descriptor);
    static nlohmann::json SchemaToJson(const domain::AnnotationSchema& schema);

    /** @brief Missing keys keep their defaults. */
    static domain::EngineConfig ConfigFromJson(const nlohmann::json& settings);
    static nlohmann::json ConfigToJson(const domain::EngineConfig& config);

    static domain::WeightMap WeightsFromJson(const nlohmann::json& weights);
};

} // namespace annobench::infrastructure
