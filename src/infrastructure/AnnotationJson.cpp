/**
 * @file AnnotationJson.cpp
 * @brief Implementation of AnnotationJson.
 */

#include "infrastructure/AnnotationJson.hpp"

#include <stdexcept>

#include "domain/scoring/FieldEvaluators.hpp"

namespace annobench::infrastructure {

using nlohmann::json;

namespace {

// Shared by json (keys come back sorted) and ordered_json (keys keep input order).
template <typename Json>
domain::FieldValue ValueFrom(const Json& value) {
    if (value.is_null()) return domain::FieldValue::Absent();
    if (value.is_string()) return domain::FieldValue(value.template get<std::string>());
    if (value.is_number()) return domain::FieldValue(value.template get<double>());
    return domain::FieldValue(value.dump());
}

template <typename Json>
domain::AnnotationInstance InstanceFrom(const Json& record) {
    if (!record.is_object()) {
        throw std::invalid_argument("Annotation record must be a JSON object, got " + std::string(record.type_name()) + ".");
    }
    domain::AnnotationInstance instance;
    for (auto it = record.begin(); it != record.end(); ++it) {
        instance.set(it.key(), ValueFrom(it.value()));
    }
    return instance;
}

template <typename Json>
std::vector<domain::AnnotationInstance> InstancesFrom(const Json& records) {
    if (!records.is_array()) {
        throw std::invalid_argument("Annotation list must be a JSON array, got " + std::string(records.type_name()) + ".");
    }
    std::vector<domain::AnnotationInstance> instances;
    instances.reserve(records.size());
    for (const auto& record : records) {
        instances.push_back(InstanceFrom(record));
    }
    return instances;
}

double ToleranceBand(const json& tolerance, const char* key, double fallback, const std::string& field) {
    if (!tolerance.contains(key)) return fallback;
    const auto& band = tolerance[key];
    if (!band.is_number()) {
        throw std::invalid_argument("Tolerance '" + std::string(key) + "' of field '" + field + "' must be a number.");
    }
    const double value = band.get<double>();
    if (!(value >= 0.0 && value <= 1.0)) {
        throw std::invalid_argument("Tolerance '" + std::string(key) + "' of field '" + field + "' must lie in [0, 1].");
    }
    return value;
}

json OptionalText(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json FieldScoresToJson(const std::vector<std::pair<std::string, double>>& scores) {
    json out = json::object();
    for (const auto& [field, score] : scores) out[field] = score;
    return out;
}

json ValuePairToJson(const domain::FieldValuePair& values) {
    return {{"ground_truth", OptionalText(values.groundTruth)}, {"prediction", OptionalText(values.prediction)}};
}

json PenaltyInfoToJson(const domain::PenaltyInfo& info) {
    json penalized = json::object();
    for (const auto& [field, penalty] : info.penalizedFields) {
        penalized[field] = {
            {"original_score", penalty.originalScore},
            {"penalized_score", penalty.penalizedScore},
            {"penalty_percentage", penalty.penaltyPercentage}
        };
    }
    json issues = json::object();
    for (const auto& [field, messages] : info.issuesByField) issues[field] = messages;
    return {{"total_penalty", info.totalPenalty}, {"penalized_fields", penalized}, {"issues_by_field", issues}};
}

json FieldScoreSummariesToJson(const std::vector<domain::FieldScoreSummary>& fields) {
    json out = json::object();
    for (const auto& field : fields) {
        out[field.field] = {{"mean_score", field.meanScore}, {"scores", field.scores}};
    }
    return out;
}

json StatisticsToJson(const domain::ScoreReport& report) {
    const auto& run = report.runStatistics;
    json difficult = json::array();
    for (const auto& pair : run.difficultPairs) {
        difficult.push_back({{"sample_id", pair.sampleId}, {"score", pair.score}, {"main_issues", pair.mainIssues}});
    }
    json fields = json::object();
    for (const auto& stats : report.fieldStatistics) {
        json errors = json::object();
        for (const auto& [type, count] : stats.errorTypes) errors[type] = count;
        fields[stats.field] = {
            {"mean_score", stats.meanScore},
            {"exact_matches", stats.exactMatches},
            {"exact_match_rate", stats.exactMatchRate},
            {"error_types", errors}
        };
    }
    return {
        {"matched_pairs", run.matchedPairs},
        {"mean_overall_score", run.meanOverallScore},
        {"mean_weighted_score", run.meanWeightedScore},
        {"min_score", run.minScore},
        {"max_score", run.maxScore},
        {"score_distribution", {
            {"excellent", run.distribution.excellent},
            {"good", run.distribution.good},
            {"fair", run.distribution.fair},
            {"poor", run.distribution.poor}
        }},
        {"difficult_pairs", difficult},
        {"field_statistics", fields}
    };
}

std::optional<std::string> OptionalRole(const json& roles, const char* key) {
    if (!roles.contains(key) || roles[key].is_null()) return std::nullopt;
    if (!roles[key].is_string()) {
        throw std::invalid_argument(std::string("Schema role '") + key + "' must be a string.");
    }
    return roles[key].get<std::string>();
}

std::vector<std::string> RoleList(const json& roles, const char* key) {
    if (!roles.contains(key)) return {};
    if (!roles[key].is_array()) {
        throw std::invalid_argument(std::string("Schema role '") + key + "' must be an array of field names.");
    }
    return roles[key].get<std::vector<std::string>>();
}

void PutRole(json& roles, const char* key, const std::optional<std::string>& value) {
    if (value) roles[key] = *value;
}

} // namespace

domain::FieldValue AnnotationJson::ValueFromJson(const json& value) {
    return ValueFrom(value);
}

domain::FieldValue AnnotationJson::ValueFromJson(const nlohmann::ordered_json& value) {
    return ValueFrom(value);
}

json AnnotationJson::ValueToJson(const domain::FieldValue& value) {
    if (auto number = value.asNumber()) return *number;
    if (value.isText()) return value.toString();
    return nullptr;
}

domain::AnnotationInstance AnnotationJson::InstanceFromJson(const json& record) {
    return InstanceFrom(record);
}

domain::AnnotationInstance AnnotationJson::InstanceFromJson(const nlohmann::ordered_json& record) {
    return InstanceFrom(record);
}

std::vector<domain::AnnotationInstance> AnnotationJson::InstancesFromJson(const json& records) {
    return InstancesFrom(records);
}

std::vector<domain::AnnotationInstance> AnnotationJson::InstancesFromJson(const nlohmann::ordered_json& records) {
    return InstancesFrom(records);
}

json AnnotationJson::InstanceToJson(const domain::AnnotationInstance& instance) {
    json out = json::object();
    for (const auto& [field, value] : instance.entries()) out[field] = ValueToJson(value);
    return out;
}

json AnnotationJson::ReportToJson(const domain::ScoreReport& report) {
    json j;
    j["total_samples"] = report.totalSamples;
    j["field_scores"] = FieldScoreSummariesToJson(report.fieldScores);
    j["overall_score"] = report.overallScore;

    json details = json::array();
    for (const auto& detail : report.detailedResults) {
        json values = json::object();
        for (const auto& [field, pair] : detail.fieldValues) values[field] = ValuePairToJson(pair);
        details.push_back({
            {"sample_id", detail.sampleId},
            {"prediction_index", detail.predictionIndex},
            {"ground_truth_index", detail.groundTruthIndex},
            {"match_score", detail.matchScore},
            {"raw_match_score", detail.rawMatchScore},
            {"field_scores", FieldScoresToJson(detail.fieldScores)},
            {"dependency_issues", detail.dependencyIssues},
            {"field_values", values},
            {"penalty_info", PenaltyInfoToJson(detail.penaltyInfo)}
        });
    }
    j["detailed_results"] = details;

    if (report.status) j["status"] = *report.status;
    j["statistics"] = StatisticsToJson(report);
    j["unmatched_predictions"] = report.unmatchedPredictions;
    j["unmatched_ground_truths"] = report.unmatchedGroundTruths;
    return j;
}

json AnnotationJson::SummaryToJson(const domain::ReportSummary& summary) {
    json j;
    j["overall_score"] = summary.overallScore;
    j["total_samples"] = summary.totalSamples;
    if (summary.status) j["status"] = *summary.status;
    j["field_scores"] = FieldScoreSummariesToJson(summary.fieldScores);

    json low = json::array();
    for (const auto& field : summary.lowScoringFields) {
        json samples = json::array();
        for (const auto& values : field.sampleValues) samples.push_back(ValuePairToJson(values));
        low.push_back({
            {"field", field.field},
            {"mean_score", field.meanScore},
            {"scores", field.scores},
            {"sample_values", samples}
        });
    }
    j["low_scoring_fields"] = low;
    j["dependency_issues"] = summary.dependencyIssues;

    json penalties = json::array();
    for (const auto& penalty : summary.penalties) {
        penalties.push_back({
            {"total_penalty", penalty.totalPenalty},
            {"penalized_fields", penalty.penalizedFields},
            {"issues_count", penalty.issuesCount}
        });
    }
    j["penalties"] = penalties;
    return j;
}

domain::AnnotationSchema AnnotationJson::SchemaFromJson(const json& descriptor) {
    if (!descriptor.is_object()) {
        throw std::invalid_argument("Schema descriptor must be a JSON object.");
    }
    if (!descriptor.contains("name") || !descriptor["name"].is_string()) {
        throw std::invalid_argument("Schema descriptor requires a string 'name'.");
    }
    if (!descriptor.contains("fields") || !descriptor["fields"].is_array()) {
        throw std::invalid_argument("Schema descriptor requires a 'fields' array.");
    }

    std::vector<domain::FieldSpec> fields;
    for (const auto& entry : descriptor["fields"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            throw std::invalid_argument("Schema field requires a string 'name'.");
        }
        domain::FieldSpec spec;
        spec.name = entry["name"].get<std::string>();

        const std::string evaluator = entry.value("evaluator", std::string("exact_match"));
        auto kind = domain::KindFromString(evaluator);
        if (!kind) {
            throw std::invalid_argument("Unknown evaluator '" + evaluator + "' for field '" + spec.name + "'.");
        }
        spec.kind = *kind;
        if (spec.kind == domain::EvaluatorKind::CompoundStatistic) {
            spec.tolerance = domain::scoring::FieldEvaluators::StatisticBands;
        }

        if (entry.contains("weight")) {
            if (!entry["weight"].is_number()) {
                throw std::invalid_argument("Weight of field '" + spec.name + "' must be a number.");
            }
            spec.weight = entry["weight"].get<double>();
        }
        if (entry.contains("tolerance")) {
            const auto& tolerance = entry["tolerance"];
            if (!tolerance.is_object()) {
                throw std::invalid_argument("Tolerance of field '" + spec.name + "' must be an object.");
            }
            spec.tolerance.exactWeight = ToleranceBand(tolerance, "exact", spec.tolerance.exactWeight, spec.name);
            spec.tolerance.within5Pct = ToleranceBand(tolerance, "within_5pct", spec.tolerance.within5Pct, spec.name);
            spec.tolerance.within10Pct = ToleranceBand(tolerance, "within_10pct", spec.tolerance.within10Pct, spec.name);
        }
        fields.push_back(std::move(spec));
    }

    domain::FieldRoles roles;
    if (descriptor.contains("roles")) {
        const auto& r = descriptor["roles"];
        if (!r.is_object()) {
            throw std::invalid_argument("Schema 'roles' must be an object.");
        }
        roles.pValue = OptionalRole(r, "p_value");
        roles.ratioStat = OptionalRole(r, "ratio_stat");
        roles.ratioStatType = OptionalRole(r, "ratio_stat_type");
        roles.ciStart = OptionalRole(r, "ci_start");
        roles.ciStop = OptionalRole(r, "ci_stop");
        roles.crossReference = OptionalRole(r, "cross_reference");
        roles.referencedIdentifier = OptionalRole(r, "referenced_identifier");
        roles.frequencies = RoleList(r, "frequencies");
        roles.sampleSizes = RoleList(r, "sample_sizes");
        roles.identifiers = RoleList(r, "identifiers");
    }

    return domain::AnnotationSchema(descriptor["name"].get<std::string>(), std::move(fields), std::move(roles));
}

json AnnotationJson::SchemaToJson(const domain::AnnotationSchema& schema) {
    json fields = json::array();
    for (const auto& spec : schema.getFields()) {
        fields.push_back({
            {"name", spec.name},
            {"evaluator", domain::KindToString(spec.kind)},
            {"weight", spec.weight},
            {"tolerance", {
                {"exact", spec.tolerance.exactWeight},
                {"within_5pct", spec.tolerance.within5Pct},
                {"within_10pct", spec.tolerance.within10Pct}
            }}
        });
    }

    const auto& r = schema.getRoles();
    json roles = json::object();
    PutRole(roles, "p_value", r.pValue);
    PutRole(roles, "ratio_stat", r.ratioStat);
    PutRole(roles, "ratio_stat_type", r.ratioStatType);
    PutRole(roles, "ci_start", r.ciStart);
    PutRole(roles, "ci_stop", r.ciStop);
    PutRole(roles, "cross_reference", r.crossReference);
    PutRole(roles, "referenced_identifier", r.referencedIdentifier);
    if (!r.frequencies.empty()) roles["frequencies"] = r.frequencies;
    if (!r.sampleSizes.empty()) roles["sample_sizes"] = r.sampleSizes;
    if (!r.identifiers.empty()) roles["identifiers"] = r.identifiers;

    return {{"name", schema.getName()}, {"fields", fields}, {"roles", roles}};
}

domain::EngineConfig AnnotationJson::ConfigFromJson(const json& settings) {
    if (!settings.is_object()) {
        throw std::invalid_argument("Engine settings must be a JSON object.");
    }
    domain::EngineConfig config;
    try {
        config.matchingThreshold = settings.value("matching_threshold", config.matchingThreshold);
        config.verbose = settings.value("verbose", config.verbose);
        config.includeDetails = settings.value("include_details", config.includeDetails);
        config.penaltyPerIssue = settings.value("penalty_per_issue", config.penaltyPerIssue);
        config.maxPenalty = settings.value("max_penalty", config.maxPenalty);
        config.maxDifficultPairs = settings.value("max_difficult_pairs", config.maxDifficultPairs);
        config.difficultFieldThreshold = settings.value("difficult_field_threshold", config.difficultFieldThreshold);
        if (settings.contains("candidate_key") && !settings["candidate_key"].is_null()) {
            config.candidateKey = settings["candidate_key"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("Malformed engine settings: ") + e.what());
    }
    config.validate();
    return config;
}

json AnnotationJson::ConfigToJson(const domain::EngineConfig& config) {
    json j;
    j["matching_threshold"] = config.matchingThreshold;
    j["verbose"] = config.verbose;
    j["include_details"] = config.includeDetails;
    j["penalty_per_issue"] = config.penaltyPerIssue;
    j["max_penalty"] = config.maxPenalty;
    j["max_difficult_pairs"] = config.maxDifficultPairs;
    j["difficult_field_threshold"] = config.difficultFieldThreshold;
    j["candidate_key"] = OptionalText(config.candidateKey);
    return j;
}

domain::WeightMap AnnotationJson::WeightsFromJson(const json& weights) {
    if (!weights.is_object()) {
        throw std::invalid_argument("Field weights must be a JSON object.");
    }
    domain::WeightMap out;
    for (auto it = weights.begin(); it != weights.end(); ++it) {
        if (!it.value().is_number()) {
            throw std::invalid_argument("Weight of field '" + it.key() + "' must be a number.");
        }
        const double value = it.value().get<double>();
        if (value < 0.0) {
            throw std::invalid_argument("Field weight for '" + it.key() + "' must be non-negative.");
        }
        out[it.key()] = value;
    }
    return out;
}

} // namespace annobench::infrastructure
