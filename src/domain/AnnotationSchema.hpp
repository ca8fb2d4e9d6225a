/**
 * @file AnnotationSchema.hpp
 * @brief Schema descriptor: the named, weighted list of fields expected for one annotation family.
 */

#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "domain/EvaluatorKind.hpp"

namespace annobench::domain {

using WeightMap = std::map<std::string, double>;

/**
 * @struct ToleranceBands
 * @brief Scores granted by the numeric tolerance metric.
 */
struct ToleranceBands {
    double exactWeight = 1.0;
    double within5Pct = 0.9;
    double within10Pct = 0.8;
};

/**
 * @struct FieldSpec
 * @brief One schema field: name, metric and weight.
 */
struct FieldSpec {
    std::string name;
    EvaluatorKind kind = EvaluatorKind::ExactMatch;
    double weight = 1.0;
    ToleranceBands tolerance;
};

/**
 * @struct FieldRoles
 * @brief Which schema fields carry the statistical and referential meaning the
 *        consistency checks look for. Unset roles disable the checks that need them.
 */
struct FieldRoles {
    std::optional<std::string> pValue;
    std::optional<std::string> ratioStat;
    std::optional<std::string> ratioStatType;
    std::optional<std::string> ciStart;
    std::optional<std::string> ciStop;
    std::optional<std::string> crossReference;      ///< Field of the prediction pointing at a related record.
    std::optional<std::string> referencedIdentifier; ///< Identifier field read from related records.
    std::vector<std::string> frequencies;
    std::vector<std::string> sampleSizes;
    std::vector<std::string> identifiers;            ///< Bookkeeping IDs, left out of low-score summaries.
};

/**
 * @class AnnotationSchema
 * @brief Ordered FieldSpecs plus field roles.
 *
 * Invariant: field names are non-empty and unique, weights are non-negative.
 */
class AnnotationSchema {
public:
    AnnotationSchema(std::string name, std::vector<FieldSpec> fields, FieldRoles roles = {})
        : m_name(std::move(name)), m_fields(std::move(fields)), m_roles(std::move(roles)) {
        std::unordered_set<std::string> seen;
        for (const auto& field : m_fields) {
            if (field.name.empty()) {
                throw std::invalid_argument("AnnotationSchema '" + m_name + "': field name cannot be empty.");
            }
            if (field.weight < 0.0) {
                throw std::invalid_argument("AnnotationSchema '" + m_name + "': negative weight for field '" + field.name + "'.");
            }
            if (!seen.insert(field.name).second) {
                throw std::invalid_argument("AnnotationSchema '" + m_name + "': duplicate field '" + field.name + "'.");
            }
        }
    }

    const std::string& getName() const { return m_name; }
    const std::vector<FieldSpec>& getFields() const { return m_fields; }
    const FieldRoles& getRoles() const { return m_roles; }

    const FieldSpec* findField(const std::string& name) const {
        for (const auto& field : m_fields) {
            if (field.name == name) return &field;
        }
        return nullptr;
    }

    bool hasField(const std::string& name) const { return findField(name) != nullptr; }

    std::vector<std::string> fieldNames() const {
        std::vector<std::string> names;
        names.reserve(m_fields.size());
        for (const auto& field : m_fields) names.push_back(field.name);
        return names;
    }

    /** @brief Schema default weights, keyed by field name. */
    WeightMap defaultWeights() const {
        WeightMap weights;
        for (const auto& field : m_fields) weights[field.name] = field.weight;
        return weights;
    }

    /**
     * @brief Merges a caller override on top of the schema defaults.
     * Fields missing from the override keep their schema weight.
     * @throws std::invalid_argument on a negative override.
     */
    WeightMap effectiveWeights(const std::optional<WeightMap>& overrides) const {
        WeightMap weights = defaultWeights();
        if (!overrides) return weights;
        for (const auto& [field, weight] : *overrides) {
            if (weight < 0.0) {
                throw std::invalid_argument("Field weight for '" + field + "' must be non-negative.");
            }
            if (weights.count(field)) weights[field] = weight;
        }
        return weights;
    }

private:
    std::string m_name;
    std::vector<FieldSpec> m_fields;
    FieldRoles m_roles;
};

} // namespace annobench::domain
