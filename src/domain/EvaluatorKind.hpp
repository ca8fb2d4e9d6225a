/**
 * @file EvaluatorKind.hpp
 * @brief Value Object enumerating the field similarity metrics.
 */

#pragma once

#include <optional>
#include <string>

namespace annobench::domain {

/**
 * @enum EvaluatorKind
 * @brief Similarity metric applied to one field of a (prediction, ground truth) pair.
 */
enum class EvaluatorKind {
    ExactMatch,          ///< Trimmed, case-folded string equality.
    CategoryEqual,       ///< Same as ExactMatch, for controlled-vocabulary fields.
    FuzzyEntity,         ///< Bucketed character-sequence similarity on normalized entity names.
    SemanticSet,         ///< Jaccard similarity over content tokens.
    NumericTolerance,    ///< Relative-difference bands on parsed numbers.
    CompoundStatistic,   ///< Inequality operator plus magnitude (p-values).
    VariantIdentity      ///< rsIDs, star alleles and genotype strings.
};

inline std::string KindToString(EvaluatorKind kind) {
    switch (kind) {
        case EvaluatorKind::ExactMatch: return "exact_match";
        case EvaluatorKind::CategoryEqual: return "category_equal";
        case EvaluatorKind::FuzzyEntity: return "fuzzy_entity_match";
        case EvaluatorKind::SemanticSet: return "semantic_set_match";
        case EvaluatorKind::NumericTolerance: return "numeric_tolerance_match";
        case EvaluatorKind::CompoundStatistic: return "compound_statistic_match";
        case EvaluatorKind::VariantIdentity: return "variant_identity_match";
        default: return "unknown";
    }
}

/**
 * @brief Parses the JSON spelling of an evaluator kind.
 * @return std::nullopt for an unknown name.
 */
inline std::optional<EvaluatorKind> KindFromString(const std::string& name) {
    if (name == "exact_match") return EvaluatorKind::ExactMatch;
    if (name == "category_equal") return EvaluatorKind::CategoryEqual;
    if (name == "fuzzy_entity_match") return EvaluatorKind::FuzzyEntity;
    if (name == "semantic_set_match") return EvaluatorKind::SemanticSet;
    if (name == "numeric_tolerance_match") return EvaluatorKind::NumericTolerance;
    if (name == "compound_statistic_match") return EvaluatorKind::CompoundStatistic;
    if (name == "variant_identity_match") return EvaluatorKind::VariantIdentity;
    return std::nullopt;
}

} // namespace annobench::domain
