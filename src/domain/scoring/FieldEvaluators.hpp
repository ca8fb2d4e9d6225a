/**
 * @file FieldEvaluators.hpp
 * @brief Library of pure field similarity metrics, one per evaluator kind.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/AnnotationSchema.hpp"
#include "domain/FieldValue.hpp"

namespace annobench::domain::scoring {

/**
 * @struct ParsedStatistic
 * @brief A reported statistic split into comparison operator and magnitude ("<0.05" -> "<", 0.05).
 */
struct ParsedStatistic {
    std::string op = "=";
    std::optional<double> magnitude;
};

/**
 * @class FieldEvaluators
 * @brief Stateless similarity functions (predicted, expected) -> score in [0, 1].
 *
 * Every metric follows the same absence rule: both sides absent scores 1.0,
 * exactly one side absent scores 0.0.
 */
class FieldEvaluators {
public:
    /** @brief Default bands for significance fields. */
    static constexpr ToleranceBands StatisticBands{1.0, 0.9, 0.7};

    /** @brief Dispatches on the FieldSpec evaluator kind. */
    static double evaluate(const FieldSpec& spec, const FieldValue& predicted, const FieldValue& expected);

    static double exactMatch(const FieldValue& predicted, const FieldValue& expected);

    /** @brief Exact match with internal whitespace collapsed; for enumerated vocabularies. */
    static double categoryEqual(const FieldValue& predicted, const FieldValue& expected);

    /**
     * @brief Bucketed sequence similarity on normalized entity names.
     * >= 0.9 -> 1.0, >= 0.7 -> 0.8, >= 0.5 -> 0.5, otherwise 0.0.
     */
    static double fuzzyEntityMatch(const FieldValue& predicted, const FieldValue& expected);

    /**
     * @brief Jaccard similarity of content-word sets (stop words and tokens <= 2 chars removed).
     * Both sets empty -> 1.0, one empty -> 0.0.
     */
    static double semanticSetMatch(const FieldValue& predicted, const FieldValue& expected);

    /**
     * @brief Relative-difference bands on parsed numbers.
     * Symmetric: the relative difference divides by the larger magnitude.
     */
    static double numericToleranceMatch(const FieldValue& predicted, const FieldValue& expected,
                                        const ToleranceBands& bands = ToleranceBands{});

    static double numericToleranceScore(std::optional<double> predicted, std::optional<double> expected,
                                        const ToleranceBands& bands = ToleranceBands{});

    /**
     * @brief 0.5 * operator agreement + 0.5 * magnitude tolerance.
     * Magnitudes inside (0, 1) also get a log10-scale comparison; the higher score is kept.
     */
    static double compoundStatisticMatch(const FieldValue& predicted, const FieldValue& expected,
                                         const ToleranceBands& bands = StatisticBands);

    /**
     * @brief Variant identifiers: tolerates bare vs. gene-qualified alleles, rsID digits and
     *        substring forms. Falls back to fuzzyEntityMatch, capped at 0.8 when the two
     *        sides name different alleles of the same gene.
     */
    static double variantIdentityMatch(const FieldValue& predicted, const FieldValue& expected);

    /**
     * @brief Error taxonomy for an imperfect field score.
     * @return std::nullopt when the score is perfect or both sides are absent.
     */
    static std::optional<std::string> classifyError(const FieldValue& predicted, const FieldValue& expected, double score);

    static std::optional<double> parseNumeric(const FieldValue& value);
    static std::optional<double> parseNumeric(const std::string& text);
    static std::optional<ParsedStatistic> parseStatistic(const FieldValue& value);

    /** @brief Trim + ASCII lowercase. */
    static std::string normalizeText(const std::string& text);
    static std::string normalizeEntity(const std::string& entity);
    static std::vector<std::string> tokenizeText(const std::string& text);

    /** @brief Ratcliff/Obershelp ratio 2*M/T over the byte sequences. */
    static double sequenceRatio(const std::string& a, const std::string& b);
};

} // namespace annobench::domain::scoring
