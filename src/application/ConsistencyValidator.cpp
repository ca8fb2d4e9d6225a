/**
 * @file ConsistencyValidator.cpp
 * @brief Implementation of the consistency audit and score penalties.
 */

#include "application/ConsistencyValidator.hpp"

#include <algorithm>
#include <set>

#include "domain/scoring/FieldEvaluators.hpp"

namespace annobench::application {

using domain::AnnotationInstance;
using domain::ConsistencyIssue;
using domain::IssueCode;
using domain::scoring::FieldEvaluators;

namespace {

std::string FormatNumber(double value) {
    return domain::FieldValue(value).toString();
}

void AppendRole(std::vector<std::string>& out, const std::optional<std::string>& role) {
    if (role) out.push_back(*role);
}

// Only the magnitude decides: "<0.05" is not below 0.05.
bool IsSignificant(const domain::scoring::ParsedStatistic& stat) {
    return stat.magnitude && *stat.magnitude < 0.05;
}

} // namespace

ConsistencyValidator::ConsistencyValidator(const domain::AnnotationSchema& schema, double penaltyPerIssue, double maxPenalty)
    : m_schema(schema), m_penaltyPerIssue(penaltyPerIssue), m_maxPenalty(maxPenalty) {}

void ConsistencyValidator::AddIssue(std::vector<ConsistencyIssue>& issues, IssueCode code,
                                    const std::string& message, std::vector<std::string> fields) const {
    issues.push_back({code, message, std::move(fields)});
}

std::vector<std::string> ConsistencyValidator::StatisticFields() const {
    const auto& roles = m_schema.getRoles();
    std::vector<std::string> fields;
    AppendRole(fields, roles.pValue);
    AppendRole(fields, roles.ratioStat);
    AppendRole(fields, roles.ratioStatType);
    return fields;
}

std::vector<std::string> ConsistencyValidator::IntervalFields() const {
    const auto& roles = m_schema.getRoles();
    std::vector<std::string> fields;
    AppendRole(fields, roles.ciStart);
    AppendRole(fields, roles.ciStop);
    AppendRole(fields, roles.ratioStat);
    return fields;
}

std::vector<std::string> ConsistencyValidator::FrequencyFields() const {
    const auto& roles = m_schema.getRoles();
    std::vector<std::string> fields = roles.frequencies;
    fields.insert(fields.end(), roles.sampleSizes.begin(), roles.sampleSizes.end());
    return fields;
}

std::vector<ConsistencyIssue> ConsistencyValidator::Validate(const AnnotationInstance& prediction,
                                                             const std::vector<AnnotationInstance>& related) const {
    std::vector<ConsistencyIssue> issues;
    const auto& roles = m_schema.getRoles();

    // A) Referential integrity
    if (roles.crossReference && !related.empty()) {
        const auto& reference = prediction.get(*roles.crossReference);
        const std::string& identifierField = roles.referencedIdentifier.value_or(*roles.crossReference);
        if (!reference.isAbsent()) {
            const bool found = std::any_of(related.begin(), related.end(), [&](const AnnotationInstance& other) {
                const auto& identifier = other.get(identifierField);
                return !identifier.isAbsent() && FieldEvaluators::exactMatch(reference, identifier) == 1.0;
            });
            if (!found) {
                AddIssue(issues, IssueCode::ReferentialIntegrity,
                         *roles.crossReference + " '" + reference.toString() + "' does not match any related record's " +
                             identifierField + ".",
                         {*roles.crossReference});
            }
        }
    }

    // B) Statistical sign: significant p-value with a ratio of exactly 1 (no effect)
    if (roles.pValue && roles.ratioStat) {
        const auto pValue = FieldEvaluators::parseStatistic(prediction.get(*roles.pValue));
        const auto ratio = FieldEvaluators::parseNumeric(prediction.get(*roles.ratioStat));
        if (pValue && IsSignificant(*pValue) && ratio && *ratio == 1.0) {
            AddIssue(issues, IssueCode::StatisticalSign,
                     *roles.pValue + " " + prediction.get(*roles.pValue).toString() + " indicates significance but " +
                         *roles.ratioStat + " is 1 (no effect).",
                     StatisticFields());
        }
    }

    // C) Interval ordering and containment
    if (roles.ciStart && roles.ciStop) {
        const auto start = FieldEvaluators::parseNumeric(prediction.get(*roles.ciStart));
        const auto stop = FieldEvaluators::parseNumeric(prediction.get(*roles.ciStop));
        if (start && stop) {
            if (*start >= *stop) {
                AddIssue(issues, IssueCode::IntervalOrdering,
                         *roles.ciStart + " (" + FormatNumber(*start) + ") must be less than " + *roles.ciStop + " (" +
                             FormatNumber(*stop) + ").",
                         IntervalFields());
            } else if (roles.ratioStat) {
                const auto ratio = FieldEvaluators::parseNumeric(prediction.get(*roles.ratioStat));
                if (ratio && (*ratio < *start || *ratio > *stop)) {
                    AddIssue(issues, IssueCode::IntervalContainment,
                             *roles.ratioStat + " " + FormatNumber(*ratio) + " lies outside the confidence interval [" +
                                 FormatNumber(*start) + ", " + FormatNumber(*stop) + "].",
                             IntervalFields());
                }
            }
        }
    }

    // D) Bounded fractions
    for (const auto& field : roles.frequencies) {
        const auto frequency = FieldEvaluators::parseNumeric(prediction.get(field));
        if (frequency && (*frequency < 0.0 || *frequency > 1.0)) {
            AddIssue(issues, IssueCode::BoundedFraction,
                     field + " " + FormatNumber(*frequency) + " is not a frequency in [0, 1].",
                     FrequencyFields());
        }
    }

    return issues;
}

double ConsistencyValidator::PenaltyFor(size_t issueCount) const {
    return std::min(m_penaltyPerIssue * static_cast<double>(issueCount), m_maxPenalty);
}

domain::PenaltyInfo ConsistencyValidator::ApplyPenalties(domain::PairScore& pair, const std::vector<ConsistencyIssue>& issues,
                                                         const domain::scoring::PairScorer& scorer) const {
    domain::PenaltyInfo info;
    if (issues.empty()) return info;

    info.totalPenalty = PenaltyFor(issues.size());

    std::set<std::string> targeted;
    for (const auto& issue : issues) {
        const bool unclassified = issue.code == IssueCode::Unclassified || issue.fields.empty();
        if (unclassified) {
            for (const auto& entry : pair.fieldScores) {
                targeted.insert(entry.first);
                info.issuesByField[entry.first].push_back(issue.message);
            }
            continue;
        }
        for (const auto& field : issue.fields) {
            if (!pair.mutableFieldScore(field)) continue;
            targeted.insert(field);
            auto& messages = info.issuesByField[field];
            if (std::find(messages.begin(), messages.end(), issue.message) == messages.end()) {
                messages.push_back(issue.message);
            }
        }
    }

    for (const auto& field : targeted) {
        double* score = pair.mutableFieldScore(field);
        if (!score) continue;
        domain::FieldPenalty penalty;
        penalty.originalScore = *score;
        *score = *score * (1.0 - info.totalPenalty);
        penalty.penalizedScore = *score;
        penalty.penaltyPercentage = info.totalPenalty * 100.0;
        info.penalizedFields[field] = penalty;
    }

    pair.aggregate = scorer.weightedScore(pair.fieldScores);
    return info;
}

} // namespace annobench::application
