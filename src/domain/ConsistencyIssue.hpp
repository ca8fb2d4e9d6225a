/**
 * @file ConsistencyIssue.hpp
 * @brief Value Objects describing internally contradictory predictions and the penalty they cost.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

namespace annobench::domain {

/**
 * @enum IssueCode
 * @brief Class of logical contradiction detected inside one predicted record.
 */
enum class IssueCode {
    ReferentialIntegrity,
    StatisticalSign,
    IntervalOrdering,
    IntervalContainment,
    BoundedFraction,
    Unclassified          ///< Penalizes every field of the record.
};

inline std::string IssueCodeToString(IssueCode code) {
    switch (code) {
        case IssueCode::ReferentialIntegrity: return "referential_integrity";
        case IssueCode::StatisticalSign: return "statistical_sign";
        case IssueCode::IntervalOrdering: return "interval_ordering";
        case IssueCode::IntervalContainment: return "interval_containment";
        case IssueCode::BoundedFraction: return "bounded_fraction";
        case IssueCode::Unclassified: return "unclassified";
        default: return "unknown";
    }
}

/**
 * @struct ConsistencyIssue
 * @brief One contradiction, tagged with the fields whose scores it discounts.
 */
struct ConsistencyIssue {
    IssueCode code = IssueCode::Unclassified;
    std::string message;
    std::vector<std::string> fields;
};

/**
 * @struct FieldPenalty
 * @brief Before/after view of one discounted field score.
 */
struct FieldPenalty {
    double originalScore = 0.0;
    double penalizedScore = 0.0;
    double penaltyPercentage = 0.0;
};

/**
 * @struct PenaltyInfo
 * @brief Penalty applied to one matched pair.
 */
struct PenaltyInfo {
    double totalPenalty = 0.0;
    std::map<std::string, FieldPenalty> penalizedFields;
    std::map<std::string, std::vector<std::string>> issuesByField;
};

} // namespace annobench::domain
