/**
 * @file ConsistencyValidator.hpp
 * @brief Audit gate for logically contradictory predicted records.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/AnnotationInstance.hpp"
#include "domain/AnnotationSchema.hpp"
#include "domain/ConsistencyIssue.hpp"
#include "domain/PairScore.hpp"
#include "domain/scoring/PairScorer.hpp"

namespace annobench::application {

/**
 * @class ConsistencyValidator
 * @brief Detects cross-field contradictions in one prediction and discounts the implicated field scores.
 *
 * Checks are driven by the schema's field roles; a check whose role fields are not
 * configured is skipped.
 */
class ConsistencyValidator {
public:
    ConsistencyValidator(const domain::AnnotationSchema& schema, double penaltyPerIssue = 0.05, double maxPenalty = 0.3);

    /**
     * @brief Runs every applicable check on a predicted record.
     * @param related Records sharing a cross-reference key; empty disables the referential check.
     */
    std::vector<domain::ConsistencyIssue> Validate(const domain::AnnotationInstance& prediction,
                                                   const std::vector<domain::AnnotationInstance>& related = {}) const;

    /** @brief min(penaltyPerIssue * count, maxPenalty). */
    double PenaltyFor(size_t issueCount) const;

    /**
     * @brief Multiplies every targeted field score by (1 - penalty) once, then recomputes the aggregate.
     * @return What was discounted; totalPenalty is 0 when there were no issues.
     */
    domain::PenaltyInfo ApplyPenalties(domain::PairScore& pair, const std::vector<domain::ConsistencyIssue>& issues,
                                       const domain::scoring::PairScorer& scorer) const;

private:
    void AddIssue(std::vector<domain::ConsistencyIssue>& issues, domain::IssueCode code,
                  const std::string& message, std::vector<std::string> fields) const;
    std::vector<std::string> StatisticFields() const;
    std::vector<std::string> IntervalFields() const;
    std::vector<std::string> FrequencyFields() const;

    const domain::AnnotationSchema& m_schema;
    double m_penaltyPerIssue;
    double m_maxPenalty;
};

} // namespace annobench::application
