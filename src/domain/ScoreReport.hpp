/**
 * @file ScoreReport.hpp
 * @brief Complete, serializable output of one evaluation call.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/ConsistencyIssue.hpp"

namespace annobench::domain {

/** @brief Report status markers for shortcut outcomes. */
namespace status {
inline constexpr const char* BothEmpty = "both_empty";
inline constexpr const char* OneEmpty = "one_empty";
inline constexpr const char* Error = "error";
} // namespace status

struct FieldScoreSummary {
    std::string field;
    double meanScore = 0.0;
    std::vector<double> scores;
};

/**
 * @struct FieldValuePair
 * @brief Raw values that produced a field score; nullopt means absent.
 */
struct FieldValuePair {
    std::optional<std::string> groundTruth;
    std::optional<std::string> prediction;
};

/**
 * @struct PairDetail
 * @brief Per matched pair: final field scores, issues raised and penalties applied.
 */
struct PairDetail {
    int sampleId = 0;
    size_t predictionIndex = 0;
    size_t groundTruthIndex = 0;
    double matchScore = 0.0;          ///< Aggregate after penalties.
    double rawMatchScore = 0.0;       ///< Aggregate the matcher accepted.
    std::vector<std::pair<std::string, double>> fieldScores;
    std::vector<std::pair<std::string, FieldValuePair>> fieldValues;
    std::vector<std::string> dependencyIssues;
    PenaltyInfo penaltyInfo;
};

struct FieldStatistics {
    std::string field;
    double meanScore = 0.0;
    std::vector<double> scores;
    int exactMatches = 0;
    double exactMatchRate = 0.0;
    std::map<std::string, int> errorTypes;
};

struct ScoreDistribution {
    int excellent = 0;  ///< >= 0.9
    int good = 0;       ///< [0.7, 0.9)
    int fair = 0;       ///< [0.5, 0.7)
    int poor = 0;       ///< < 0.5
};

struct DifficultPair {
    int sampleId = 0;
    double score = 0.0;
    std::vector<std::string> mainIssues;  ///< Fields scoring below the difficulty threshold.
};

struct RunStatistics {
    int matchedPairs = 0;
    double meanOverallScore = 0.0;
    double meanWeightedScore = 0.0;
    double minScore = 0.0;
    double maxScore = 0.0;
    ScoreDistribution distribution;
    std::vector<DifficultPair> difficultPairs;
};

/**
 * @struct ScoreReport
 * @brief Result handed back to the benchmark orchestration layer.
 */
struct ScoreReport {
    int totalSamples = 0;
    std::vector<FieldScoreSummary> fieldScores;
    double overallScore = 0.0;
    std::vector<PairDetail> detailedResults;
    std::optional<std::string> status;
    std::vector<FieldStatistics> fieldStatistics;
    RunStatistics runStatistics;
    int unmatchedPredictions = 0;
    int unmatchedGroundTruths = 0;

    const FieldScoreSummary* findField(const std::string& field) const {
        for (const auto& summary : fieldScores) {
            if (summary.field == field) return &summary;
        }
        return nullptr;
    }
};

/**
 * @struct LowScoringField
 * @brief Entry of a condensed report: a field that cost points, with the values behind it.
 */
struct LowScoringField {
    std::string field;
    double meanScore = 0.0;
    std::vector<double> scores;
    std::vector<FieldValuePair> sampleValues;
};

struct PenaltySummary {
    double totalPenalty = 0.0;
    std::vector<std::string> penalizedFields;
    int issuesCount = 0;
};

/**
 * @struct ReportSummary
 * @brief Condensed view of a ScoreReport without per-pair score maps.
 */
struct ReportSummary {
    double overallScore = 0.0;
    int totalSamples = 0;
    std::optional<std::string> status;
    std::vector<FieldScoreSummary> fieldScores;
    std::vector<LowScoringField> lowScoringFields;
    std::vector<std::string> dependencyIssues;
    std::vector<PenaltySummary> penalties;
};

} // namespace annobench::domain
