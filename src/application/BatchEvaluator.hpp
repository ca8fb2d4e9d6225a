/**
 * @file BatchEvaluator.hpp
 * @brief Runs many (article, annotation family) evaluations in the background and averages them.
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/AnnotationBenchmark.hpp"
#include "domain/AnnotationInstance.hpp"
#include "domain/EngineConfig.hpp"
#include "domain/ScoreReport.hpp"

namespace annobench::application {

/**
 * @struct ArticleJob
 * @brief Ground truth and predictions of one annotation family for one article.
 */
struct ArticleJob {
    std::string articleId;
    std::string family;
    std::vector<domain::AnnotationInstance> groundTruths;
    std::vector<domain::AnnotationInstance> predictions;
    domain::EvaluationOptions options;
    bool firstPairOnly = false;  ///< Score only the first record of each side, without matching.
};

struct ArticleResult {
    std::string articleId;
    std::string family;
    domain::ScoreReport report;
    std::optional<std::string> error;
};

/**
 * @struct FamilyAverage
 * @brief Mean overall score of one family across articles; one_empty reports are left out.
 */
struct FamilyAverage {
    std::string family;
    std::optional<double> averageScore;  ///< nullopt when every report was one_empty.
    int counted = 0;
    int excluded = 0;
};

/**
 * @class BatchEvaluator
 * @brief Fans jobs out over AsyncTaskManager. A failing job never aborts the batch:
 *        it becomes a report with status "error" and overall score 0.
 */
class BatchEvaluator {
public:
    explicit BatchEvaluator(bool verbose = false);

    /** @brief Registers the engine used for jobs of the given family. */
    void RegisterFamily(const std::string& family, std::shared_ptr<const AnnotationBenchmark> benchmark);

    bool HasFamily(const std::string& family) const;

    /** @brief Evaluates every job; results come back in job order. */
    std::vector<ArticleResult> Run(const std::vector<ArticleJob>& jobs) const;

    std::vector<FamilyAverage> Summarize(const std::vector<ArticleResult>& results) const;

private:
    domain::ScoreReport EvaluateJob(const ArticleJob& job) const;

    std::map<std::string, std::shared_ptr<const AnnotationBenchmark>> m_families;
    bool m_verbose;
};

} // namespace annobench::application
