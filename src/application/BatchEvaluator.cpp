/**
 * @file BatchEvaluator.cpp
 * @brief Implementation of BatchEvaluator.
 */

#include "application/BatchEvaluator.hpp"

#include <iostream>
#include <stdexcept>

#include "application/AsyncTaskManager.hpp"

namespace annobench::application {

using domain::ScoreReport;

BatchEvaluator::BatchEvaluator(bool verbose) : m_verbose(verbose) {}

void BatchEvaluator::RegisterFamily(const std::string& family, std::shared_ptr<const AnnotationBenchmark> benchmark) {
    if (!benchmark) {
        throw std::invalid_argument("BatchEvaluator: benchmark for family '" + family + "' is null.");
    }
    if (m_verbose) {
        const auto& config = benchmark->getConfig();
        std::cout << "[BatchEvaluator] Family '" << family << "' uses schema '" << benchmark->getSchema().getName()
                  << "' (threshold " << config.matchingThreshold << ")." << std::endl;
    }
    m_families[family] = std::move(benchmark);
}

bool BatchEvaluator::HasFamily(const std::string& family) const {
    return m_families.count(family) > 0;
}

ScoreReport BatchEvaluator::EvaluateJob(const ArticleJob& job) const {
    auto it = m_families.find(job.family);
    if (it == m_families.end()) {
        throw std::invalid_argument("No benchmark registered for family '" + job.family + "'.");
    }
    const AnnotationBenchmark& benchmark = *it->second;

    if (!job.firstPairOnly) {
        return benchmark.EvaluateSet(job.groundTruths, job.predictions, job.options);
    }
    if (job.groundTruths.empty() || job.predictions.empty()) {
        // Same empty-side shortcuts as set mode.
        return benchmark.EvaluateSet(job.groundTruths, job.predictions, job.options);
    }
    return benchmark.EvaluatePair(job.groundTruths.front(), job.predictions.front(), job.options);
}

std::vector<ArticleResult> BatchEvaluator::Run(const std::vector<ArticleJob>& jobs) const {
    std::vector<ArticleResult> results(jobs.size());

    {
        AsyncTaskManager tasks;
        std::vector<std::shared_ptr<TaskStatus>> statuses;
        statuses.reserve(jobs.size());
        for (size_t i = 0; i < jobs.size(); ++i) {
            const ArticleJob& job = jobs[i];
            ArticleResult& slot = results[i];
            slot.articleId = job.articleId;
            slot.family = job.family;
            statuses.push_back(tasks.Submit(job.articleId + "/" + job.family,
                [this, &job, &slot](TaskStatus&) { slot.report = EvaluateJob(job); }));
        }
        tasks.WaitAll();

        for (size_t i = 0; i < jobs.size(); ++i) {
            const TaskStatus& status = *statuses[i];
            if (!status.failed) continue;
            std::cerr << "[BatchEvaluator] Error in " << status.label << ": " << status.errorMessage << std::endl;
            ArticleResult& slot = results[i];
            slot.report = ScoreReport{};
            slot.report.overallScore = 0.0;
            slot.report.status = domain::status::Error;
            slot.error = status.errorMessage;
        }
        if (m_verbose) {
            std::cout << "[BatchEvaluator] " << jobs.size() << " jobs finished, " << tasks.FailedCount()
                      << " failed." << std::endl;
        }
    }

    if (m_verbose) {
        for (const auto& result : results) {
            std::cout << "[BatchEvaluator] " << result.articleId << " " << result.family << ": "
                      << result.report.overallScore;
            if (result.report.status) std::cout << " (" << *result.report.status << ")";
            std::cout << std::endl;
        }
    }
    return results;
}

std::vector<FamilyAverage> BatchEvaluator::Summarize(const std::vector<ArticleResult>& results) const {
    std::map<std::string, std::pair<double, FamilyAverage>> totals;
    for (const auto& [family, benchmark] : m_families) {
        totals[family].second.family = family;
    }

    for (const auto& result : results) {
        auto& [sum, average] = totals[result.family];
        average.family = result.family;
        if (result.report.status && *result.report.status == domain::status::OneEmpty) {
            ++average.excluded;
            continue;
        }
        sum += result.report.overallScore;
        ++average.counted;
    }

    std::vector<FamilyAverage> averages;
    for (auto& [family, total] : totals) {
        FamilyAverage average = total.second;
        if (average.counted > 0) average.averageScore = total.first / average.counted;
        if (m_verbose) {
            if (average.averageScore) {
                std::cout << "[BatchEvaluator] " << family << ": " << *average.averageScore << " (avg across "
                          << average.counted << " articles, excluding one_empty)" << std::endl;
            } else {
                std::cout << "[BatchEvaluator] " << family << ": no valid scores" << std::endl;
            }
        }
        averages.push_back(std::move(average));
    }
    return averages;
}

} // namespace annobench::application
