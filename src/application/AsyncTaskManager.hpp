/**
 * @file AsyncTaskManager.hpp
 * @brief Background runner for evaluation jobs with per-job outcome tracking.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace annobench::application {

/**
 * @struct TaskStatus
 * @brief Outcome of one submitted job. Read it after WaitAll().
 */
struct TaskStatus {
    int id = 0;
    std::string label;  ///< e.g. "PMC1000/phenotype"
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
    std::chrono::milliseconds elapsed{0};
};

/**
 * @class AsyncTaskManager
 * @brief Runs each job on its own thread. An exception thrown by a job marks its
 *        status as failed; it never reaches the caller.
 *
 * The destructor blocks until every submitted job has finished.
 */
class AsyncTaskManager {
public:
    using Job = std::function<void(TaskStatus&)>;

    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitAll();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    std::shared_ptr<TaskStatus> Submit(const std::string& label, Job job) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->label = label;

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            ++m_pending;
        }

        std::thread([this, status, job = std::move(job)]() {
            const auto start = std::chrono::steady_clock::now();
            try {
                job(*status);
            } catch (const std::exception& e) {
                status->failed = true;
                status->errorMessage = e.what();
            } catch (...) {
                status->failed = true;
                status->errorMessage = "Unknown error during evaluation job.";
            }
            status->elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            status->isCompleted = true;
            Finish(status->failed);
        }).detach();

        return status;
    }

    /** @brief Blocks until no submitted job is still running. */
    void WaitAll() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_idle.wait(lock, [this] { return m_pending == 0; });
    }

    size_t PendingCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_pending;
    }

    size_t FailedCount() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_failed;
    }

private:
    void Finish(bool failed) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (failed) ++m_failed;
        --m_pending;
        m_idle.notify_all();
    }

    std::atomic<int> m_nextId{0};
    std::mutex m_mutex;
    std::condition_variable m_idle;
    size_t m_pending = 0;
    size_t m_failed = 0;
};

} // namespace annobench::application
