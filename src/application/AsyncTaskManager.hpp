/**
 * @file AsyncTaskManager.hpp
 * @brief Runs correlation work off the caller's thread with unified status tracking.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <thread>
#include <atomic>
#include <memory>
#include <algorithm>
#include <iterator>
#include "application/ScanControl.hpp"

namespace metriclens::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    CorrelationScan,
    RelationshipAnalysis,
    Export
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 *
 * errorMessage is written before isCompleted is set; read it only after
 * isCompleted is observed true.
 */
struct TaskStatus {
    int id = 0;
    TaskType type = TaskType::CorrelationScan;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::atomic<bool> cancelRequested{false};
    std::string errorMessage;
};

/**
 * @brief Wires a task's cancel flag and progress into the engine's scan hooks.
 */
inline ScanControl MakeScanControl(const std::shared_ptr<TaskStatus>& status) {
    ScanControl control;
    control.isCancelled = [status]() { return status->cancelRequested.load(); };
    control.onProgress = [status](float fraction) { status->progress = fraction; };
    return control;
}

/**
 * @class AsyncTaskManager
 * @brief Manages background execution and provides unified status tracking.
 *
 * Tasks run on their own threads; the destructor requests cancellation of
 * everything still running and joins.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    ~AsyncTaskManager() {
        for (const auto& status : GetActiveTasks()) {
            status->cancelRequested = true;
        }
        WaitAll();
    }

    /**
     * @brief Submits a new task to be executed in the background.
     * @param f Callable invoked as f(status, args...). Exceptions mark the task failed.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        ReapFinishedThreads();

        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.push_back(status);

        std::thread worker([this, status](auto userFunc, auto... userArgs) {
            try {
                userFunc(status, std::move(userArgs)...);
                status->progress = 1.0f;
            } catch (const std::exception& e) {
                status->errorMessage = e.what();
                status->failed = true;
            } catch (...) {
                status->errorMessage = "Unknown error during task execution.";
                status->failed = true;
            }
            status->isCompleted = true;
            CleanupCompletedTasks();
        }, std::forward<F>(f), std::forward<Args>(args)...);
        m_workers.push_back(Worker{status, std::move(worker)});

        return status;
    }

    /** @brief Asks a task to stop at its next cancellation point. */
    static void RequestCancel(const std::shared_ptr<TaskStatus>& status) {
        if (status) status->cancelRequested = true;
    }

    /** @brief Returns snapshots of all active tasks. */
    std::vector<std::shared_ptr<TaskStatus>> GetActiveTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_activeTasks;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitAll() {
        std::vector<Worker> workers;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            workers.swap(m_workers);
        }
        for (auto& w : workers) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    /** @brief Number of thread handles not yet joined. */
    std::size_t PendingThreadCount() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        return m_workers.size();
    }

private:
    struct Worker {
        std::shared_ptr<TaskStatus> status;
        std::thread thread;
    };

    // Joins threads whose task has completed. Joining happens outside the
    // lock because a finishing task still takes it in CleanupCompletedTasks.
    void ReapFinishedThreads() {
        std::vector<Worker> finished;
        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            auto split = std::stable_partition(m_workers.begin(), m_workers.end(),
                [](const Worker& w) { return !w.status->isCompleted.load(); });
            std::move(split, m_workers.end(), std::back_inserter(finished));
            m_workers.erase(split, m_workers.end());
        }
        for (auto& w : finished) {
            if (w.thread.joinable()) w.thread.join();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(),
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::vector<Worker> m_workers;
    std::mutex m_tasksMutex;
};

} // namespace metriclens::application
