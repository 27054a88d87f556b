/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <future>
#include <memory>

namespace ideasnapshot::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    bool append = false; ///< Append to the file instead of replacing it atomically.
    std::shared_ptr<std::promise<bool>> done; ///< Fulfilled with the write outcome.
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs file writes sequentially.
 *
 * All writes pass through a single serialized queue, so concurrent
 * generations never interleave on the same file. Each call returns a future
 * carrying the outcome for callers that must not report success before the
 * data is on disk.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Queues a full replacement of @p filename (temp file, then rename).
     * @return Future resolved to true once the file is in place.
     */
    std::future<bool> saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Queues an append of @p content to @p filename.
     * @return Future resolved to true once the bytes are flushed.
     */
    std::future<bool> appendTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    std::future<bool> enqueue(SaveTask task);

    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const SaveTask& task);

    bool performAppend(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace ideasnapshot::infrastructure
