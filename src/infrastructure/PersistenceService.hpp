/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized file I/O operations.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>

namespace glucosetrail::infrastructure {

/**
 * @enum WriteMode
 * @brief Replace swaps the whole file atomically; Append adds to the end of it.
 */
enum class WriteMode {
    Replace,
    Append
};

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    WriteMode mode = WriteMode::Replace;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs file writes sequentially.
 *
 * This service eliminates race conditions on file writing by ensuring that
 * all write operations pass through a single serialized queue. Writes to the same
 * file land in the order they were queued.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Asynchronously queues a text content to replace a file (temp -> rename).
     * @param filename Path to the file. Parent directories are created.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Asynchronously queues a line to be appended to a file. A newline is added.
     */
    void appendLineAsync(const std::string& filename, const std::string& line);

    /**
     * @brief Blocks until every task queued so far has been written.
     */
    void flush();

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

    /** @brief Number of writes that failed since start. */
    int failedWrites() const { return m_failedWrites.load(); }

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    void enqueue(SaveTask task);

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const SaveTask& task);

    bool performAppend(const SaveTask& task);

    bool ensureParentDirectory(const std::string& filename);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_busy = false;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<int> m_failedWrites{0};
};

} // namespace glucosetrail::infrastructure
