/**
 * @file PersistenceService.hpp
 * @brief Single background writer for identity snapshots (atomic temp-then-rename).
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

namespace healthiq::infrastructure {

/**
 * @struct SaveTask
 * @brief One queued file write.
 */
struct SaveTask {
    std::string filename;
    std::string content;
};

/**
 * @class PersistenceService
 * @brief Serializes every snapshot write through one queue and one worker thread.
 *
 * A reader never observes a half-written file: content goes to a temp file next
 * to the target and is renamed over it.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues @p content to be written to @p filename.
     * @throws std::runtime_error if the service was already stopped.
     */
    void saveTextAsync(const std::string& filename, const std::string& content);

    /** @brief Blocks until every write queued so far has completed or failed. */
    void flush();

    /** @brief Drains the queue and joins the worker. Idempotent. */
    void stop();

    /** @brief Number of writes that failed since construction. */
    size_t failedWrites() const { return m_failedWrites.load(); }

private:
    void workerLoop();

    /** @return false if the write failed (already logged). */
    bool performAtomicWrite(const SaveTask& task);

    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idleCv;
    bool m_writing = false;

    std::thread m_worker;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_failedWrites{0};
};

} // namespace healthiq::infrastructure
