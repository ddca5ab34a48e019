#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <variant>

class DedupStore;

struct WriteOperationResult
{
    bool success;
    std::string error_message;

    WriteOperationResult(bool s = true, const std::string &msg = "")
        : success(s), error_message(msg) {}

    static WriteOperationResult Failure(const std::string &msg = "")
    {
        return WriteOperationResult(false, msg);
    }
};

using WriteOperation = std::function<WriteOperationResult(DedupStore &)>;
using ReadOperation = std::function<std::any(DedupStore &)>;

/**
 * @brief Serializes every SQLite call onto one access thread
 *
 * Writes are fire-and-forget with a per-operation result that can be looked
 * up by id; reads hand back a future.
 */
class DatabaseAccessQueue
{
public:
    explicit DatabaseAccessQueue(DedupStore &store);
    ~DatabaseAccessQueue();

    size_t enqueueWrite(WriteOperation operation);
    std::future<std::any> enqueueRead(ReadOperation operation);

    // Wait for all pending operations to complete
    void wait_for_completion(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Stop the access thread once the queue is empty
    void stop();

    // Get the result of a specific operation by its ID
    WriteOperationResult getOperationResult(size_t operation_id) const;

    size_t failedWrites() const { return failed_writes_.load(); }

private:
    using QueuedOperation = std::variant<std::pair<WriteOperation, size_t>,
                                         std::pair<ReadOperation, std::promise<std::any>>>;

    void access_thread_worker();

    DedupStore &store_;
    std::queue<QueuedOperation> operation_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread access_thread_;
    std::atomic<bool> should_stop_{false};

    // Track operation results by ID
    mutable std::mutex results_mutex_;
    std::map<size_t, WriteOperationResult> operation_results_;
    std::atomic<size_t> next_operation_id_{0};

    // Writes dequeued but not finished still count as pending
    std::atomic<size_t> pending_write_operations_{0};
    std::atomic<size_t> failed_writes_{0};
};
