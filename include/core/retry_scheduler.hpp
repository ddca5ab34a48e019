#pragma once

#include "core/upload_types.hpp"
#include "core/work_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * @brief Timer thread that puts backing-off tasks back on the work queue
 *
 * A task waiting for its retry delay never occupies an uploader worker.
 * When the delay expires the task is appended to the back of the queue;
 * if the queue refuses it the task is handed to the rejection callback.
 */
class RetryScheduler
{
public:
    using RejectCallback = std::function<void(UploadTask &&)>;

    RetryScheduler(WorkQueue &queue, RejectCallback on_rejected);
    ~RetryScheduler();

    RetryScheduler(const RetryScheduler &) = delete;
    RetryScheduler &operator=(const RetryScheduler &) = delete;

    void start();

    void schedule(UploadTask task, std::chrono::milliseconds delay);

    // Stop the timer thread and return the tasks that were still waiting
    std::vector<UploadTask> stop();

    size_t pending() const;
    bool isRunning() const { return running_.load(); }

private:
    struct Entry
    {
        std::chrono::steady_clock::time_point due;
        uint64_t sequence; // FIFO among equal deadlines
        UploadTask task;
    };

    struct LaterFirst
    {
        bool operator()(const Entry &a, const Entry &b) const
        {
            if (a.due != b.due)
                return a.due > b.due;
            return a.sequence > b.sequence;
        }
    };

    void schedulerLoop();

    WorkQueue &queue_;
    RejectCallback on_rejected_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Entry, std::vector<Entry>, LaterFirst> entries_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
    std::thread scheduler_thread_;
};
