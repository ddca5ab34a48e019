#pragma once

#include "core/upload_types.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

enum class QueueOpStatus
{
    Ok,
    Closed,
    Cancelled
};

/**
 * @brief Bounded FIFO between the scanner and the uploader pool
 *
 * enqueue() blocks while the queue is full, which is what throttles the
 * scanner. dequeue() blocks while it is empty and returns nullopt once the
 * queue is closed and empty, or as soon as it is cancelled.
 */
class WorkQueue
{
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    explicit WorkQueue(size_t capacity = DEFAULT_CAPACITY);

    WorkQueue(const WorkQueue &) = delete;
    WorkQueue &operator=(const WorkQueue &) = delete;

    QueueOpStatus enqueue(UploadTask task);
    std::optional<UploadTask> dequeue();

    // No further enqueues; consumers finish what is left
    void close();

    // Reject enqueues and wake every waiter; queued tasks stay for drain()
    void cancel();

    std::vector<UploadTask> drain();

    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool isClosed() const;
    bool isCancelled() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<UploadTask> tasks_;
    bool closed_ = false;
    bool cancelled_ = false;
};
