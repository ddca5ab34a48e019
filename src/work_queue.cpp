#include "core/work_queue.hpp"
#include "logging/logger.hpp"

WorkQueue::WorkQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity)
{
}

QueueOpStatus WorkQueue::enqueue(UploadTask task)
{
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this]()
                   { return tasks_.size() < capacity_ || closed_ || cancelled_; });
    if (cancelled_)
        return QueueOpStatus::Cancelled;
    if (closed_)
        return QueueOpStatus::Closed;

    tasks_.push_back(std::move(task));
    lock.unlock();
    not_empty_.notify_one();
    return QueueOpStatus::Ok;
}

std::optional<UploadTask> WorkQueue::dequeue()
{
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this]()
                    { return !tasks_.empty() || closed_ || cancelled_; });
    if (cancelled_ || tasks_.empty())
        return std::nullopt;

    UploadTask task = std::move(tasks_.front());
    tasks_.pop_front();
    lock.unlock();
    not_full_.notify_one();
    return task;
}

void WorkQueue::close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        closed_ = true;
    }
    Logger::debug("Work queue closed");
    not_empty_.notify_all();
    not_full_.notify_all();
}

void WorkQueue::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_)
            return;
        cancelled_ = true;
    }
    Logger::debug("Work queue cancelled");
    not_empty_.notify_all();
    not_full_.notify_all();
}

std::vector<UploadTask> WorkQueue::drain()
{
    std::vector<UploadTask> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.reserve(tasks_.size());
        for (auto &task : tasks_)
            remaining.push_back(std::move(task));
        tasks_.clear();
    }
    not_full_.notify_all();
    return remaining;
}

size_t WorkQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool WorkQueue::isClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool WorkQueue::isCancelled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}
