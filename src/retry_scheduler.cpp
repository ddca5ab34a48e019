#include "core/retry_scheduler.hpp"
#include "logging/logger.hpp"

RetryScheduler::RetryScheduler(WorkQueue &queue, RejectCallback on_rejected)
    : queue_(queue), on_rejected_(std::move(on_rejected))
{
}

RetryScheduler::~RetryScheduler()
{
    if (running_.load())
    {
        auto leftover = stop();
        if (!leftover.empty())
            Logger::warn("Retry scheduler destroyed with " + std::to_string(leftover.size()) + " pending tasks");
    }
}

void RetryScheduler::start()
{
    if (running_.exchange(true))
    {
        Logger::warn("Retry scheduler is already running");
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    scheduler_thread_ = std::thread(&RetryScheduler::schedulerLoop, this);
}

void RetryScheduler::schedule(UploadTask task, std::chrono::milliseconds delay)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push(Entry{std::chrono::steady_clock::now() + delay, next_sequence_++, std::move(task)});
    }
    cv_.notify_one();
}

std::vector<UploadTask> RetryScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (scheduler_thread_.joinable())
        scheduler_thread_.join();
    running_.store(false);

    std::vector<UploadTask> leftover;
    std::lock_guard<std::mutex> lock(mutex_);
    while (!entries_.empty())
    {
        // priority_queue::top is const; the entry is discarded right after
        leftover.push_back(std::move(const_cast<Entry &>(entries_.top()).task));
        entries_.pop();
    }
    return leftover;
}

size_t RetryScheduler::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void RetryScheduler::schedulerLoop()
{
    Logger::debug("Retry scheduler started");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_)
    {
        if (entries_.empty())
        {
            cv_.wait(lock, [this]()
                     { return stop_requested_ || !entries_.empty(); });
            continue;
        }

        auto due = entries_.top().due;
        if (std::chrono::steady_clock::now() < due)
        {
            cv_.wait_until(lock, due);
            continue;
        }

        UploadTask task = std::move(const_cast<Entry &>(entries_.top()).task);
        entries_.pop();

        // The queue may block while full; never hold our lock across it
        lock.unlock();
        const std::string path = task.entry ? task.entry->path() : std::string();
        QueueOpStatus status = queue_.enqueue(task);
        if (status != QueueOpStatus::Ok)
        {
            Logger::debug("Retry for " + path + " rejected by the work queue");
            if (on_rejected_)
                on_rejected_(std::move(task));
        }
        else
        {
            Logger::debug("Retry attempt " + std::to_string(task.attempt) + " queued for " + path);
        }
        lock.lock();
    }
    Logger::debug("Retry scheduler stopped");
}
