#include "database/database_access_queue.hpp"
#include "logging/logger.hpp"

DatabaseAccessQueue::DatabaseAccessQueue(DedupStore &store)
    : store_(store)
{
    access_thread_ = std::thread(&DatabaseAccessQueue::access_thread_worker, this);
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
    if (access_thread_.joinable())
    {
        access_thread_.join();
    }
}

size_t DatabaseAccessQueue::enqueueWrite(WriteOperation operation)
{
    size_t operation_id = next_operation_id_.fetch_add(1);
    pending_write_operations_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(std::make_pair(std::move(operation), operation_id));
    }
    queue_cv_.notify_all();
    return operation_id;
}

std::future<std::any> DatabaseAccessQueue::enqueueRead(ReadOperation operation)
{
    std::promise<std::any> promise;
    std::future<std::any> future = promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(std::make_pair(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_all();

    return future;
}

void DatabaseAccessQueue::wait_for_completion(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto done = [this]
    { return (operation_queue_.empty() && pending_write_operations_.load() == 0) || should_stop_; };

    if (!queue_cv_.wait_for(lock, timeout, done))
    {
        Logger::warn("Database access queue wait_for_completion timed out after " +
                     std::to_string(timeout.count()) + "ms - continuing to wait for operations to complete");
        queue_cv_.wait(lock, done);
    }
}

void DatabaseAccessQueue::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        should_stop_ = true;
    }
    queue_cv_.notify_all();
}

WriteOperationResult DatabaseAccessQueue::getOperationResult(size_t operation_id) const
{
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = operation_results_.find(operation_id);
    if (it != operation_results_.end())
    {
        return it->second;
    }
    return WriteOperationResult::Failure("Operation not found");
}

void DatabaseAccessQueue::access_thread_worker()
{
    while (true)
    {
        QueuedOperation operation;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !operation_queue_.empty() || should_stop_; });

            if (operation_queue_.empty())
            {
                break;
            }
            operation = std::move(operation_queue_.front());
            operation_queue_.pop();
        }

        if (std::holds_alternative<std::pair<WriteOperation, size_t>>(operation))
        {
            auto [write_op, operation_id] = std::get<std::pair<WriteOperation, size_t>>(std::move(operation));
            WriteOperationResult result;
            try
            {
                result = write_op(store_);
            }
            catch (const std::exception &e)
            {
                result = WriteOperationResult::Failure(e.what());
            }

            if (!result.success)
            {
                failed_writes_.fetch_add(1);
                Logger::error("Database write operation " + std::to_string(operation_id) + " failed: " +
                              result.error_message);
            }
            {
                std::lock_guard<std::mutex> lock(results_mutex_);
                operation_results_[operation_id] = result;
            }
            pending_write_operations_.fetch_sub(1);
        }
        else
        {
            auto [read_op, promise] = std::get<std::pair<ReadOperation, std::promise<std::any>>>(std::move(operation));
            try
            {
                promise.set_value(read_op(store_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database read operation failed: " + std::string(e.what()));
                promise.set_exception(std::current_exception());
            }
        }

        // Wake wait_for_completion callers
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_cv_.notify_all();
        }
    }
}
