#include "core/uploader_pool.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>

UploaderPool::UploaderPool(size_t concurrency, WorkQueue &queue, DedupTracker &tracker, ResultAggregator &aggregator,
                           Uploader &uploader, FatalCallback on_fatal)
    : concurrency_(concurrency == 0 ? defaultConcurrency() : concurrency),
      queue_(queue),
      tracker_(tracker),
      aggregator_(aggregator),
      uploader_(uploader),
      on_fatal_(std::move(on_fatal))
{
}

UploaderPool::~UploaderPool()
{
    if (!workers_.empty())
    {
        queue_.cancel();
        join();
    }
}

size_t UploaderPool::defaultConcurrency()
{
    size_t hw = std::thread::hardware_concurrency();
    if (hw == 0)
        hw = 2;
    return std::clamp<size_t>(hw * 2, 4, 16);
}

void UploaderPool::start()
{
    if (!workers_.empty())
    {
        Logger::warn("Uploader pool already started");
        return;
    }
    Logger::info("Starting " + std::to_string(concurrency_) + " upload workers using " + uploader_.name());
    workers_.reserve(concurrency_);
    for (size_t i = 0; i < concurrency_; ++i)
        workers_.emplace_back(&UploaderPool::workerLoop, this, i);
}

void UploaderPool::join()
{
    for (auto &worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    workers_.clear();
}

void UploaderPool::workerLoop(size_t worker_id)
{
    Logger::debug("Upload worker " + std::to_string(worker_id) + " started");
    while (auto next = queue_.dequeue())
    {
        const UploadTask snapshot = *next;
        try
        {
            UploadResult result = process(std::move(*next));
            aggregator_.submit(std::move(result));
        }
        catch (const std::exception &e)
        {
            Logger::error("Upload worker " + std::to_string(worker_id) + " hit a pipeline error on " +
                          (snapshot.entry ? snapshot.entry->path() : std::string("<none>")) + ": " + e.what());
            aggregator_.recordAborted(snapshot, e.what());
            if (on_fatal_)
                on_fatal_(e.what());
        }
    }
    Logger::debug("Upload worker " + std::to_string(worker_id) + " finished");
}

UploadResult UploaderPool::process(UploadTask task)
{
    task.transitionTo(TaskState::InFlight);

    UploadResult result;
    const FileEntry &entry = *task.entry;

    auto current = FileUtils::getFileMetadata(entry.path());
    if (!current)
    {
        result.status = UploadStatus::Failure;
        result.error = UploadError::permanent("file vanished before upload");
        result.task = std::move(task);
        return result;
    }
    if (current->file_size != entry.size() || current->modified_at_ns != entry.modifiedAtNs())
    {
        Logger::debug("Changed since scan: " + current->toString());
        result.status = UploadStatus::Failure;
        result.error = UploadError::permanent("file changed since it was scanned");
        result.task = std::move(task);
        return result;
    }

    // Retries keep their claim and go straight to the transfer
    if (!task.claim_held)
    {
        try
        {
            task.fingerprint = entry.fingerprint();
        }
        catch (const FileAccessError &e)
        {
            result.status = UploadStatus::Failure;
            result.error = UploadError::permanent(e.what());
            result.task = std::move(task);
            return result;
        }

        if (!tracker_.shouldUpload(task.fingerprint) || !tracker_.claim(task.fingerprint))
        {
            result.status = UploadStatus::Duplicate;
            result.task = std::move(task);
            return result;
        }
        task.claim_held = true;
    }

    SendResult sent;
    try
    {
        sent = uploader_.send(entry);
    }
    catch (const std::exception &e)
    {
        sent = SendResult::failure(UploadError::transient(std::string("uploader threw: ") + e.what()));
    }

    if (sent.success)
    {
        result.status = UploadStatus::Success;
        result.outcome = sent.outcome;
    }
    else
    {
        result.status = UploadStatus::Failure;
        result.error = sent.error;
    }
    result.task = std::move(task);
    return result;
}
