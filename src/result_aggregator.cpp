#include "core/result_aggregator.hpp"
#include "logging/logger.hpp"

ResultAggregator::ResultAggregator(DedupTracker &tracker, WorkQueue &queue, RetryPolicy policy,
                                   ScheduleRetry schedule_retry, PersistCallback persist)
    : tracker_(tracker),
      queue_(queue),
      policy_(policy),
      schedule_retry_(std::move(schedule_retry)),
      persist_(std::move(persist))
{
}

void ResultAggregator::recordScanned(const FileEntry &entry)
{
    Logger::trace("Scanned " + entry.toString());
    std::lock_guard<std::mutex> lock(mutex_);
    ++summary_.scanned;
}

void ResultAggregator::recordScanError(const ScanError &error)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++summary_.scan_errors;
    summary_.scan_error_entries.push_back(ScanErrorEntry{error.path, ScanError::kindName(error.kind), error.message});
}

void ResultAggregator::recordUnchanged(const FileEntry &entry)
{
    Logger::debug("Unchanged since last run, skipping: " + entry.relativePath());
    std::lock_guard<std::mutex> lock(mutex_);
    ++summary_.skipped_duplicate;
}

void ResultAggregator::admit(const UploadTask &task)
{
    if (task.entry)
        Logger::trace("Queued " + task.entry->relativePath());
    std::lock_guard<std::mutex> lock(mutex_);
    ++outstanding_;
}

void ResultAggregator::producerFinished()
{
    std::lock_guard<std::mutex> lock(mutex_);
    producer_done_ = true;
    if (outstanding_ == 0)
    {
        queue_.close();
        settled_cv_.notify_all();
    }
}

void ResultAggregator::submit(UploadResult result)
{
    UploadTask &task = result.task;
    const std::string path = task.entry ? task.entry->path() : std::string();
    std::vector<UploadTask> requeued;

    switch (result.status)
    {
    case UploadStatus::Success:
    {
        task.transitionTo(TaskState::Succeeded);
        UploadedFile uploaded{path, task.entry->relativePath(), task.fingerprint, result.outcome.remote_id,
                              task.entry->size(), task.entry->mimeType(), task.entry->category()};
        if (on_uploaded_)
            on_uploaded_(uploaded);

        CommitOutcome outcome{true, result.outcome.remote_id, path, task.entry->size(), task.entry->modifiedAtNs()};
        DedupRecord record{task.fingerprint, DedupStatus::Succeeded, outcome.remote_id, path,
                           outcome.file_size, outcome.modified_at_ns};
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tracker_.commit(task.fingerprint, outcome);
            ++summary_.uploaded;
            summary_.total_bytes += result.outcome.bytes_sent;
            summary_.uploaded_files.push_back(std::move(uploaded));
            settleOneLocked();
            resolveWaitersLocked(task.fingerprint, requeued);
        }
        if (persist_)
            persist_(record);

        Logger::info("Uploaded " + task.entry->relativePath() + " (" + std::to_string(result.outcome.bytes_sent) +
                     " bytes) as " + result.outcome.remote_id);
        requeue(std::move(requeued));
        return;
    }
    case UploadStatus::Duplicate:
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bool found = false;
            DedupStatus status = tracker_.statusOf(task.fingerprint, &found);
            if (found && status == DedupStatus::Succeeded)
            {
                Logger::debug("Duplicate content, skipping: " + path);
                ++summary_.skipped_duplicate;
                settleOneLocked();
                return;
            }
            if (cancelled_ || aborted_)
            {
                recordCancelledLocked(task, requeued);
                return;
            }
            if (found && status == DedupStatus::InFlight)
            {
                Logger::debug("Same content is being uploaded by another task, waiting: " + path);
                waiting_[task.fingerprint].push_back(std::move(task));
                return;
            }
        }
        // The claim ended between the worker's claim attempt and now
        requeued.push_back(std::move(task));
        requeue(std::move(requeued));
        return;
    }
    case UploadStatus::Failure:
        break;
    }

    bool retry = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retry = result.error.retryable() && policy_.allowsRetry(task.attempt) && !cancelled_ && !aborted_;
        if (!retry)
        {
            recordFailureLocked(task, result.error, requeued);
            settleOneLocked();
        }
    }
    if (!retry)
    {
        requeue(std::move(requeued));
        return;
    }

    auto delay = policy_.delayFor(task.attempt);
    task.transitionTo(TaskState::Pending);
    ++task.attempt;
    Logger::warn("Transient failure for " + path + ": " + result.error.message + ", retry " +
                 std::to_string(task.attempt) + "/" + std::to_string(policy_.max_retries) + " in " +
                 std::to_string(delay.count()) + "ms");
    schedule_retry_(std::move(task), delay);
}

void ResultAggregator::recordFailureLocked(const UploadTask &task, const UploadError &error,
                                           std::vector<UploadTask> &requeue)
{
    const std::string path = task.entry ? task.entry->path() : std::string();
    Logger::error("Upload failed for " + path + " after " + std::to_string(task.attempt + 1) + " attempt(s): " +
                  error.message);
    ++summary_.failed;
    summary_.failed_files.push_back(FailedFile{path, error.kindName(), error.message, task.attempt + 1});

    if (task.claim_held)
    {
        CommitOutcome outcome{false, "", path, task.entry ? task.entry->size() : 0,
                              task.entry ? task.entry->modifiedAtNs() : 0};
        tracker_.commit(task.fingerprint, outcome);
        resolveWaitersLocked(task.fingerprint, requeue);
    }
}

void ResultAggregator::recordCancelledLocked(const UploadTask &task, std::vector<UploadTask> &requeue)
{
    ++summary_.cancelled;
    if (task.entry)
        summary_.cancelled_paths.push_back(task.entry->path());
    settleOneLocked();

    if (task.claim_held && !task.fingerprint.empty())
    {
        tracker_.release(task.fingerprint);
        resolveWaitersLocked(task.fingerprint, requeue);
    }
}

void ResultAggregator::resolveWaitersLocked(const std::string &fingerprint, std::vector<UploadTask> &requeue)
{
    auto it = waiting_.find(fingerprint);
    if (it == waiting_.end())
        return;
    std::vector<UploadTask> parked = std::move(it->second);
    waiting_.erase(it);

    bool found = false;
    const bool uploaded = tracker_.statusOf(fingerprint, &found) == DedupStatus::Succeeded && found;
    for (auto &task : parked)
    {
        if (uploaded)
        {
            Logger::debug("Duplicate content, skipping: " + task.entry->path());
            ++summary_.skipped_duplicate;
            settleOneLocked();
        }
        else if (cancelled_ || aborted_)
        {
            ++summary_.cancelled;
            summary_.cancelled_paths.push_back(task.entry->path());
            settleOneLocked();
        }
        else
        {
            requeue.push_back(std::move(task));
        }
    }
}

void ResultAggregator::requeue(std::vector<UploadTask> tasks)
{
    for (auto &task : tasks)
    {
        Logger::info("Upload of identical content did not succeed, trying " + task.entry->relativePath());
        task.transitionTo(TaskState::Pending);
        schedule_retry_(std::move(task), std::chrono::milliseconds(0));
    }
}

void ResultAggregator::recordCancelled(const UploadTask &task)
{
    std::vector<UploadTask> requeued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recordCancelledLocked(task, requeued);
    }
    requeue(std::move(requeued));
}

void ResultAggregator::recordAborted(const UploadTask &task, const std::string &reason)
{
    std::vector<UploadTask> requeued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!aborted_)
        {
            aborted_ = true;
            summary_.abort_reason = reason;
        }
        recordFailureLocked(task, UploadError::permanent("pipeline error: " + reason), requeued);
        settleOneLocked();
    }
    settled_cv_.notify_all();
    requeue(std::move(requeued));
}

void ResultAggregator::settleOneLocked()
{
    if (outstanding_ > 0)
        --outstanding_;
    if (producer_done_ && outstanding_ == 0)
    {
        queue_.close();
        settled_cv_.notify_all();
    }
}

void ResultAggregator::cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    settled_cv_.notify_all();
}

void ResultAggregator::interrupt()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        interrupted_ = true;
    }
    settled_cv_.notify_all();
}

void ResultAggregator::waitUntilSettled()
{
    std::unique_lock<std::mutex> lock(mutex_);
    settled_cv_.wait(lock, [this]()
                     { return (producer_done_ && outstanding_ == 0) || cancelled_ || aborted_ || interrupted_; });
}

bool ResultAggregator::isCancelled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool ResultAggregator::isAborted() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_;
}

size_t ResultAggregator::outstanding() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

size_t ResultAggregator::waiting() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto &item : waiting_)
        count += item.second.size();
    return count;
}

RunSummary ResultAggregator::finalize(RunState state, std::chrono::milliseconds elapsed)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &item : waiting_)
    {
        for (const auto &task : item.second)
        {
            Logger::warn("Still waiting on identical content at the end of the run: " + task.entry->path());
            ++summary_.cancelled;
            summary_.cancelled_paths.push_back(task.entry->path());
            settleOneLocked();
        }
    }
    waiting_.clear();

    summary_.state = state;
    summary_.elapsed = elapsed;
    if (!summary_.isBalanced())
    {
        Logger::warn("Run summary does not balance: scanned " + std::to_string(summary_.scanned) + ", accounted " +
                     std::to_string(summary_.uploaded + summary_.skipped_duplicate + summary_.failed +
                                    summary_.cancelled));
    }
    return summary_;
}
