#pragma once

#include "core/dedup_tracker.hpp"
#include "core/file_scanner.hpp"
#include "core/retry_policy.hpp"
#include "core/run_summary.hpp"
#include "core/upload_types.hpp"
#include "core/work_queue.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Single consumer of upload results; owns the RunSummary
 *
 * Workers call submit() synchronously; calls are serialized by an internal
 * mutex. The aggregator counts tasks that are still outstanding (queued,
 * uploading, backing off or waiting on another task's claim) and closes the
 * work queue once the scanner has finished and nothing is outstanding.
 *
 * A task whose content is claimed by another task still in flight waits for
 * that claim to settle: it becomes a duplicate when the upload succeeds and
 * is queued again, to take the claim itself, when the upload fails.
 */
class ResultAggregator
{
public:
    using ScheduleRetry = std::function<void(UploadTask, std::chrono::milliseconds)>;
    using PersistCallback = std::function<void(const DedupRecord &)>;
    using UploadedCallback = std::function<void(const UploadedFile &)>;

    ResultAggregator(DedupTracker &tracker, WorkQueue &queue, RetryPolicy policy, ScheduleRetry schedule_retry,
                     PersistCallback persist = nullptr);

    ResultAggregator(const ResultAggregator &) = delete;
    ResultAggregator &operator=(const ResultAggregator &) = delete;

    // Scanner side
    void recordScanned(const FileEntry &entry);
    void recordScanError(const ScanError &error);
    void recordUnchanged(const FileEntry &entry);
    void admit(const UploadTask &task);
    void producerFinished();

    // Called from submit() before a success is counted; an exception from it
    // escapes submit() and aborts the run
    void setUploadedCallback(UploadedCallback callback) { on_uploaded_ = std::move(callback); }

    // Worker side
    void submit(UploadResult result);

    // A task that will never be attempted again; releases any claim it holds
    void recordCancelled(const UploadTask &task);

    // Structural failure: the task is reported failed and the run aborted
    void recordAborted(const UploadTask &task, const std::string &reason);

    // Stop retrying; later transient failures become terminal
    void cancel();

    // Wake waitUntilSettled without waiting for outstanding tasks
    void interrupt();

    void waitUntilSettled();

    bool isCancelled() const;
    bool isAborted() const;
    size_t outstanding() const;
    size_t waiting() const;

    RunSummary finalize(RunState state, std::chrono::milliseconds elapsed);

private:
    void settleOneLocked();
    void recordFailureLocked(const UploadTask &task, const UploadError &error, std::vector<UploadTask> &requeue);
    void recordCancelledLocked(const UploadTask &task, std::vector<UploadTask> &requeue);

    // Settle the tasks parked on a fingerprint after its claim ended
    void resolveWaitersLocked(const std::string &fingerprint, std::vector<UploadTask> &requeue);
    void requeue(std::vector<UploadTask> tasks);

    DedupTracker &tracker_;
    WorkQueue &queue_;
    const RetryPolicy policy_;
    ScheduleRetry schedule_retry_;
    PersistCallback persist_;
    UploadedCallback on_uploaded_;

    mutable std::mutex mutex_;
    std::condition_variable settled_cv_;
    RunSummary summary_;
    std::map<std::string, std::vector<UploadTask>> waiting_;
    size_t outstanding_ = 0;
    bool producer_done_ = false;
    bool cancelled_ = false;
    bool aborted_ = false;
    bool interrupted_ = false;
};
