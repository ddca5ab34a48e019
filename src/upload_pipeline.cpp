#include "core/upload_pipeline.hpp"
#include "core/dedup_tracker.hpp"
#include "core/file_utils.hpp"
#include "core/result_aggregator.hpp"
#include "core/retry_scheduler.hpp"
#include "core/uploader_pool.hpp"
#include "core/work_queue.hpp"
#include "database/dedup_store.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

UploadPipeline::UploadPipeline(PipelineConfig config, Uploader *uploader, DedupStore *store)
    : config_(std::move(config)), uploader_(uploader), store_(store)
{
}

void UploadPipeline::cancel()
{
    if (cancel_requested_.exchange(true))
        return;
    Logger::warn("Cancellation requested, finishing in-flight uploads");

    std::lock_guard<std::mutex> lock(run_mutex_);
    if (active_aggregator_)
        active_aggregator_->cancel();
    if (active_queue_)
        active_queue_->cancel();
}

RunSummary UploadPipeline::runDry(const std::chrono::steady_clock::time_point &started)
{
    RunSummary summary;
    summary.root = config_.root;
    summary.started_at = std::chrono::system_clock::now();

    FileScanner scanner(config_.root, config_.scan);
    ScanCursor cursor = scanner.begin();
    while (!cancel_requested_.load())
    {
        auto event = cursor.next();
        if (!event)
            break;
        if (event->isError())
        {
            const ScanError &error = *event->error;
            ++summary.scan_errors;
            summary.scan_error_entries.push_back(ScanErrorEntry{error.path, ScanError::kindName(error.kind), error.message});
            continue;
        }
        Logger::info("[dry-run] " + event->entry->toString());
        ++summary.scanned;
        ++summary.skipped_duplicate;
    }

    summary.state = cancel_requested_.load() ? RunState::Cancelled : RunState::Completed;
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    Logger::info("Dry run listed " + std::to_string(summary.scanned) + " files");
    return summary;
}

RunSummary UploadPipeline::run()
{
    if (!FileUtils::isValidDirectory(config_.root))
        throw std::invalid_argument("Scan root is not a directory: " + config_.root);

    const auto started = std::chrono::steady_clock::now();
    const auto started_wall = std::chrono::system_clock::now();
    Logger::info("Starting run for " + config_.root + (config_.dry_run ? " (dry run)" : ""));

    if (config_.dry_run)
        return runDry(started);
    if (!uploader_)
        throw std::invalid_argument("An uploader is required unless running dry");

    DedupTracker tracker;
    if (store_)
        tracker.preload(store_->loadSucceeded());

    WorkQueue queue(config_.queue_capacity);

    ResultAggregator::PersistCallback persist = nullptr;
    if (store_)
    {
        persist = [this](const DedupRecord &record)
        { store_->recordUpload(record); };
    }

    RetryScheduler *scheduler = nullptr;
    ResultAggregator aggregator(
        tracker, queue, config_.retry,
        [&scheduler](UploadTask task, std::chrono::milliseconds delay)
        { scheduler->schedule(std::move(task), delay); },
        persist);
    RetryScheduler retries(queue, [&aggregator](UploadTask &&task)
                           { aggregator.recordCancelled(task); });
    scheduler = &retries;
    if (progress_)
        aggregator.setUploadedCallback(progress_);

    UploaderPool pool(config_.concurrency, queue, tracker, aggregator, *uploader_,
                      [&queue](const std::string &reason)
                      {
                          Logger::error("Aborting run: " + reason);
                          queue.cancel();
                      });

    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        active_aggregator_ = &aggregator;
        active_queue_ = &queue;
    }
    if (cancel_requested_.load())
    {
        aggregator.cancel();
        queue.cancel();
    }

    retries.start();
    pool.start();

    // Producer: the scanner runs on this thread
    std::string scan_abort_reason;
    FileScanner scanner(config_.root, config_.scan);
    ScanCursor cursor = scanner.begin();
    while (!cancel_requested_.load() && !aggregator.isAborted())
    {
        auto event = cursor.next();
        if (!event)
            break;
        if (event->isError())
        {
            aggregator.recordScanError(*event->error);
            continue;
        }

        const FileEntryPtr &entry = event->entry;
        aggregator.recordScanned(*entry);
        if (config_.skip_unchanged && tracker.isUnchanged(entry->path(), entry->size(), entry->modifiedAtNs()))
        {
            aggregator.recordUnchanged(*entry);
            continue;
        }

        UploadTask task(entry);
        aggregator.admit(task);
        QueueOpStatus status = queue.enqueue(task);
        if (status == QueueOpStatus::Ok)
            continue;

        aggregator.recordCancelled(task);
        if (status == QueueOpStatus::Closed)
            scan_abort_reason = "work queue closed while the scanner was still producing";
        break;
    }
    const ScanStats scan_stats = cursor.stats();
    Logger::info("Scanner finished: " + std::to_string(scan_stats.files_emitted) + " files, " +
                 std::to_string(scan_stats.directories_visited) + " directories, " +
                 std::to_string(scan_stats.errors) + " errors");

    aggregator.producerFinished();
    if (!scan_abort_reason.empty())
        aggregator.interrupt();
    aggregator.waitUntilSettled();

    const bool cancelled = cancel_requested_.load() || aggregator.isCancelled();
    const bool aborted = !scan_abort_reason.empty() || aggregator.isAborted();
    if (cancelled || aborted)
    {
        aggregator.cancel();
        queue.cancel();
    }

    pool.join();
    for (auto &task : retries.stop())
        aggregator.recordCancelled(task);
    for (auto &task : queue.drain())
        aggregator.recordCancelled(task);

    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        active_aggregator_ = nullptr;
        active_queue_ = nullptr;
    }

    if (store_)
    {
        store_->waitForWrites();
        if (store_->failedWrites() > 0)
            Logger::warn(std::to_string(store_->failedWrites()) + " upload state writes failed; the next run may re-upload those files");
    }

    RunState state = RunState::Completed;
    if (aborted)
        state = RunState::Aborted;
    else if (cancelled)
        state = RunState::Cancelled;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    RunSummary summary = aggregator.finalize(state, elapsed);
    summary.root = config_.root;
    summary.started_at = started_wall;
    if (aborted && summary.abort_reason.empty())
        summary.abort_reason = scan_abort_reason;

    Logger::info("Run " + std::string(runStateName(state)) + ": " + std::to_string(summary.uploaded) + " uploaded, " +
                 std::to_string(summary.skipped_duplicate) + " skipped, " + std::to_string(summary.failed) +
                 " failed, " + std::to_string(summary.cancelled) + " cancelled");
    return summary;
}
