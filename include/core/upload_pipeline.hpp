#pragma once

#include "core/pipeline_config.hpp"
#include "core/run_summary.hpp"
#include "core/uploader.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <string>

class DedupStore;
class ResultAggregator;
class WorkQueue;

/**
 * @brief Scan a tree and upload every new file through one Uploader
 *
 * run() blocks the calling thread, which also acts as the scanner. Uploads
 * happen on the pool threads and retries on the scheduler thread. cancel()
 * may be called from any thread, including a signal watcher.
 */
class UploadPipeline
{
public:
    using ProgressCallback = std::function<void(const UploadedFile &)>;

    // uploader may be null only for dry runs
    UploadPipeline(PipelineConfig config, Uploader *uploader, DedupStore *store = nullptr);

    UploadPipeline(const UploadPipeline &) = delete;
    UploadPipeline &operator=(const UploadPipeline &) = delete;

    /**
     * @brief Execute one run to completion
     * @throws std::invalid_argument if the root is not a directory, or no
     *         uploader was given for a real run
     */
    RunSummary run();

    // Cooperative: stops scanning, rejects new work, lets in-flight uploads report
    void cancel();

    bool isCancelled() const { return cancel_requested_.load(); }

    // Runs on an upload worker for each file before it is counted as uploaded.
    // An exception thrown here is a pipeline error and aborts the run.
    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

    const PipelineConfig &config() const { return config_; }

private:
    RunSummary runDry(const std::chrono::steady_clock::time_point &started);

    PipelineConfig config_;
    Uploader *uploader_;
    DedupStore *store_;
    ProgressCallback progress_;

    std::atomic<bool> cancel_requested_{false};

    // Objects of the run in progress, for cancel()
    std::mutex run_mutex_;
    ResultAggregator *active_aggregator_ = nullptr;
    WorkQueue *active_queue_ = nullptr;
};
