#pragma once

#include "core/dedup_tracker.hpp"
#include "core/result_aggregator.hpp"
#include "core/uploader.hpp"
#include "core/work_queue.hpp"
#include <functional>
#include <thread>
#include <vector>

/**
 * @brief Fixed set of worker threads draining the work queue
 *
 * Each worker re-checks the file against its scan metadata, fingerprints it,
 * consults the dedup tracker and hands the file to the Uploader. Every
 * dequeued task produces exactly one call into the aggregator.
 */
class UploaderPool
{
public:
    using FatalCallback = std::function<void(const std::string &)>;

    UploaderPool(size_t concurrency, WorkQueue &queue, DedupTracker &tracker, ResultAggregator &aggregator,
                 Uploader &uploader, FatalCallback on_fatal = nullptr);
    ~UploaderPool();

    UploaderPool(const UploaderPool &) = delete;
    UploaderPool &operator=(const UploaderPool &) = delete;

    void start();

    // Wait for every worker to exit; workers exit when dequeue() returns nullopt
    void join();

    size_t concurrency() const { return concurrency_; }

    // clamp(2 * hardware threads, 4, 16)
    static size_t defaultConcurrency();

private:
    void workerLoop(size_t worker_id);
    UploadResult process(UploadTask task);

    const size_t concurrency_;
    WorkQueue &queue_;
    DedupTracker &tracker_;
    ResultAggregator &aggregator_;
    Uploader &uploader_;
    FatalCallback on_fatal_;

    std::vector<std::thread> workers_;
};
