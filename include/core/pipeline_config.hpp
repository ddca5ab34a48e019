#pragma once

#include "core/file_scanner.hpp"
#include "core/retry_policy.hpp"
#include "core/work_queue.hpp"
#include <string>

/**
 * @brief Everything one pipeline run needs, resolved from config and CLI
 */
struct PipelineConfig
{
    std::string root;
    ScanOptions scan;
    size_t concurrency = 0; // 0: UploaderPool::defaultConcurrency()
    size_t queue_capacity = WorkQueue::DEFAULT_CAPACITY;
    RetryPolicy retry;
    bool dry_run = false;
    bool skip_unchanged = true; // path/size/mtime shortcut against the persisted index
};
