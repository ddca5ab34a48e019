#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

enum class RunState
{
    Running,
    Completed,
    Cancelled,
    Aborted
};

const char *runStateName(RunState state);

struct FailedFile
{
    std::string path;
    std::string kind; // Transient | Permanent
    std::string message;
    int attempts = 0;
};

struct UploadedFile
{
    std::string path;
    std::string relative_path;
    std::string fingerprint;
    std::string remote_id;
    uint64_t size = 0;
    std::string mime_type;
    std::string category;
};

struct ScanErrorEntry
{
    std::string path;
    std::string kind;
    std::string message;
};

/**
 * @brief Final report of a pipeline run
 *
 * Once finalized, every scanned file is counted exactly once:
 * scanned == uploaded + skipped_duplicate + failed + cancelled.
 */
struct RunSummary
{
    RunState state = RunState::Running;
    std::string root;
    std::string abort_reason;

    uint64_t scanned = 0;
    uint64_t uploaded = 0;
    uint64_t skipped_duplicate = 0;
    uint64_t failed = 0;
    uint64_t cancelled = 0;
    uint64_t scan_errors = 0;
    uint64_t total_bytes = 0;

    std::vector<FailedFile> failed_files;
    std::vector<UploadedFile> uploaded_files;
    std::vector<ScanErrorEntry> scan_error_entries;
    std::vector<std::string> cancelled_paths;

    std::chrono::system_clock::time_point started_at;
    std::chrono::milliseconds elapsed{0};

    /**
     * @brief Process exit code for this run
     * @return 0 success, 1 some files failed, 2 cancelled, 3 aborted
     */
    int exitCode() const;

    bool isBalanced() const { return scanned == uploaded + skipped_duplicate + failed + cancelled; }

    nlohmann::json toJson() const;
    std::string toString() const;
};
