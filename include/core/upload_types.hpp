#pragma once

#include "core/file_entry.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

enum class TaskState
{
    Pending,
    InFlight,
    Succeeded,
    Failed
};

inline const char *taskStateName(TaskState state)
{
    switch (state)
    {
    case TaskState::Pending:
        return "Pending";
    case TaskState::InFlight:
        return "InFlight";
    case TaskState::Succeeded:
        return "Succeeded";
    case TaskState::Failed:
        return "Failed";
    }
    return "Unknown";
}

enum class UploadErrorKind
{
    Transient, // worth retrying: timeouts, 5xx, throttling
    Permanent  // retrying cannot help
};

struct UploadError
{
    UploadErrorKind kind = UploadErrorKind::Permanent;
    std::string message;

    bool retryable() const { return kind == UploadErrorKind::Transient; }
    const char *kindName() const { return kind == UploadErrorKind::Transient ? "Transient" : "Permanent"; }

    static UploadError transient(std::string message) { return UploadError{UploadErrorKind::Transient, std::move(message)}; }
    static UploadError permanent(std::string message) { return UploadError{UploadErrorKind::Permanent, std::move(message)}; }
};

struct UploadOutcome
{
    uint64_t bytes_sent = 0;
    std::string remote_id;
};

/**
 * @brief Result of a single Uploader::send call
 */
struct SendResult
{
    bool success = false;
    UploadOutcome outcome;
    UploadError error;

    static SendResult ok(uint64_t bytes_sent, std::string remote_id)
    {
        SendResult result;
        result.success = true;
        result.outcome = UploadOutcome{bytes_sent, std::move(remote_id)};
        return result;
    }

    static SendResult failure(UploadError error)
    {
        SendResult result;
        result.success = false;
        result.error = std::move(error);
        return result;
    }
};

/**
 * @brief Unit of work flowing through the queue
 *
 * State only moves forward: Pending -> InFlight -> Succeeded | Failed, with
 * InFlight -> Pending allowed when a transient failure is scheduled for retry.
 */
struct UploadTask
{
    FileEntryPtr entry;
    int attempt = 0;
    TaskState state = TaskState::Pending;
    bool claim_held = false; // the dedup claim stays with the task across retries
    std::string fingerprint;

    explicit UploadTask(FileEntryPtr file_entry = nullptr) : entry(std::move(file_entry)) {}

    void transitionTo(TaskState next)
    {
        bool allowed = false;
        switch (state)
        {
        case TaskState::Pending:
            allowed = next == TaskState::InFlight || next == TaskState::Failed;
            break;
        case TaskState::InFlight:
            allowed = next == TaskState::Succeeded || next == TaskState::Failed || next == TaskState::Pending;
            break;
        case TaskState::Succeeded:
        case TaskState::Failed:
            allowed = false;
            break;
        }
        if (!allowed)
        {
            throw std::logic_error(std::string("Invalid task transition ") + taskStateName(state) + " -> " +
                                   taskStateName(next));
        }
        state = next;
    }
};

enum class UploadStatus
{
    Success,
    Failure,
    Duplicate
};

struct UploadResult
{
    UploadTask task;
    UploadStatus status = UploadStatus::Failure;
    UploadOutcome outcome;
    UploadError error;
};
