#pragma once

#include "core/file_entry.hpp"
#include "core/file_utils.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

/**
 * @brief Traversal rules applied by the scanner
 */
struct ScanOptions
{
    std::vector<std::string> include_patterns; // empty: every file
    std::vector<std::string> exclude_patterns; // prune directories and files
    int max_depth = -1;                         // negative: unlimited, 0: root files only
    bool skip_hidden = true;                    // skip names starting with '.'
    uint64_t min_file_size = 0;
};

enum class ScanErrorKind
{
    PermissionDenied,
    BrokenSymlink,
    IoError
};

/**
 * @brief Non-fatal problem with a single entry met during traversal
 */
struct ScanError
{
    std::string path;
    ScanErrorKind kind;
    std::string message;

    static const char *kindName(ScanErrorKind kind);
    static ScanError fromErrorCode(const std::string &path, const std::error_code &ec);
};

/**
 * @brief One step of a traversal: either a file or a scan error
 */
struct ScanEvent
{
    FileEntryPtr entry;
    std::optional<ScanError> error;

    bool isError() const { return error.has_value(); }
};

/**
 * @brief Traversal statistics kept by a cursor
 */
struct ScanStats
{
    size_t directories_visited = 0;
    size_t files_emitted = 0;
    size_t filtered = 0;
    size_t symlinks_skipped = 0;
    size_t errors = 0;
};

/**
 * @brief Lazy depth-first traversal over a directory tree
 *
 * Each call to next() advances the walk just far enough to produce the next
 * file or error. Symbolic links are never followed. A cursor cannot be
 * resumed from the middle; ask the FileScanner for a new one to restart.
 */
class ScanCursor
{
public:
    ScanCursor(std::filesystem::path root, ScanOptions options);

    ScanCursor(ScanCursor &&) = default;
    ScanCursor &operator=(ScanCursor &&) = default;

    // Next file or error; nullopt when the traversal is complete
    std::optional<ScanEvent> next();

    const ScanStats &stats() const { return stats_; }

private:
    struct Frame
    {
        std::filesystem::path dir;
        std::filesystem::directory_iterator it;
        int depth;
    };

    bool openDirectory(const std::filesystem::path &dir, int depth, std::error_code &ec);
    std::optional<ScanEvent> visit(const std::filesystem::directory_entry &entry, int depth);
    ScanEvent makeError(ScanError error);

    std::filesystem::path root_;
    ScanOptions options_;
    std::vector<Frame> stack_;
    std::optional<ScanError> pending_error_;
    ScanStats stats_;
};

class FileScanner
{
public:
    FileScanner(const std::string &root, ScanOptions options = {});
    ~FileScanner() = default;

    // Start a fresh traversal from the root
    ScanCursor begin() const;

    /**
     * @brief Walk the whole tree, calling the handlers for each event
     * @param should_stop Checked before every step; returning true ends the walk
     * @return Number of files delivered to on_entry
     */
    size_t forEach(const std::function<void(const FileEntryPtr &)> &on_entry,
                   const std::function<void(const ScanError &)> &on_error = nullptr,
                   const std::function<bool()> &should_stop = nullptr) const;

    const std::string &root() const { return root_; }
    const ScanOptions &options() const { return options_; }

private:
    std::string root_;
    ScanOptions options_;
};
