#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include "core/file_utils.hpp"

/**
 * @brief Immutable description of a discovered regular file
 *
 * The content fingerprint is computed lazily on first access and memoized,
 * so files filtered out or skipped before upload are never hashed.
 * Instances are shared through FileEntryPtr and are safe to read from
 * several threads.
 */
class FileEntry
{
public:
    FileEntry(std::string path, std::string relative_path, uint64_t size, int64_t modified_at_ns);

    FileEntry(const FileEntry &) = delete;
    FileEntry &operator=(const FileEntry &) = delete;

    const std::string &path() const { return path_; }
    const std::string &relativePath() const { return relative_path_; }
    uint64_t size() const { return size_; }
    int64_t modifiedAtNs() const { return modified_at_ns_; }
    const std::string &mimeType() const { return mime_type_; }
    const std::string &category() const { return category_; }

    /**
     * @brief Content fingerprint (hex SHA-256 of the whole file), computed on first call
     * @throws FileAccessError if the file cannot be read; a later call retries
     */
    const std::string &fingerprint() const;

    bool hasFingerprint() const;

    std::string toString() const;

private:
    const std::string path_;
    const std::string relative_path_;
    const uint64_t size_;
    const int64_t modified_at_ns_;
    const std::string mime_type_;
    const std::string category_;

    mutable std::once_flag fingerprint_once_;
    mutable std::string fingerprint_;
    mutable std::atomic<bool> fingerprint_ready_{false};
};

using FileEntryPtr = std::shared_ptr<const FileEntry>;
