#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Raised when a file cannot be opened or read while fingerprinting
 */
class FileAccessError : public std::runtime_error
{
public:
    explicit FileAccessError(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief File metadata for efficient change detection
 */
struct FileMetadata
{
    std::string file_path;
    int64_t modified_at_ns; // Last modification time, nanoseconds since epoch
    uint64_t file_size;     // File size in bytes
    uint64_t inode;         // Inode number (for hard link detection)
    uint64_t device_id;     // Device ID (for mount point changes)

    // Convert to string for logging/debugging
    std::string toString() const;
};

/**
 * @brief File utilities for efficient file operations
 */
class FileUtils
{
public:
    /**
     * @brief Get file metadata without reading content. Symbolic links are
     * not followed.
     * @param file_path Path to the file
     * @return Optional FileMetadata if the path is an accessible regular file
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * @brief Check if file has changed based on size and modification time
     * @return True if file has changed or vanished, false if unchanged
     */
    static bool hasFileChanged(const std::string &file_path, uint64_t size, int64_t modified_at_ns);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * Computes SHA256 hash of a whole file
     * @param file_path Path to the file
     * @return SHA256 hash as hexadecimal string
     * @throws FileAccessError if the file cannot be read
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * Returns true if either the relative path or the base name matches one
     * of the glob patterns (fnmatch semantics)
     */
    static bool matchesAnyPattern(const std::string &relative_path, const std::string &name,
                                  const std::vector<std::string> &patterns);

    // MIME type from extension, application/octet-stream when unknown
    static std::string guessMimeType(const std::string &file_path);

    // image / video / audio / other
    static std::string categoryForMimeType(const std::string &mime_type);

private:
    static std::string toHex(const unsigned char *digest, size_t length);
};
