#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <vector>
#include <fnmatch.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace
{
    int64_t toNanoseconds(const struct timespec &ts)
    {
        return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + static_cast<int64_t>(ts.tv_nsec);
    }
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

std::string FileUtils::toHex(const unsigned char *digest, size_t length)
{
    std::stringstream ss;
    for (size_t i = 0; i < length; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return ss.str();
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 64 * 1024;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        throw FileAccessError("SHA256 initialisation failed for " + file_path);

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        throw FileAccessError("Cannot open file for hashing: " + file_path);

    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), static_cast<size_t>(bytes_read)) != 1)
                throw FileAccessError("SHA256 update failed for " + file_path);
        }
    }
    if (file.bad())
        throw FileAccessError("I/O error while hashing " + file_path);

    if (SHA256_Final(hash, &sha256) != 1)
        throw FileAccessError("SHA256 finalisation failed for " + file_path);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

bool FileUtils::matchesAnyPattern(const std::string &relative_path, const std::string &name,
                                  const std::vector<std::string> &patterns)
{
    for (const auto &pattern : patterns)
    {
        if (::fnmatch(pattern.c_str(), relative_path.c_str(), FNM_PATHNAME) == 0)
            return true;
        if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0)
            return true;
    }
    return false;
}

std::string FileUtils::guessMimeType(const std::string &file_path)
{
    static const std::map<std::string, std::string> mime_by_extension = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"}, {"gif", "image/gif"},
        {"bmp", "image/bmp"}, {"tif", "image/tiff"}, {"tiff", "image/tiff"}, {"webp", "image/webp"},
        {"heic", "image/heic"}, {"svg", "image/svg+xml"},
        {"mp4", "video/mp4"}, {"mov", "video/quicktime"}, {"avi", "video/x-msvideo"},
        {"mkv", "video/x-matroska"}, {"webm", "video/webm"}, {"wmv", "video/x-ms-wmv"}, {"flv", "video/x-flv"},
        {"mp3", "audio/mpeg"}, {"wav", "audio/wav"}, {"flac", "audio/flac"}, {"ogg", "audio/ogg"},
        {"m4a", "audio/mp4"}, {"aac", "audio/aac"},
        {"txt", "text/plain"}, {"json", "application/json"}, {"pdf", "application/pdf"},
        {"zip", "application/zip"}, {"gz", "application/gzip"}};

    std::string ext = fs::path(file_path).extension().string();
    if (ext.empty())
        return "application/octet-stream";
    ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });

    auto it = mime_by_extension.find(ext);
    return it != mime_by_extension.end() ? it->second : "application/octet-stream";
}

std::string FileUtils::categoryForMimeType(const std::string &mime_type)
{
    if (mime_type.rfind("image/", 0) == 0)
        return "image";
    if (mime_type.rfind("video/", 0) == 0)
        return "video";
    if (mime_type.rfind("audio/", 0) == 0)
        return "audio";
    return "other";
}

std::string FileMetadata::toString() const
{
    std::stringstream ss;
    ss << "FileMetadata{"
       << "path='" << file_path << "', "
       << "mod_time_ns=" << modified_at_ns << ", "
       << "size=" << file_size << ", "
       << "inode=" << inode << ", "
       << "device=" << device_id << "}";
    return ss.str();
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (::lstat(file_path.c_str(), &st) != 0)
    {
        return std::nullopt;
    }
    if (!S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
#ifdef __APPLE__
    metadata.modified_at_ns = toNanoseconds(st.st_mtimespec);
#else
    metadata.modified_at_ns = toNanoseconds(st.st_mtim);
#endif
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    metadata.inode = static_cast<uint64_t>(st.st_ino);
    metadata.device_id = static_cast<uint64_t>(st.st_dev);
    return metadata;
}

bool FileUtils::hasFileChanged(const std::string &file_path, uint64_t size, int64_t modified_at_ns)
{
    auto current = getFileMetadata(file_path);
    if (!current)
    {
        // File doesn't exist or can't be accessed
        return true;
    }
    return current->file_size != size || current->modified_at_ns != modified_at_ns;
}
