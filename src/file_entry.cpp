#include "core/file_entry.hpp"
#include <sstream>

FileEntry::FileEntry(std::string path, std::string relative_path, uint64_t size, int64_t modified_at_ns)
    : path_(std::move(path)),
      relative_path_(std::move(relative_path)),
      size_(size),
      modified_at_ns_(modified_at_ns),
      mime_type_(FileUtils::guessMimeType(path_)),
      category_(FileUtils::categoryForMimeType(mime_type_))
{
}

const std::string &FileEntry::fingerprint() const
{
    // call_once leaves the flag unset when the callable throws
    std::call_once(fingerprint_once_, [this]()
                   {
                       fingerprint_ = FileUtils::computeFileHash(path_);
                       fingerprint_ready_.store(true);
                   });
    return fingerprint_;
}

bool FileEntry::hasFingerprint() const
{
    return fingerprint_ready_.load();
}

std::string FileEntry::toString() const
{
    std::stringstream ss;
    ss << relative_path_ << " (" << size_ << " bytes, " << mime_type_ << ", " << category_ << ")";
    return ss.str();
}
