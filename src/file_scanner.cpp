#include "core/file_scanner.hpp"
#include "logging/logger.hpp"

namespace fs = std::filesystem;

const char *ScanError::kindName(ScanErrorKind kind)
{
    switch (kind)
    {
    case ScanErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ScanErrorKind::BrokenSymlink:
        return "BrokenSymlink";
    case ScanErrorKind::IoError:
        return "IoError";
    }
    return "Unknown";
}

ScanError ScanError::fromErrorCode(const std::string &path, const std::error_code &ec)
{
    ScanErrorKind kind = ScanErrorKind::IoError;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        kind = ScanErrorKind::PermissionDenied;
    return ScanError{path, kind, ec.message()};
}

ScanCursor::ScanCursor(fs::path root, ScanOptions options)
    : root_(std::move(root)), options_(std::move(options))
{
    std::error_code ec;
    if (!openDirectory(root_, 0, ec))
    {
        pending_error_ = ScanError::fromErrorCode(root_.string(), ec);
    }
}

bool ScanCursor::openDirectory(const fs::path &dir, int depth, std::error_code &ec)
{
    fs::directory_iterator it(dir, fs::directory_options::none, ec);
    if (ec)
        return false;
    stack_.push_back(Frame{dir, std::move(it), depth});
    ++stats_.directories_visited;
    return true;
}

ScanEvent ScanCursor::makeError(ScanError error)
{
    ++stats_.errors;
    Logger::warn("Scan error (" + std::string(ScanError::kindName(error.kind)) + ") at " + error.path + ": " + error.message);
    ScanEvent event;
    event.error = std::move(error);
    return event;
}

std::optional<ScanEvent> ScanCursor::next()
{
    if (pending_error_)
    {
        ScanError error = std::move(*pending_error_);
        pending_error_.reset();
        return makeError(std::move(error));
    }

    while (!stack_.empty())
    {
        Frame &top = stack_.back();
        if (top.it == fs::directory_iterator())
        {
            stack_.pop_back();
            continue;
        }

        const fs::directory_entry entry = *top.it;
        const int depth = top.depth;
        const fs::path dir = top.dir;

        std::error_code ec;
        top.it.increment(ec);
        if (ec)
        {
            // The rest of this directory is unreadable; report it and move on
            stack_.pop_back();
            auto result = visit(entry, depth);
            if (result)
            {
                // Deliver the already-read entry first, the directory error comes next
                pending_error_ = ScanError::fromErrorCode(dir.string(), ec);
                return result;
            }
            return makeError(ScanError::fromErrorCode(dir.string(), ec));
        }

        auto result = visit(entry, depth);
        if (result)
            return result;
    }
    return std::nullopt;
}

std::optional<ScanEvent> ScanCursor::visit(const fs::directory_entry &entry, int depth)
{
    const fs::path &path = entry.path();
    const std::string name = path.filename().string();
    const std::string relative = path.lexically_relative(root_).generic_string();

    if (options_.skip_hidden && !name.empty() && name[0] == '.')
    {
        ++stats_.filtered;
        return std::nullopt;
    }

    std::error_code ec;
    fs::file_status link_status = entry.symlink_status(ec);
    if (ec)
        return makeError(ScanError::fromErrorCode(path.string(), ec));

    if (fs::is_symlink(link_status))
    {
        std::error_code target_ec;
        if (!fs::exists(path, target_ec))
        {
            return makeError(ScanError{path.string(), ScanErrorKind::BrokenSymlink,
                                       target_ec ? target_ec.message() : "link target does not exist"});
        }
        ++stats_.symlinks_skipped;
        Logger::debug("Skipping symbolic link: " + path.string());
        return std::nullopt;
    }

    if (fs::is_directory(link_status))
    {
        if (FileUtils::matchesAnyPattern(relative, name, options_.exclude_patterns))
        {
            ++stats_.filtered;
            Logger::debug("Excluded directory: " + relative);
            return std::nullopt;
        }
        if (options_.max_depth >= 0 && depth + 1 > options_.max_depth)
        {
            return std::nullopt;
        }
        std::error_code open_ec;
        if (!openDirectory(path, depth + 1, open_ec))
            return makeError(ScanError::fromErrorCode(path.string(), open_ec));
        return std::nullopt;
    }

    if (!fs::is_regular_file(link_status))
    {
        // sockets, fifos, devices
        ++stats_.filtered;
        return std::nullopt;
    }

    if (FileUtils::matchesAnyPattern(relative, name, options_.exclude_patterns))
    {
        ++stats_.filtered;
        return std::nullopt;
    }
    if (!options_.include_patterns.empty() &&
        !FileUtils::matchesAnyPattern(relative, name, options_.include_patterns))
    {
        ++stats_.filtered;
        return std::nullopt;
    }

    auto metadata = FileUtils::getFileMetadata(path.string());
    if (!metadata)
    {
        return makeError(ScanError{path.string(), ScanErrorKind::IoError, "file vanished or is not accessible"});
    }
    if (metadata->file_size < options_.min_file_size)
    {
        ++stats_.filtered;
        return std::nullopt;
    }

    ++stats_.files_emitted;
    ScanEvent event;
    event.entry = std::make_shared<const FileEntry>(fs::absolute(path).lexically_normal().string(), relative,
                                                    metadata->file_size, metadata->modified_at_ns);
    return event;
}

FileScanner::FileScanner(const std::string &root, ScanOptions options)
    : root_(root), options_(std::move(options))
{
}

ScanCursor FileScanner::begin() const
{
    Logger::debug("Starting traversal of " + root_);
    return ScanCursor(fs::path(root_), options_);
}

size_t FileScanner::forEach(const std::function<void(const FileEntryPtr &)> &on_entry,
                            const std::function<void(const ScanError &)> &on_error,
                            const std::function<bool()> &should_stop) const
{
    size_t delivered = 0;
    ScanCursor cursor = begin();
    while (!should_stop || !should_stop())
    {
        auto event = cursor.next();
        if (!event)
            break;
        if (event->isError())
        {
            if (on_error)
                on_error(*event->error);
            continue;
        }
        on_entry(event->entry);
        ++delivered;
    }

    const ScanStats &stats = cursor.stats();
    Logger::info("Directory scan finished. Files: " + std::to_string(stats.files_emitted) +
                 ", directories: " + std::to_string(stats.directories_visited) +
                 ", filtered: " + std::to_string(stats.filtered) +
                 ", symlinks skipped: " + std::to_string(stats.symlinks_skipped) +
                 ", errors: " + std::to_string(stats.errors));
    return delivered;
}
