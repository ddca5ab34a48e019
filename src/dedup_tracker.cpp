#include "core/dedup_tracker.hpp"
#include "logging/logger.hpp"

const char *dedupStatusName(DedupStatus status)
{
    switch (status)
    {
    case DedupStatus::InFlight:
        return "in_flight";
    case DedupStatus::Succeeded:
        return "succeeded";
    case DedupStatus::Failed:
        return "failed";
    }
    return "unknown";
}

bool DedupTracker::shouldUpload(const std::string &fingerprint) const
{
    FingerprintMap::const_accessor accessor;
    if (!by_fingerprint_.find(accessor, fingerprint))
        return true;
    return accessor->second.status != DedupStatus::Succeeded;
}

bool DedupTracker::claim(const std::string &fingerprint)
{
    FingerprintMap::accessor accessor;
    if (by_fingerprint_.insert(accessor, fingerprint))
    {
        accessor->second.fingerprint = fingerprint;
        accessor->second.status = DedupStatus::InFlight;
        return true;
    }

    // A previously failed fingerprint may be tried again by another file
    if (accessor->second.status == DedupStatus::Failed)
    {
        accessor->second.status = DedupStatus::InFlight;
        return true;
    }
    return false;
}

void DedupTracker::commit(const std::string &fingerprint, const CommitOutcome &outcome)
{
    DedupRecord record;
    {
        FingerprintMap::accessor accessor;
        by_fingerprint_.insert(accessor, fingerprint);
        DedupRecord &entry = accessor->second;
        entry.fingerprint = fingerprint;
        entry.status = outcome.succeeded ? DedupStatus::Succeeded : DedupStatus::Failed;
        entry.remote_id = outcome.remote_id;
        entry.file_path = outcome.file_path;
        entry.file_size = outcome.file_size;
        entry.modified_at_ns = outcome.modified_at_ns;
        record = entry;
    }

    if (outcome.succeeded && !record.file_path.empty())
    {
        PathMap::accessor path_accessor;
        by_path_.insert(path_accessor, record.file_path);
        path_accessor->second = record;
    }
    Logger::trace("Dedup commit " + fingerprint + " -> " + dedupStatusName(record.status));
}

void DedupTracker::release(const std::string &fingerprint)
{
    FingerprintMap::accessor accessor;
    if (!by_fingerprint_.find(accessor, fingerprint))
        return;
    if (accessor->second.status == DedupStatus::InFlight)
        by_fingerprint_.erase(accessor);
}

bool DedupTracker::isUnchanged(const std::string &file_path, uint64_t file_size, int64_t modified_at_ns) const
{
    PathMap::const_accessor accessor;
    if (!by_path_.find(accessor, file_path))
        return false;
    const DedupRecord &record = accessor->second;
    return record.status == DedupStatus::Succeeded && record.file_size == file_size &&
           record.modified_at_ns == modified_at_ns;
}

void DedupTracker::preload(const std::vector<DedupRecord> &records)
{
    size_t loaded = 0;
    for (const auto &record : records)
    {
        if (record.status != DedupStatus::Succeeded)
            continue;
        {
            FingerprintMap::accessor accessor;
            by_fingerprint_.insert(accessor, record.fingerprint);
            accessor->second = record;
        }
        if (!record.file_path.empty())
        {
            PathMap::accessor accessor;
            by_path_.insert(accessor, record.file_path);
            accessor->second = record;
        }
        ++loaded;
    }
    Logger::info("Dedup tracker preloaded with " + std::to_string(loaded) + " uploaded fingerprints");
}

std::vector<DedupRecord> DedupTracker::snapshot() const
{
    // Not safe against concurrent writers; called once the pool has stopped
    std::vector<DedupRecord> records;
    records.reserve(by_fingerprint_.size());
    for (const auto &item : by_fingerprint_)
        records.push_back(item.second);
    return records;
}

DedupStatus DedupTracker::statusOf(const std::string &fingerprint, bool *found) const
{
    FingerprintMap::const_accessor accessor;
    bool present = by_fingerprint_.find(accessor, fingerprint);
    if (found)
        *found = present;
    return present ? accessor->second.status : DedupStatus::Failed;
}
