#pragma once

#include <tbb/concurrent_hash_map.h>
#include <cstdint>
#include <string>
#include <vector>

enum class DedupStatus
{
    InFlight,
    Succeeded,
    Failed
};

const char *dedupStatusName(DedupStatus status);

struct DedupRecord
{
    std::string fingerprint;
    DedupStatus status = DedupStatus::InFlight;
    std::string remote_id;
    std::string file_path;
    uint64_t file_size = 0;
    int64_t modified_at_ns = 0;
};

struct CommitOutcome
{
    bool succeeded = false;
    std::string remote_id;
    std::string file_path;
    uint64_t file_size = 0;
    int64_t modified_at_ns = 0;
};

/**
 * @brief Run-wide record of which fingerprints have been handled
 *
 * Claims are per-key critical sections held through concurrent_hash_map
 * accessors, so two workers racing on the same content serialize only with
 * each other. A claimed fingerprint stays InFlight until commit() or
 * release().
 */
class DedupTracker
{
public:
    DedupTracker() = default;

    DedupTracker(const DedupTracker &) = delete;
    DedupTracker &operator=(const DedupTracker &) = delete;

    // False when the fingerprint already has a Succeeded record
    bool shouldUpload(const std::string &fingerprint) const;

    /**
     * @brief Reserve a fingerprint for one in-flight attempt
     * @return true when the caller owns the claim; false if another task holds
     *         it or the content was already uploaded
     */
    bool claim(const std::string &fingerprint);

    void commit(const std::string &fingerprint, const CommitOutcome &outcome);

    // Drop a claim without recording a terminal status
    void release(const std::string &fingerprint);

    // Path/size/mtime check against the records of a previous run
    bool isUnchanged(const std::string &file_path, uint64_t file_size, int64_t modified_at_ns) const;

    void preload(const std::vector<DedupRecord> &records);
    std::vector<DedupRecord> snapshot() const;

    DedupStatus statusOf(const std::string &fingerprint, bool *found = nullptr) const;
    size_t size() const { return by_fingerprint_.size(); }

private:
    using FingerprintMap = tbb::concurrent_hash_map<std::string, DedupRecord>;
    using PathMap = tbb::concurrent_hash_map<std::string, DedupRecord>;

    FingerprintMap by_fingerprint_;
    PathMap by_path_; // Succeeded records only
};
