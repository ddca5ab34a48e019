#pragma once

#include "core/dedup_tracker.hpp"
#include "database/database_access_queue.hpp"
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief SQLite-backed dedup index that survives between runs
 *
 * Every SQLite call runs on the DatabaseAccessQueue thread. recordUpload()
 * returns immediately; call waitForWrites() before reading back or closing.
 */
class DedupStore
{
public:
    /**
     * @throws std::runtime_error if the database cannot be opened or the
     *         schema cannot be created
     */
    explicit DedupStore(const std::string &db_path);
    ~DedupStore();

    DedupStore(const DedupStore &) = delete;
    DedupStore &operator=(const DedupStore &) = delete;

    std::vector<DedupRecord> loadSucceeded();

    // Asynchronous upsert; returns the write operation id
    size_t recordUpload(const DedupRecord &record);

    DBOpResult clear();
    size_t count();

    void waitForWrites();
    WriteOperationResult getOperationResult(size_t operation_id) const;
    size_t failedWrites() const;

    const std::string &path() const { return db_path_; }

private:
    DBOpResult executeStatement(const std::string &sql);
    bool createTables();

    sqlite3 *db_;
    std::string db_path_;
    std::unique_ptr<DatabaseAccessQueue> access_queue_;
};
