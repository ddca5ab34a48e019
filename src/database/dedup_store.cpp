#include "database/dedup_store.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <stdexcept>

namespace
{
    const char *const CREATE_UPLOAD_INDEX_SQL = R"(
        CREATE TABLE IF NOT EXISTS upload_index (
            fingerprint TEXT PRIMARY KEY,
            status TEXT NOT NULL,
            remote_id TEXT,
            file_path TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            modified_at_ns INTEGER NOT NULL,
            updated_at DATETIME DEFAULT CURRENT_TIMESTAMP
        )
    )";

    const char *const CREATE_PATH_INDEX_SQL =
        "CREATE INDEX IF NOT EXISTS idx_upload_index_path ON upload_index(file_path)";

    std::string columnText(sqlite3_stmt *stmt, int column)
    {
        const unsigned char *text = sqlite3_column_text(stmt, column);
        return text ? reinterpret_cast<const char *>(text) : std::string();
    }
}

DedupStore::DedupStore(const std::string &db_path)
    : db_(nullptr), db_path_(db_path)
{
    Logger::info("Opening upload state database: " + db_path);

    std::error_code ec;
    auto parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);

    access_queue_ = std::make_unique<DatabaseAccessQueue>(*this);

    auto open_future = access_queue_->enqueueRead([db_path](DedupStore &store)
                                                  {
        int rc = sqlite3_open(db_path.c_str(), &store.db_);
        if (rc != SQLITE_OK)
        {
            Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(store.db_)));
            sqlite3_close(store.db_);
            store.db_ = nullptr;
            return std::any(false);
        }
        rc = sqlite3_exec(store.db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(store.db_)));
        }
        sqlite3_exec(store.db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
        sqlite3_busy_timeout(store.db_, 5000);
        return std::any(true); });

    bool open_success = std::any_cast<bool>(open_future.get());
    if (!open_success)
    {
        access_queue_.reset();
        throw std::runtime_error("Cannot open upload state database: " + db_path);
    }
    if (!createTables())
    {
        waitForWrites();
        auto close_future = access_queue_->enqueueRead([](DedupStore &store)
                                                       {
            sqlite3_close(store.db_);
            store.db_ = nullptr;
            return std::any(true); });
        close_future.wait();
        access_queue_.reset();
        throw std::runtime_error("Cannot create upload_index table in " + db_path);
    }
}

DedupStore::~DedupStore()
{
    if (!access_queue_)
        return;

    waitForWrites();
    auto close_future = access_queue_->enqueueRead([](DedupStore &store)
                                                   {
        if (store.db_)
        {
            sqlite3_close(store.db_);
            store.db_ = nullptr;
            Logger::debug("Upload state database closed");
        }
        return std::any(true); });
    close_future.wait();
    access_queue_->stop();
}

bool DedupStore::createTables()
{
    if (!executeStatement(CREATE_UPLOAD_INDEX_SQL).success)
        return false;
    return executeStatement(CREATE_PATH_INDEX_SQL).success;
}

DBOpResult DedupStore::executeStatement(const std::string &sql)
{
    size_t operation_id = access_queue_->enqueueWrite([sql](DedupStore &store)
                                                      {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");
        char *err_msg = nullptr;
        int rc = sqlite3_exec(store.db_, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK)
        {
            std::string error_msg = "SQL execution failed: " + std::string(err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            return WriteOperationResult::Failure(error_msg);
        }
        return WriteOperationResult(); });

    waitForWrites();
    WriteOperationResult result = access_queue_->getOperationResult(operation_id);
    return DBOpResult(result.success, result.error_message);
}

std::vector<DedupRecord> DedupStore::loadSucceeded()
{
    auto future = access_queue_->enqueueRead([](DedupStore &store)
                                             {
        std::vector<DedupRecord> records;
        if (!store.db_)
            throw std::runtime_error("Database not initialized");

        const std::string select_sql =
            "SELECT fingerprint, remote_id, file_path, file_size, modified_at_ns "
            "FROM upload_index WHERE status = 'succeeded'";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, select_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(store.db_));

        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            DedupRecord record;
            record.fingerprint = columnText(stmt, 0);
            record.status = DedupStatus::Succeeded;
            record.remote_id = columnText(stmt, 1);
            record.file_path = columnText(stmt, 2);
            record.file_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
            record.modified_at_ns = sqlite3_column_int64(stmt, 4);
            records.push_back(std::move(record));
        }
        sqlite3_finalize(stmt);
        return std::any(std::move(records)); });

    auto records = std::any_cast<std::vector<DedupRecord>>(future.get());
    Logger::info("Loaded " + std::to_string(records.size()) + " uploaded fingerprints from " + db_path_);
    return records;
}

size_t DedupStore::recordUpload(const DedupRecord &record)
{
    DedupRecord captured = record;
    return access_queue_->enqueueWrite([captured](DedupStore &store)
                                       {
        if (!store.db_)
            return WriteOperationResult::Failure("Database not initialized");

        const std::string upsert_sql = R"(
            INSERT OR REPLACE INTO upload_index
                (fingerprint, status, remote_id, file_path, file_size, modified_at_ns, updated_at)
            VALUES (?, ?, ?, ?, ?, ?, CURRENT_TIMESTAMP)
        )";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, upsert_sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            return WriteOperationResult::Failure(std::string("Failed to prepare statement: ") +
                                                 sqlite3_errmsg(store.db_));
        }
        sqlite3_bind_text(stmt, 1, captured.fingerprint.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, dedupStatusName(captured.status), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, captured.remote_id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 4, captured.file_path.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(captured.file_size));
        sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(captured.modified_at_ns));
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE)
        {
            return WriteOperationResult::Failure(std::string("Failed to record upload: ") +
                                                 sqlite3_errmsg(store.db_));
        }
        return WriteOperationResult(); });
}

DBOpResult DedupStore::clear()
{
    Logger::info("Clearing upload state in " + db_path_);
    return executeStatement("DELETE FROM upload_index");
}

size_t DedupStore::count()
{
    auto future = access_queue_->enqueueRead([](DedupStore &store)
                                             {
        if (!store.db_)
            throw std::runtime_error("Database not initialized");
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, "SELECT COUNT(*) FROM upload_index", -1, &stmt, nullptr) != SQLITE_OK)
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(store.db_));
        size_t rows = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW)
            rows = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
        sqlite3_finalize(stmt);
        return std::any(rows); });
    return std::any_cast<size_t>(future.get());
}

void DedupStore::waitForWrites()
{
    if (access_queue_)
    {
        access_queue_->wait_for_completion();
    }
}

WriteOperationResult DedupStore::getOperationResult(size_t operation_id) const
{
    return access_queue_->getOperationResult(operation_id);
}

size_t DedupStore::failedWrites() const
{
    return access_queue_ ? access_queue_->failedWrites() : 0;
}
