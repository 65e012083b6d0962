#include "DatabaseManager.h"
#include "Errors.h"
#include "Logger.h"
#include <atomic>

namespace CipherLink {

using Core::ErrorCode;

// Transaction Implementation
Transaction::Transaction(sqlite3* db) : db_(db), finished_(false) {
    static std::atomic<uint64_t> counter{0};
    savepoint_ = "txn_" + std::to_string(++counter);
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("SAVEPOINT " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string detail = errMsg ? errMsg : "";
        if (errMsg) sqlite3_free(errMsg);
        Logger::instance().log(LogLevel::ERROR, "Failed to create savepoint: " + detail, "StateStore");
        throw StorageError(ErrorCode::STATE_STORE_FAILED, "Failed to begin transaction: " + detail);
    }
}

Transaction::~Transaction() {
    if (!finished_) {
        rollback();
    }
}

void Transaction::commit() {
    if (finished_) {
        return;
    }
    char* errMsg = nullptr;
    if (sqlite3_exec(db_, ("RELEASE " + savepoint_).c_str(), nullptr, nullptr, &errMsg) != SQLITE_OK) {
        std::string detail = errMsg ? errMsg : "";
        if (errMsg) sqlite3_free(errMsg);
        throw StorageError(ErrorCode::STATE_STORE_FAILED, "Failed to commit transaction: " + detail);
    }
    finished_ = true;
}

void Transaction::rollback() {
    if (finished_) {
        return;
    }
    finished_ = true;
    // Best effort: rollback runs from destructors, so failures are logged only
    if (sqlite3_exec(db_, ("ROLLBACK TO " + savepoint_).c_str(), nullptr, nullptr, nullptr) != SQLITE_OK ||
        sqlite3_exec(db_, ("RELEASE " + savepoint_).c_str(), nullptr, nullptr, nullptr) != SQLITE_OK) {
        Logger::instance().log(LogLevel::WARN,
            std::string("Rollback failed: ") + sqlite3_errmsg(db_), "StateStore");
    }
}

// PreparedStatement Implementation
PreparedStatement::PreparedStatement(sqlite3* db, const std::string& sql) : db_(db), stmt_(nullptr) {
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        throw StorageError(ErrorCode::STATE_STORE_FAILED,
                           "Failed to prepare statement: " + sql + " - " + sqlite3_errmsg(db_));
    }
}

PreparedStatement::~PreparedStatement() {
    if (stmt_) {
        sqlite3_finalize(stmt_);
    }
}

PreparedStatement& PreparedStatement::bind(int index, int value) {
    sqlite3_bind_int(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt_, index, value);
    return *this;
}

PreparedStatement& PreparedStatement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
}

bool PreparedStatement::step() {
    int result = sqlite3_step(stmt_);
    if (result == SQLITE_ROW) {
        return true;
    }
    if (result == SQLITE_DONE) {
        return false;
    }
    throw StorageError(ErrorCode::STATE_STORE_FAILED,
                       std::string("sqlite3_step failed: ") + sqlite3_errmsg(db_));
}

void PreparedStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int PreparedStatement::getColumnInt(int index) const {
    return sqlite3_column_int(stmt_, index);
}

int64_t PreparedStatement::getColumnInt64(int index) const {
    return sqlite3_column_int64(stmt_, index);
}

std::string PreparedStatement::getColumnString(int index) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, index));
    return text ? std::string(text) : std::string();
}

// DatabaseManager Implementation
DatabaseManager::DatabaseManager(const std::string& dbPath)
    : db_(nullptr), dbPath_(dbPath) {
}

DatabaseManager::~DatabaseManager() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    statementCache_.clear();
    if (db_) {
        sqlite3_close(db_);
    }
}

bool DatabaseManager::initialize(const std::vector<Migration>& migrations) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    Logger::instance().log(LogLevel::INFO, "Opening database: " + dbPath_, "StateStore");

    if (sqlite3_open(dbPath_.c_str(), &db_) != SQLITE_OK) {
        Logger::instance().log(LogLevel::ERROR, "Failed to open database: " + dbPath_ + " - " +
                               (db_ ? sqlite3_errmsg(db_) : "out of memory"), "StateStore");
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        return false;
    }

    if (!executeInternal("PRAGMA journal_mode=WAL")) {
        Logger::instance().log(LogLevel::WARN, "Failed to enable WAL mode", "StateStore");
    }
    executeInternal("PRAGMA synchronous=FULL");
    sqlite3_busy_timeout(db_, 5000);

    if (!runMigrations(migrations)) {
        Logger::instance().log(LogLevel::ERROR, "Failed to run migrations", "StateStore");
        return false;
    }

    Logger::instance().log(LogLevel::INFO, "Database ready at schema version " +
                           std::to_string(currentVersionInternal()), "StateStore");
    return true;
}

bool DatabaseManager::runMigrations(const std::vector<Migration>& migrations) {
    if (!executeInternal("CREATE TABLE IF NOT EXISTS schema_version (version INTEGER PRIMARY KEY, description TEXT)")) {
        return false;
    }

    int current = currentVersionInternal();
    for (const auto& migration : migrations) {
        if (migration.version <= current) {
            continue;
        }
        Logger::instance().log(LogLevel::INFO, "Running migration " + std::to_string(migration.version) +
                               ": " + migration.description, "StateStore");
        try {
            Transaction txn(db_);
            if (!executeInternal(migration.upSql)) {
                return false;
            }
            auto stmt = prepare("INSERT OR REPLACE INTO schema_version (version, description) VALUES (?, ?)");
            stmt->bind(1, migration.version).bind(2, migration.description);
            stmt->step();
            txn.commit();
        } catch (const StorageError& e) {
            Logger::instance().log(LogLevel::ERROR, "Migration failed: " + std::string(e.what()), "StateStore");
            return false;
        }
    }
    return true;
}

int DatabaseManager::currentVersion() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return currentVersionInternal();
}

int DatabaseManager::currentVersionInternal() {
    auto stmt = prepare("SELECT version FROM schema_version ORDER BY version DESC LIMIT 1");
    int version = stmt->step() ? stmt->getColumnInt(0) : 0;
    stmt->reset();
    return version;
}

std::shared_ptr<PreparedStatement> DatabaseManager::prepare(const std::string& sql) {
    if (!db_) {
        throw StorageError(ErrorCode::STATE_STORE_FAILED, "Database is not open: " + dbPath_);
    }
    auto it = statementCache_.find(sql);
    if (it != statementCache_.end()) {
        it->second->reset();
        return it->second;
    }
    auto stmt = std::make_shared<PreparedStatement>(db_, sql);
    statementCache_[sql] = stmt;
    return stmt;
}

void DatabaseManager::executeUpdate(const std::string& sql, const Binder& binder) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(sql);
    if (binder) {
        binder(*stmt);
    }
    while (stmt->step()) {
    }
    stmt->reset();
}

void DatabaseManager::query(const std::string& sql, const Binder& binder, const RowReader& reader) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto stmt = prepare(sql);
    if (binder) {
        binder(*stmt);
    }
    while (stmt->step()) {
        reader(*stmt);
    }
    stmt->reset();
}

bool DatabaseManager::executeInternal(const std::string& sql) {
    char* errMsg = nullptr;
    int result = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errMsg);
    if (result != SQLITE_OK) {
        Logger::instance().log(LogLevel::ERROR, "Failed to execute SQL: " + sql + " - " +
                               std::string(errMsg ? errMsg : ""), "StateStore");
        if (errMsg) sqlite3_free(errMsg);
        return false;
    }
    return true;
}

} // namespace CipherLink
