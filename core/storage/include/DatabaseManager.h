#pragma once

#include <sqlite3.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <functional>
#include <mutex>
#include <cstdint>

namespace CipherLink {

/**
 * @brief RAII savepoint; rolls back unless commit() was called
 */
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    void commit();
    void rollback();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    sqlite3* db_;
    bool finished_;
    std::string savepoint_;
};

/**
 * @brief Prepared statement wrapper for type-safe parameter binding
 */
class PreparedStatement {
public:
    PreparedStatement(sqlite3* db, const std::string& sql);
    ~PreparedStatement();

    PreparedStatement& bind(int index, int value);
    PreparedStatement& bind(int index, int64_t value);
    PreparedStatement& bind(int index, const std::string& value);

    /**
     * @return true while a row is available, false once the statement is done
     * @throws StorageError on any other sqlite result
     */
    bool step();
    void reset();

    int getColumnInt(int index) const;
    int64_t getColumnInt64(int index) const;
    std::string getColumnString(int index) const;

    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_;
};

/**
 * @brief Single SQLite connection with statement cache and migrations
 *
 * Features:
 * - Thread-safe single connection guarded by a mutex
 * - WAL mode with synchronous=FULL so a returned write survives power loss
 * - schema_version table driving forward-only migrations
 */
class DatabaseManager {
public:
    struct Migration {
        int version;
        std::string description;
        std::string upSql;
    };

    using Binder = std::function<void(PreparedStatement&)>;
    using RowReader = std::function<void(const PreparedStatement&)>;

    explicit DatabaseManager(const std::string& dbPath);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Open the database, enable WAL and run pending migrations
     * @return false if the file cannot be opened or a migration fails
     */
    bool initialize(const std::vector<Migration>& migrations);

    /**
     * @brief Run a write statement to completion
     * @throws StorageError on failure
     */
    void executeUpdate(const std::string& sql, const Binder& binder = nullptr);

    /**
     * @brief Run a query and hand every row to reader
     * @throws StorageError on failure
     */
    void query(const std::string& sql, const Binder& binder, const RowReader& reader);

    int currentVersion();
    const std::string& path() const { return dbPath_; }

private:
    sqlite3* db_;
    std::string dbPath_;
    mutable std::recursive_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<PreparedStatement>> statementCache_;

    std::shared_ptr<PreparedStatement> prepare(const std::string& sql);
    bool executeInternal(const std::string& sql);
    bool runMigrations(const std::vector<Migration>& migrations);
    int currentVersionInternal();
};

} // namespace CipherLink
