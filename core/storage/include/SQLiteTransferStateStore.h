#pragma once

#include "ITransferStateStore.h"
#include "DatabaseManager.h"
#include <memory>

namespace CipherLink {

/**
 * @brief Transfer-state store backed by a local SQLite database
 *
 * One row per transfer in the transfer_states table. Writes run with
 * synchronous=FULL so a save that returned survives a crash.
 */
class SQLiteTransferStateStore : public ITransferStateStore {
public:
    /**
     * @throws StorageError if the database cannot be opened or migrated
     */
    explicit SQLiteTransferStateStore(const std::string& dbPath);

    void save(const TransferState& state) override;
    std::optional<TransferState> load(const std::string& transferId) override;
    void remove(const std::string& transferId) override;
    std::vector<TransferState> listPending(
        std::optional<TransferDirection> direction = std::nullopt) override;

    int schemaVersion() { return db_->currentVersion(); }

private:
    std::unique_ptr<DatabaseManager> db_;

    static std::vector<DatabaseManager::Migration> migrations();
    static TransferState readRow(const PreparedStatement& row);
};

} // namespace CipherLink
