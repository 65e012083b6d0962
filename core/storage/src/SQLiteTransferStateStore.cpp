#include "SQLiteTransferStateStore.h"
#include "Errors.h"
#include "LoggerMacros.h"

namespace CipherLink {

namespace {
    const char* const SELECT_COLUMNS =
        "SELECT transfer_id, session_id, transfer_token, direction, status, total_bytes, chunk_size, "
        "next_offset, next_chunk_index, peer_public_key_b64, payload_path, scan_required, claim_id, "
        "destination, manifest_path, updated_at_ms, attempt, error_message FROM transfer_states";
}

SQLiteTransferStateStore::SQLiteTransferStateStore(const std::string& dbPath)
    : db_(std::make_unique<DatabaseManager>(dbPath)) {
    if (!db_->initialize(migrations())) {
        throw StorageError(Core::ErrorCode::STATE_STORE_FAILED,
                           "Failed to initialize transfer state database at " + dbPath);
    }
}

std::vector<DatabaseManager::Migration> SQLiteTransferStateStore::migrations() {
    return {
        {1, "Create transfer_states",
         "CREATE TABLE IF NOT EXISTS transfer_states ("
         "  transfer_id TEXT PRIMARY KEY,"
         "  session_id TEXT NOT NULL,"
         "  transfer_token TEXT NOT NULL,"
         "  direction TEXT NOT NULL,"
         "  status TEXT NOT NULL,"
         "  total_bytes INTEGER NOT NULL DEFAULT 0,"
         "  chunk_size INTEGER NOT NULL DEFAULT 0,"
         "  next_offset INTEGER NOT NULL DEFAULT 0,"
         "  next_chunk_index INTEGER NOT NULL DEFAULT 0,"
         "  peer_public_key_b64 TEXT,"
         "  payload_path TEXT,"
         "  scan_required INTEGER NOT NULL DEFAULT 0,"
         "  updated_at_ms INTEGER NOT NULL DEFAULT 0"
         ");"
         "CREATE INDEX IF NOT EXISTS idx_transfer_states_pending ON transfer_states(status, updated_at_ms);"},
        {2, "Add claim, destination and diagnostics columns",
         "ALTER TABLE transfer_states ADD COLUMN claim_id TEXT;"
         "ALTER TABLE transfer_states ADD COLUMN destination TEXT;"
         "ALTER TABLE transfer_states ADD COLUMN manifest_path TEXT;"
         "ALTER TABLE transfer_states ADD COLUMN attempt INTEGER NOT NULL DEFAULT 0;"
         "ALTER TABLE transfer_states ADD COLUMN error_message TEXT;"}
    };
}

void SQLiteTransferStateStore::save(const TransferState& state) {
    db_->executeUpdate(
        "INSERT OR REPLACE INTO transfer_states (transfer_id, session_id, transfer_token, direction, status, "
        "total_bytes, chunk_size, next_offset, next_chunk_index, peer_public_key_b64, payload_path, "
        "scan_required, claim_id, destination, manifest_path, updated_at_ms, attempt, error_message) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        [&state](PreparedStatement& stmt) {
            stmt.bind(1, state.transferId)
                .bind(2, state.sessionId)
                .bind(3, state.transferToken)
                .bind(4, toString(state.direction))
                .bind(5, toString(state.status))
                .bind(6, static_cast<int64_t>(state.totalBytes))
                .bind(7, static_cast<int64_t>(state.chunkSize))
                .bind(8, static_cast<int64_t>(state.nextOffset))
                .bind(9, static_cast<int64_t>(state.nextChunkIndex))
                .bind(10, state.peerPublicKeyB64)
                .bind(11, state.payloadPath)
                .bind(12, state.scanRequired ? 1 : 0)
                .bind(13, state.claimId)
                .bind(14, state.destination)
                .bind(15, state.manifestPath)
                .bind(16, state.updatedAtMs)
                .bind(17, state.attempt)
                .bind(18, state.errorMessage);
        });
    LOG_DEBUG_COMP_IF("Saved " + state.transferId + " status=" + toString(state.status) +
                      " next_chunk=" + std::to_string(state.nextChunkIndex), "StateStore");
}

std::optional<TransferState> SQLiteTransferStateStore::load(const std::string& transferId) {
    std::optional<TransferState> result;
    db_->query(std::string(SELECT_COLUMNS) + " WHERE transfer_id = ?",
               [&transferId](PreparedStatement& stmt) { stmt.bind(1, transferId); },
               [&result](const PreparedStatement& row) { result = readRow(row); });
    return result;
}

void SQLiteTransferStateStore::remove(const std::string& transferId) {
    db_->executeUpdate("DELETE FROM transfer_states WHERE transfer_id = ?",
                       [&transferId](PreparedStatement& stmt) { stmt.bind(1, transferId); });
}

std::vector<TransferState> SQLiteTransferStateStore::listPending(std::optional<TransferDirection> direction) {
    std::vector<TransferState> pending;
    std::string sql = std::string(SELECT_COLUMNS) + " WHERE status NOT IN ('completed', 'failed')";
    if (direction) {
        sql += " AND direction = ?";
    }
    sql += " ORDER BY updated_at_ms ASC, rowid ASC";

    db_->query(sql,
               [&direction](PreparedStatement& stmt) {
                   if (direction) {
                       stmt.bind(1, toString(*direction));
                   }
               },
               [&pending](const PreparedStatement& row) {
                   try {
                       pending.push_back(readRow(row));
                   } catch (const ProtocolError& e) {
                       Logger::instance().log(LogLevel::WARN,
                           "Skipping unreadable transfer state row: " + std::string(e.what()), "StateStore");
                   }
               });
    return pending;
}

TransferState SQLiteTransferStateStore::readRow(const PreparedStatement& row) {
    auto direction = parseDirection(row.getColumnString(3));
    auto status = parseStatus(row.getColumnString(4));
    if (!direction || !status) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
                            "Row " + row.getColumnString(0) + " has unknown direction or status");
    }

    TransferState state;
    state.transferId = row.getColumnString(0);
    state.sessionId = row.getColumnString(1);
    state.transferToken = row.getColumnString(2);
    state.direction = *direction;
    state.status = *status;
    state.totalBytes = static_cast<uint64_t>(row.getColumnInt64(5));
    state.chunkSize = static_cast<uint32_t>(row.getColumnInt64(6));
    state.nextOffset = static_cast<uint64_t>(row.getColumnInt64(7));
    state.nextChunkIndex = static_cast<uint64_t>(row.getColumnInt64(8));
    state.peerPublicKeyB64 = row.getColumnString(9);
    state.payloadPath = row.getColumnString(10);
    state.scanRequired = row.getColumnInt(11) != 0;
    state.claimId = row.getColumnString(12);
    state.destination = row.getColumnString(13);
    state.manifestPath = row.getColumnString(14);
    state.updatedAtMs = row.getColumnInt64(15);
    state.attempt = row.getColumnInt(16);
    state.errorMessage = row.getColumnString(17);
    return state;
}

} // namespace CipherLink
