#pragma once

#include "TransferState.h"
#include <optional>
#include <vector>

namespace CipherLink {

/**
 * @brief Durable record of transfer progress, one entry per transferId.
 *
 * save() must be durable when it returns: the coordinator only advances
 * past a chunk after the write completes. Implementations throw
 * SecureStoreUnavailableError or StorageError on failure.
 */
class ITransferStateStore {
public:
    virtual ~ITransferStateStore() = default;

    virtual void save(const TransferState& state) = 0;
    virtual std::optional<TransferState> load(const std::string& transferId) = 0;
    virtual void remove(const std::string& transferId) = 0;

    /**
     * @brief Non-terminal states, oldest update first.
     */
    virtual std::vector<TransferState> listPending(
        std::optional<TransferDirection> direction = std::nullopt) = 0;
};

} // namespace CipherLink
