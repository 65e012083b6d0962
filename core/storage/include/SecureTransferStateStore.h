#pragma once

#include "ITransferStateStore.h"
#include "ISecureStore.h"
#include <memory>
#include <mutex>
#include <set>

namespace CipherLink {

/**
 * @brief Transfer states kept in the platform secure store.
 *
 * Records live under "transfer_state_<id>" as JSON; the list of ids lives
 * under "transfer_state_index" because secure stores cannot enumerate keys.
 * SecureStoreUnavailableError propagates to the caller unchanged.
 */
class SecureTransferStateStore : public ITransferStateStore {
public:
    static constexpr const char* INDEX_KEY = "transfer_state_index";
    static constexpr const char* KEY_PREFIX = "transfer_state_";

    explicit SecureTransferStateStore(std::shared_ptr<ISecureStore> store);

    void save(const TransferState& state) override;
    std::optional<TransferState> load(const std::string& transferId) override;
    void remove(const std::string& transferId) override;
    std::vector<TransferState> listPending(
        std::optional<TransferDirection> direction = std::nullopt) override;

private:
    std::shared_ptr<ISecureStore> store_;
    std::mutex mutex_;

    std::set<std::string> readIndex();
    void writeIndex(const std::set<std::string>& ids);
    static std::string keyFor(const std::string& transferId);
};

} // namespace CipherLink
