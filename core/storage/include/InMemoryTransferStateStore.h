#pragma once

#include "ITransferStateStore.h"
#include <map>
#include <mutex>

namespace CipherLink {

class InMemoryTransferStateStore : public ITransferStateStore {
public:
    void save(const TransferState& state) override;
    std::optional<TransferState> load(const std::string& transferId) override;
    void remove(const std::string& transferId) override;
    std::vector<TransferState> listPending(
        std::optional<TransferDirection> direction = std::nullopt) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, TransferState> states_;
};

} // namespace CipherLink
