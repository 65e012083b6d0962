#include "InMemoryTransferStateStore.h"
#include <algorithm>

namespace CipherLink {

void InMemoryTransferStateStore::save(const TransferState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[state.transferId] = state;
}

std::optional<TransferState> InMemoryTransferStateStore::load(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(transferId);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryTransferStateStore::remove(const std::string& transferId) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(transferId);
}

std::vector<TransferState> InMemoryTransferStateStore::listPending(std::optional<TransferDirection> direction) {
    std::vector<TransferState> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, state] : states_) {
            if (!state.needsResume()) continue;
            if (direction && state.direction != *direction) continue;
            pending.push_back(state);
        }
    }
    std::stable_sort(pending.begin(), pending.end(), [](const TransferState& a, const TransferState& b) {
        return a.updatedAtMs < b.updatedAtMs;
    });
    return pending;
}

size_t InMemoryTransferStateStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return states_.size();
}

} // namespace CipherLink
