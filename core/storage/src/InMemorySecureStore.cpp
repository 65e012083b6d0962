#include "ISecureStore.h"
#include "Errors.h"

namespace CipherLink {

void InMemorySecureStore::ensureAvailable() const {
    if (!available_) {
        throw SecureStoreUnavailableError("Secure store is unavailable");
    }
}

void InMemorySecureStore::write(const std::string& key, const std::string& value) {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

std::optional<std::string> InMemorySecureStore::read(const std::string& key) {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySecureStore::remove(const std::string& key) {
    ensureAvailable();
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
}

size_t InMemorySecureStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.size();
}

} // namespace CipherLink
