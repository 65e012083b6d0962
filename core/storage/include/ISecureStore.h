#pragma once

#include <string>
#include <optional>
#include <map>
#include <mutex>
#include <atomic>

namespace CipherLink {

/**
 * @brief Platform secure key-value store (keychain, keystore, secret service).
 *
 * Every call may throw SecureStoreUnavailableError when the backing
 * service is locked or missing.
 */
class ISecureStore {
public:
    virtual ~ISecureStore() = default;

    virtual void write(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> read(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;
};

/**
 * @brief Process-local secure store used by tests and headless runs.
 */
class InMemorySecureStore : public ISecureStore {
public:
    void write(const std::string& key, const std::string& value) override;
    std::optional<std::string> read(const std::string& key) override;
    void remove(const std::string& key) override;

    // Simulates a locked keychain: every call throws while unavailable
    void setAvailable(bool available) { available_ = available; }
    size_t size() const;

private:
    void ensureAvailable() const;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
    std::atomic<bool> available_{true};
};

/**
 * @brief JSON file readable only by its owner, for desktop CLI runs
 *
 * The whole map is rewritten on every change. A missing or unwritable
 * file reports the store as unavailable.
 */
class FileSecureStore : public ISecureStore {
public:
    explicit FileSecureStore(std::string path);

    void write(const std::string& key, const std::string& value) override;
    std::optional<std::string> read(const std::string& key) override;
    void remove(const std::string& key) override;

    const std::string& path() const { return path_; }

private:
    std::map<std::string, std::string> loadLocked() const;
    void saveLocked(const std::map<std::string, std::string>& values) const;

    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace CipherLink
