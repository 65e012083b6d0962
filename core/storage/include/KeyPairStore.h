#pragma once

#include "ISecureStore.h"
#include "Crypto.h"
#include <memory>
#include <optional>
#include <string>

namespace CipherLink {

/**
 * @brief Persists per-session X25519 key pairs in the secure store
 *
 * Only the private key is stored (base64, key "keypair_<role>_<sessionId>");
 * the public key is recomputed on load.
 */
class KeyPairStore {
public:
    explicit KeyPairStore(std::shared_ptr<ISecureStore> store);

    void save(const std::string& role, const std::string& sessionId, const X25519KeyPair& keyPair);
    std::optional<X25519KeyPair> load(const std::string& role, const std::string& sessionId);
    void remove(const std::string& role, const std::string& sessionId);

    /**
     * @brief Load the stored pair, or generate and persist a fresh one
     */
    X25519KeyPair loadOrCreate(const std::string& role, const std::string& sessionId);

    static std::string keyFor(const std::string& role, const std::string& sessionId);

private:
    std::shared_ptr<ISecureStore> store_;
};

} // namespace CipherLink
