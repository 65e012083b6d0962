#include "KeyPairStore.h"
#include "Errors.h"
#include "Logger.h"

namespace CipherLink {

KeyPairStore::KeyPairStore(std::shared_ptr<ISecureStore> store)
    : store_(std::move(store)) {
}

std::string KeyPairStore::keyFor(const std::string& role, const std::string& sessionId) {
    return "keypair_" + role + "_" + sessionId;
}

void KeyPairStore::save(const std::string& role, const std::string& sessionId, const X25519KeyPair& keyPair) {
    store_->write(keyFor(role, sessionId), Crypto::toBase64(keyPair.privateKey));
}

std::optional<X25519KeyPair> KeyPairStore::load(const std::string& role, const std::string& sessionId) {
    auto encoded = store_->read(keyFor(role, sessionId));
    if (!encoded) {
        return std::nullopt;
    }

    X25519KeyPair pair;
    try {
        pair.privateKey = Crypto::fromBase64(*encoded);
        pair.publicKey = Crypto::x25519PublicFromPrivate(pair.privateKey);
    } catch (const std::invalid_argument& e) {
        Logger::instance().log(LogLevel::WARN, "Stored key pair for " + role + "/" + sessionId +
                               " is not valid base64: " + e.what(), "KeyStore");
        return std::nullopt;
    } catch (const CipherLinkError& e) {
        Logger::instance().log(LogLevel::WARN, "Stored key pair for " + role + "/" + sessionId +
                               " is invalid: " + e.what(), "KeyStore");
        return std::nullopt;
    }
    return pair;
}

void KeyPairStore::remove(const std::string& role, const std::string& sessionId) {
    store_->remove(keyFor(role, sessionId));
}

X25519KeyPair KeyPairStore::loadOrCreate(const std::string& role, const std::string& sessionId) {
    if (auto existing = load(role, sessionId)) {
        return *existing;
    }
    auto pair = Crypto::generateX25519KeyPair();
    save(role, sessionId, pair);
    Logger::instance().log(LogLevel::INFO, "Generated " + role + " key pair for session " + sessionId, "KeyStore");
    return pair;
}

} // namespace CipherLink
