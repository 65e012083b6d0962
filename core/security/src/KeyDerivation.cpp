#include "KeyDerivation.h"
#include "Errors.h"
#include "LoggerMacros.h"

namespace CipherLink {

namespace {
    constexpr size_t KEY_LEN = 32;
    constexpr size_t NONCE_LEN = 12;

    constexpr const char* SESSION_INFO = "cipherlink-session";
    constexpr const char* FILE_INFO = "file-key";
    constexpr const char* MANIFEST_INFO = "manifest-key";
    constexpr const char* CHUNK_INFO = "chunk-key";
    constexpr const char* CHUNK_NONCE_INFO = "chunk-nonce";
    constexpr const char* MANIFEST_NONCE_INFO = "manifest-nonce";

    std::vector<uint8_t> label(const char* info) {
        return Crypto::toBytes(info);
    }

    EncryptedPayload seal(const SecretKey& key, std::vector<uint8_t> nonce,
                          const std::vector<uint8_t>& aad, const std::vector<uint8_t>& plaintext) {
        auto sealed = Crypto::encryptChaCha20Poly1305(plaintext, key, nonce, aad);
        return EncryptedPayload::fromSealed(std::move(nonce), sealed);
    }

    std::vector<uint8_t> open(const SecretKey& key, const std::vector<uint8_t>& expectedNonce,
                              const std::vector<uint8_t>& aad, const EncryptedPayload& payload) {
        if (payload.tag.size() != EncryptedPayload::TAG_SIZE) {
            throw AuthenticationFailedError("Authentication tag has wrong length");
        }
        // Nonces are derived, never transmitted state: a foreign nonce means a foreign box.
        if (!Crypto::constantTimeCompare(payload.nonce, expectedNonce)) {
            throw AuthenticationFailedError("Nonce does not match the derived chunk nonce");
        }
        return Crypto::decryptChaCha20Poly1305(payload.sealed(), key, expectedNonce, aad);
    }
}

std::vector<uint8_t> KeyDerivation::bigEndian64(uint64_t value) {
    std::vector<uint8_t> out(8);
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

SecretKey KeyDerivation::deriveSessionKey(
    const X25519KeyPair& localKeyPair,
    const std::vector<uint8_t>& peerPublicKey,
    const std::string& sessionId
) {
    auto shared = Crypto::x25519SharedSecret(localKeyPair.privateKey, peerPublicKey);
    SecretKey sessionKey;
    try {
        sessionKey = Crypto::hkdfSha256(shared, Crypto::toBytes(sessionId), label(SESSION_INFO), KEY_LEN);
    } catch (const std::exception&) {
        Crypto::secureWipe(shared);
        throw;
    }
    Crypto::secureWipe(shared);
    LOG_DEBUG_COMP_IF("Derived session key for session " + sessionId, "KeyDerivation");
    return sessionKey;
}

SecretKey KeyDerivation::deriveFileKey(const SecretKey& sessionKey, const std::string& transferId) {
    return Crypto::hkdfSha256(sessionKey, Crypto::toBytes(transferId), label(FILE_INFO), KEY_LEN);
}

SecretKey KeyDerivation::deriveManifestKey(const SecretKey& sessionKey, const std::string& transferId) {
    return Crypto::hkdfSha256(sessionKey, Crypto::toBytes(transferId), label(MANIFEST_INFO), KEY_LEN);
}

SecretKey KeyDerivation::deriveChunkKey(const SecretKey& fileKey, uint64_t chunkIndex) {
    return Crypto::hkdfSha256(fileKey, bigEndian64(chunkIndex), label(CHUNK_INFO), KEY_LEN);
}

std::vector<uint8_t> KeyDerivation::deriveChunkNonce(const SecretKey& fileKey, uint64_t chunkIndex) {
    return Crypto::hkdfSha256(fileKey, bigEndian64(chunkIndex), label(CHUNK_NONCE_INFO), NONCE_LEN);
}

std::vector<uint8_t> KeyDerivation::deriveManifestNonce(const SecretKey& manifestKey, const std::string& transferId) {
    return Crypto::hkdfSha256(manifestKey, Crypto::toBytes(transferId), label(MANIFEST_NONCE_INFO), NONCE_LEN);
}

std::vector<uint8_t> KeyDerivation::buildAad(
    const std::string& sessionId,
    const std::string& transferId,
    int64_t chunkIndex
) {
    std::string aad = "session_id=" + sessionId +
                      "|transfer_id=" + transferId +
                      "|chunk_index=" + std::to_string(chunkIndex) +
                      "|direction=" + DIRECTION;
    return Crypto::toBytes(aad);
}

EncryptedPayload KeyDerivation::encryptChunk(
    const SecretKey& sessionKey,
    const std::string& sessionId,
    const std::string& transferId,
    uint64_t chunkIndex,
    const std::vector<uint8_t>& plaintext
) {
    TransferCipher cipher(sessionKey, sessionId, transferId);
    return cipher.encryptChunk(chunkIndex, plaintext);
}

std::vector<uint8_t> KeyDerivation::decryptChunk(
    const SecretKey& sessionKey,
    const std::string& sessionId,
    const std::string& transferId,
    uint64_t chunkIndex,
    const EncryptedPayload& payload
) {
    TransferCipher cipher(sessionKey, sessionId, transferId);
    return cipher.decryptChunk(chunkIndex, payload);
}

EncryptedPayload KeyDerivation::encryptManifest(
    const SecretKey& sessionKey,
    const std::string& sessionId,
    const std::string& transferId,
    const std::vector<uint8_t>& plaintext
) {
    TransferCipher cipher(sessionKey, sessionId, transferId);
    return cipher.encryptManifest(plaintext);
}

std::vector<uint8_t> KeyDerivation::decryptManifest(
    const SecretKey& sessionKey,
    const std::string& sessionId,
    const std::string& transferId,
    const EncryptedPayload& payload
) {
    TransferCipher cipher(sessionKey, sessionId, transferId);
    return cipher.decryptManifest(payload);
}

std::vector<uint8_t> KeyDerivation::scanNonce(uint64_t chunkIndex) {
    std::vector<uint8_t> nonce(4, 0);
    auto counter = bigEndian64(chunkIndex);
    nonce.insert(nonce.end(), counter.begin(), counter.end());
    return nonce;
}

std::vector<uint8_t> KeyDerivation::encryptScanChunk(
    const std::vector<uint8_t>& scanKey,
    uint64_t chunkIndex,
    const std::vector<uint8_t>& plaintext
) {
    if (scanKey.size() != Crypto::KEY_SIZE) {
        throw CipherLinkError(Core::ErrorCode::INVALID_KEY,
                              "Scan key must be 32 bytes, got " + std::to_string(scanKey.size()));
    }
    return Crypto::encryptChaCha20Poly1305(plaintext, scanKey, scanNonce(chunkIndex));
}

std::vector<uint8_t> KeyDerivation::decryptScanChunk(
    const std::vector<uint8_t>& scanKey,
    uint64_t chunkIndex,
    const std::vector<uint8_t>& sealed
) {
    return Crypto::decryptChaCha20Poly1305(sealed, scanKey, scanNonce(chunkIndex));
}

// TransferCipher

TransferCipher::TransferCipher(const SecretKey& sessionKey, std::string sessionId, std::string transferId)
    : sessionId_(std::move(sessionId)),
      transferId_(std::move(transferId)),
      fileKey_(KeyDerivation::deriveFileKey(sessionKey, transferId_)),
      manifestKey_(KeyDerivation::deriveManifestKey(sessionKey, transferId_)) {
}

TransferCipher::~TransferCipher() {
    Crypto::secureWipe(fileKey_);
    Crypto::secureWipe(manifestKey_);
}

EncryptedPayload TransferCipher::encryptChunk(uint64_t chunkIndex, const std::vector<uint8_t>& plaintext) const {
    auto chunkKey = KeyDerivation::deriveChunkKey(fileKey_, chunkIndex);
    auto nonce = KeyDerivation::deriveChunkNonce(fileKey_, chunkIndex);
    auto aad = KeyDerivation::buildAad(sessionId_, transferId_, static_cast<int64_t>(chunkIndex));
    auto payload = seal(chunkKey, std::move(nonce), aad, plaintext);
    Crypto::secureWipe(chunkKey);
    return payload;
}

std::vector<uint8_t> TransferCipher::decryptChunk(uint64_t chunkIndex, const EncryptedPayload& payload) const {
    auto chunkKey = KeyDerivation::deriveChunkKey(fileKey_, chunkIndex);
    auto nonce = KeyDerivation::deriveChunkNonce(fileKey_, chunkIndex);
    auto aad = KeyDerivation::buildAad(sessionId_, transferId_, static_cast<int64_t>(chunkIndex));
    try {
        auto plaintext = open(chunkKey, nonce, aad, payload);
        Crypto::secureWipe(chunkKey);
        return plaintext;
    } catch (const AuthenticationFailedError&) {
        Crypto::secureWipe(chunkKey);
        Logger::instance().log(LogLevel::WARN,
            "Chunk " + std::to_string(chunkIndex) + " of " + transferId_ + " failed authentication",
            "KeyDerivation");
        throw;
    }
}

EncryptedPayload TransferCipher::encryptManifest(const std::vector<uint8_t>& plaintext) const {
    auto nonce = KeyDerivation::deriveManifestNonce(manifestKey_, transferId_);
    auto aad = KeyDerivation::buildAad(sessionId_, transferId_, KeyDerivation::MANIFEST_INDEX);
    return seal(manifestKey_, std::move(nonce), aad, plaintext);
}

std::vector<uint8_t> TransferCipher::decryptManifest(const EncryptedPayload& payload) const {
    auto nonce = KeyDerivation::deriveManifestNonce(manifestKey_, transferId_);
    auto aad = KeyDerivation::buildAad(sessionId_, transferId_, KeyDerivation::MANIFEST_INDEX);
    return open(manifestKey_, nonce, aad, payload);
}

} // namespace CipherLink
