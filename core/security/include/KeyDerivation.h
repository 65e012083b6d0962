#pragma once

#include "Crypto.h"
#include "EncryptedPayload.h"
#include <string>
#include <vector>
#include <cstdint>

namespace CipherLink {

using SecretKey = std::vector<uint8_t>;

/**
 * @brief HKDF ratchet from the X25519 shared secret down to per-chunk keys
 *
 *   shared secret -> sessionKey  (salt=sessionId,  info="cipherlink-session")
 *   sessionKey    -> fileKey     (salt=transferId, info="file-key")
 *   sessionKey    -> manifestKey (salt=transferId, info="manifest-key")
 *   fileKey       -> chunkKey(i) (salt=BE64(i),    info="chunk-key")
 *   fileKey       -> nonce(i)    (salt=BE64(i),    info="chunk-nonce", 12 bytes)
 *
 * Every box is bound to "session_id=S|transfer_id=T|chunk_index=I|direction=D"
 * as additional data. The manifest uses chunk_index=-1.
 */
class KeyDerivation {
public:
    static constexpr const char* DIRECTION = "sender->receiver";
    static constexpr int64_t MANIFEST_INDEX = -1;

    /**
     * @brief X25519 agreement followed by HKDF. The shared secret is wiped before returning.
     */
    static SecretKey deriveSessionKey(
        const X25519KeyPair& localKeyPair,
        const std::vector<uint8_t>& peerPublicKey,
        const std::string& sessionId
    );

    static SecretKey deriveFileKey(const SecretKey& sessionKey, const std::string& transferId);
    static SecretKey deriveManifestKey(const SecretKey& sessionKey, const std::string& transferId);

    static SecretKey deriveChunkKey(const SecretKey& fileKey, uint64_t chunkIndex);
    static std::vector<uint8_t> deriveChunkNonce(const SecretKey& fileKey, uint64_t chunkIndex);
    static std::vector<uint8_t> deriveManifestNonce(const SecretKey& manifestKey, const std::string& transferId);

    static std::vector<uint8_t> buildAad(
        const std::string& sessionId,
        const std::string& transferId,
        int64_t chunkIndex
    );

    static EncryptedPayload encryptChunk(
        const SecretKey& sessionKey,
        const std::string& sessionId,
        const std::string& transferId,
        uint64_t chunkIndex,
        const std::vector<uint8_t>& plaintext
    );

    /**
     * @throws AuthenticationFailedError if the box was altered or belongs to another context
     */
    static std::vector<uint8_t> decryptChunk(
        const SecretKey& sessionKey,
        const std::string& sessionId,
        const std::string& transferId,
        uint64_t chunkIndex,
        const EncryptedPayload& payload
    );

    static EncryptedPayload encryptManifest(
        const SecretKey& sessionKey,
        const std::string& sessionId,
        const std::string& transferId,
        const std::vector<uint8_t>& plaintext
    );

    static std::vector<uint8_t> decryptManifest(
        const SecretKey& sessionKey,
        const std::string& sessionId,
        const std::string& transferId,
        const EncryptedPayload& payload
    );

    // Scan copies: relay-issued key, nonce = 4 zero bytes || BE64(index), no AAD.
    static std::vector<uint8_t> scanNonce(uint64_t chunkIndex);
    static std::vector<uint8_t> encryptScanChunk(
        const std::vector<uint8_t>& scanKey,
        uint64_t chunkIndex,
        const std::vector<uint8_t>& plaintext
    );
    static std::vector<uint8_t> decryptScanChunk(
        const std::vector<uint8_t>& scanKey,
        uint64_t chunkIndex,
        const std::vector<uint8_t>& sealed
    );

    static std::vector<uint8_t> bigEndian64(uint64_t value);
};

/**
 * @brief Per-transfer cipher that derives fileKey/manifestKey once
 *
 * Used by the coordinator so each chunk costs two HKDF expansions plus one
 * AEAD call. Key material is wiped on destruction.
 */
class TransferCipher {
public:
    TransferCipher(const SecretKey& sessionKey, std::string sessionId, std::string transferId);
    ~TransferCipher();

    TransferCipher(const TransferCipher&) = delete;
    TransferCipher& operator=(const TransferCipher&) = delete;

    EncryptedPayload encryptChunk(uint64_t chunkIndex, const std::vector<uint8_t>& plaintext) const;
    std::vector<uint8_t> decryptChunk(uint64_t chunkIndex, const EncryptedPayload& payload) const;

    EncryptedPayload encryptManifest(const std::vector<uint8_t>& plaintext) const;
    std::vector<uint8_t> decryptManifest(const EncryptedPayload& payload) const;

    const std::string& transferId() const { return transferId_; }

private:
    std::string sessionId_;
    std::string transferId_;
    SecretKey fileKey_;
    SecretKey manifestKey_;
};

} // namespace CipherLink
