#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

namespace CipherLink {

/**
 * @brief Raw X25519 key pair (32-byte private scalar, 32-byte public point)
 */
struct X25519KeyPair {
    std::vector<uint8_t> privateKey;
    std::vector<uint8_t> publicKey;
};

/**
 * @brief OpenSSL-backed primitives used by the key ratchet and the scan relay
 *
 * Supports:
 * - X25519 key agreement
 * - HKDF-SHA256 extract-and-expand
 * - ChaCha20-Poly1305 AEAD (ciphertext || 16-byte tag)
 * - Base64, base64url and hex codecs
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t X25519_KEY_SIZE = 32;

    /**
     * @brief Fill a buffer from the OpenSSL CSPRNG
     * @throws std::runtime_error if the RNG fails
     */
    static std::vector<uint8_t> randomBytes(size_t length);

    static X25519KeyPair generateX25519KeyPair();

    /**
     * @brief Recompute the public half of a stored private key
     * @throws CipherLinkError(INVALID_KEY) on malformed input
     */
    static std::vector<uint8_t> x25519PublicFromPrivate(const std::vector<uint8_t>& privateKey);

    /**
     * @brief X25519(privateKey, peerPublicKey)
     * @throws CipherLinkError(KEY_AGREEMENT_FAILED) on bad keys or low-order points
     */
    static std::vector<uint8_t> x25519SharedSecret(
        const std::vector<uint8_t>& privateKey,
        const std::vector<uint8_t>& peerPublicKey
    );

    /**
     * @brief HKDF-SHA256 (RFC 5869)
     * @param ikm Input keying material
     * @param salt Extract salt (may be empty)
     * @param info Expand context label
     * @param length Output length in bytes
     */
    static std::vector<uint8_t> hkdfSha256(
        const std::vector<uint8_t>& ikm,
        const std::vector<uint8_t>& salt,
        const std::vector<uint8_t>& info,
        size_t length
    );

    /**
     * @brief Encrypt with ChaCha20-Poly1305
     * @param plaintext Data to encrypt
     * @param key 32-byte key
     * @param nonce 12-byte nonce, never reused under the same key
     * @param aad Additional authenticated data (may be empty)
     * @return ciphertext with the 16-byte tag appended
     * @throws CipherLinkError(ENCRYPTION_FAILED) on failure
     */
    static std::vector<uint8_t> encryptChaCha20Poly1305(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    /**
     * @brief Decrypt ciphertext || tag produced by encryptChaCha20Poly1305
     * @throws AuthenticationFailedError when the tag does not verify
     */
    static std::vector<uint8_t> decryptChaCha20Poly1305(
        const std::vector<uint8_t>& ciphertextWithTag,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce,
        const std::vector<uint8_t>& aad = {}
    );

    static std::string toHex(const std::vector<uint8_t>& data);
    static std::vector<uint8_t> fromHex(const std::string& hex);

    static std::string toBase64(const std::vector<uint8_t>& data);
    /**
     * @brief Decode standard or URL-safe base64, padding optional
     * @throws std::invalid_argument on characters outside either alphabet
     */
    static std::vector<uint8_t> fromBase64(const std::string& encoded);
    static std::string toBase64Url(const std::vector<uint8_t>& data);

    static bool constantTimeCompare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b);

    static void secureWipe(std::vector<uint8_t>& data);

    static std::vector<uint8_t> toBytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
};

} // namespace CipherLink
