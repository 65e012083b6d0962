#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace CipherLink {

/**
 * @brief One AEAD box: the unit exchanged for the manifest and every chunk.
 *
 * Wire layout: 12-byte nonce || ciphertext || 16-byte tag.
 */
struct EncryptedPayload {
    static constexpr size_t NONCE_SIZE = 12;
    static constexpr size_t TAG_SIZE = 16;
    static constexpr size_t OVERHEAD = NONCE_SIZE + TAG_SIZE;

    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;

    std::vector<uint8_t> serialize() const;

    /**
     * @throws ProtocolError(MALFORMED_PAYLOAD) if shorter than OVERHEAD
     */
    static EncryptedPayload parse(const std::vector<uint8_t>& wire);

    // ciphertext || tag, the form the AEAD primitive consumes
    std::vector<uint8_t> sealed() const;
    static EncryptedPayload fromSealed(std::vector<uint8_t> nonce, const std::vector<uint8_t>& sealed);

    static size_t wireSize(size_t plaintextSize) { return plaintextSize + OVERHEAD; }

    bool operator==(const EncryptedPayload& other) const {
        return nonce == other.nonce && ciphertext == other.ciphertext && tag == other.tag;
    }
};

} // namespace CipherLink
