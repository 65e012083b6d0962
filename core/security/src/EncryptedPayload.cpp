#include "EncryptedPayload.h"
#include "Errors.h"
#include <string>

namespace CipherLink {

std::vector<uint8_t> EncryptedPayload::serialize() const {
    std::vector<uint8_t> wire;
    wire.reserve(nonce.size() + ciphertext.size() + tag.size());
    wire.insert(wire.end(), nonce.begin(), nonce.end());
    wire.insert(wire.end(), ciphertext.begin(), ciphertext.end());
    wire.insert(wire.end(), tag.begin(), tag.end());
    return wire;
}

EncryptedPayload EncryptedPayload::parse(const std::vector<uint8_t>& wire) {
    if (wire.size() < OVERHEAD) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
                            "Encrypted payload too short: " + std::to_string(wire.size()) + " bytes");
    }
    EncryptedPayload payload;
    payload.nonce.assign(wire.begin(), wire.begin() + NONCE_SIZE);
    payload.ciphertext.assign(wire.begin() + NONCE_SIZE, wire.end() - TAG_SIZE);
    payload.tag.assign(wire.end() - TAG_SIZE, wire.end());
    return payload;
}

std::vector<uint8_t> EncryptedPayload::sealed() const {
    std::vector<uint8_t> out;
    out.reserve(ciphertext.size() + tag.size());
    out.insert(out.end(), ciphertext.begin(), ciphertext.end());
    out.insert(out.end(), tag.begin(), tag.end());
    return out;
}

EncryptedPayload EncryptedPayload::fromSealed(std::vector<uint8_t> nonce, const std::vector<uint8_t>& sealed) {
    if (sealed.size() < TAG_SIZE) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "Sealed box shorter than tag");
    }
    EncryptedPayload payload;
    payload.nonce = std::move(nonce);
    payload.ciphertext.assign(sealed.begin(), sealed.end() - TAG_SIZE);
    payload.tag.assign(sealed.end() - TAG_SIZE, sealed.end());
    return payload;
}

} // namespace CipherLink
