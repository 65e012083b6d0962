#pragma once

/**
 * @file ITransport.h
 * @brief Transport abstraction for CipherLink
 *
 * Every transport moves opaque encrypted bytes between the sender, the
 * relay and the receiver. Implementations:
 * - HttpTransport: stateless request/response against the relay
 * - BackgroundTransport: OS-managed download service with relay fallback
 * - P2PTransport: WebRTC data channel with relay fallback
 *
 * FallbackTransport composes any two of them.
 */

#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace CipherLink {
namespace Transport {

/**
 * @brief Scan session issued by the relay
 */
struct ScanSession {
    std::string scanId;
    std::string scanKeyB64;   // URL-safe base64 of the 32-byte scan key
};

/**
 * @brief Uniform operation set shared by all transports
 *
 * Every call may throw TransportError (status-bearing) or ProtocolError.
 * Offsets and lengths address the encrypted byte stream.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Register a transfer and upload its encrypted manifest
     * @param transferId Client-chosen id; the relay registers the transfer under it when given
     * @return Server-assigned transfer id
     * @throws ProtocolError(MISSING_TRANSFER_ID) if the relay omits it
     */
    virtual std::string initTransfer(
        const std::string& sessionId,
        const std::string& transferToken,
        const std::vector<uint8_t>& manifestCiphertext,
        uint64_t totalBytes,
        const std::optional<std::string>& transferId = std::nullopt) = 0;

    virtual void sendChunk(
        const std::string& sessionId,
        const std::string& transferId,
        const std::string& transferToken,
        uint64_t offset,
        const std::vector<uint8_t>& data) = 0;

    virtual void finalizeTransfer(
        const std::string& sessionId,
        const std::string& transferId,
        const std::string& transferToken) = 0;

    virtual std::vector<uint8_t> fetchManifest(
        const std::string& sessionId,
        const std::string& transferId,
        const std::string& transferToken) = 0;

    /**
     * @brief Fetch [offset, offset + length) of the encrypted stream
     */
    virtual std::vector<uint8_t> fetchRange(
        const std::string& sessionId,
        const std::string& transferId,
        const std::string& transferToken,
        uint64_t offset,
        uint64_t length) = 0;

    virtual void sendReceipt(
        const std::string& sessionId,
        const std::string& transferId,
        const std::string& transferToken) = 0;

    virtual ScanSession scanInit(
        const std::string& sessionId,
        const std::string& transferId,
        const std::string& transferToken,
        uint64_t totalBytes,
        uint32_t chunkSize) = 0;

    virtual void scanChunk(
        const std::string& scanId,
        const std::string& transferToken,
        uint64_t chunkIndex,
        const std::vector<uint8_t>& data) = 0;

    /**
     * @return clean, pending, failed or not_required
     */
    virtual std::string scanFinalize(
        const std::string& scanId,
        const std::string& transferToken) = 0;

    /**
     * @brief Request a one-way switch to the slower fallback path
     * @return true if this call caused the switch
     */
    virtual bool forceFallback(const std::string& /*reason*/) {
        return false;
    }

    /**
     * @brief Data already delivered for (transferId, offset) that outlives the transport's own path
     *
     * Lets a fallback decorator keep serving chunks the peer pushed before the switch.
     */
    virtual std::optional<std::vector<uint8_t>> takeCachedRange(const std::string& /*transferId*/,
                                                                uint64_t /*offset*/) {
        return std::nullopt;
    }

    virtual std::string name() const = 0;
};

using TransportPtr = std::shared_ptr<ITransport>;

} // namespace Transport
} // namespace CipherLink
