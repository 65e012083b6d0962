#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace CipherLink {

class Config;

namespace Transport {

enum class IceMode {
    Direct,
    Relay   // TURN candidates only
};

std::string toString(IceMode mode);

/**
 * @brief Per-attempt P2P session parameters, discarded on fallback
 */
struct P2PContext {
    std::string sessionId;
    std::string claimId;
    std::string token;        // signaling bearer token
    bool isInitiator = false;
    IceMode iceMode = IceMode::Direct;
};

/**
 * @brief Timing and capacity limits of one P2P session
 */
struct P2POptions {
    std::chrono::milliseconds pollInterval{800};
    std::chrono::milliseconds ackTimeout{10000};
    std::chrono::milliseconds openTimeout{15000};
    std::size_t maxPending = 8;
    std::size_t maxCachedChunks = 64;
    int maxPollFailures = 5;

    static P2POptions fromConfig(const Config& config);
};

/**
 * @brief Data-channel message
 *
 *   {"type":"chunk","transfer_id":T,"offset":O,"payload":"<base64>"}
 *   {"type":"ack","transfer_id":T,"offset":O}
 *   {"type":"fallback","reason":"..."}
 */
struct P2PEnvelope {
    enum class Type {
        Chunk,
        Ack,
        Fallback
    };

    Type type = Type::Chunk;
    std::string transferId;
    uint64_t offset = 0;
    std::vector<uint8_t> payload;
    std::string reason;

    static P2PEnvelope chunk(const std::string& transferId, uint64_t offset, std::vector<uint8_t> payload);
    static P2PEnvelope ack(const std::string& transferId, uint64_t offset);
    static P2PEnvelope fallback(const std::string& reason);

    std::string encode() const;

    /**
     * @throws ProtocolError(MALFORMED_PAYLOAD) for invalid JSON or an unknown type
     */
    static P2PEnvelope decode(const std::string& text);
};

/**
 * @brief One message returned by the signaling poll endpoint
 */
struct SignalMessage {
    enum class Type {
        Offer,
        Answer,
        Ice
    };

    Type type = Type::Offer;
    std::string sdp;
    std::string candidate;
};

/**
 * @brief ICE servers issued by the relay for one claim
 */
struct IceConfig {
    std::vector<std::string> stunUrls;
    std::vector<std::string> turnUrls;
    std::string username;
    std::string credential;
    int ttlSeconds = 0;
};

} // namespace Transport
} // namespace CipherLink
