#include "P2PTypes.h"
#include "Config.h"
#include "Crypto.h"
#include "Errors.h"
#include <json/json.h>
#include <sstream>

namespace CipherLink {
namespace Transport {

namespace {
    // Missing fields read as empty; fields of any other JSON type are malformed
    std::string stringField(const Json::Value& root, const char* name) {
        const Json::Value& value = root[name];
        if (value.isNull()) {
            return "";
        }
        if (!value.isString()) {
            throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
                                std::string("P2P envelope field '") + name + "' is not a string");
        }
        return value.asString();
    }
}

std::string toString(IceMode mode) {
    return mode == IceMode::Relay ? "relay" : "direct";
}

P2POptions P2POptions::fromConfig(const Config& config) {
    P2POptions options;
    options.pollInterval = std::chrono::milliseconds(config.getInt64("p2p.poll_interval_ms", 800));
    options.ackTimeout = std::chrono::milliseconds(config.getInt64("p2p.ack_timeout_ms", 10000));
    options.openTimeout = std::chrono::milliseconds(config.getInt64("p2p.open_timeout_ms", 15000));
    options.maxPending = config.getSize("p2p.max_pending", 8);
    options.maxCachedChunks = config.getSize("p2p.max_cached_chunks", 64);
    return options;
}

P2PEnvelope P2PEnvelope::chunk(const std::string& transferId, uint64_t offset, std::vector<uint8_t> payload) {
    P2PEnvelope envelope;
    envelope.type = Type::Chunk;
    envelope.transferId = transferId;
    envelope.offset = offset;
    envelope.payload = std::move(payload);
    return envelope;
}

P2PEnvelope P2PEnvelope::ack(const std::string& transferId, uint64_t offset) {
    P2PEnvelope envelope;
    envelope.type = Type::Ack;
    envelope.transferId = transferId;
    envelope.offset = offset;
    return envelope;
}

P2PEnvelope P2PEnvelope::fallback(const std::string& reason) {
    P2PEnvelope envelope;
    envelope.type = Type::Fallback;
    envelope.reason = reason;
    return envelope;
}

std::string P2PEnvelope::encode() const {
    Json::Value root;
    switch (type) {
        case Type::Chunk:
            root["type"] = "chunk";
            root["transfer_id"] = transferId;
            root["offset"] = Json::UInt64(offset);
            root["payload"] = Crypto::toBase64(payload);
            break;
        case Type::Ack:
            root["type"] = "ack";
            root["transfer_id"] = transferId;
            root["offset"] = Json::UInt64(offset);
            break;
        case Type::Fallback:
            root["type"] = "fallback";
            if (!reason.empty()) {
                root["reason"] = reason;
            }
            break;
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, root);
}

P2PEnvelope P2PEnvelope::decode(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "Invalid P2P envelope: " + errors);
    }

    P2PEnvelope envelope;
    std::string type = stringField(root, "type");
    if (type == "fallback") {
        envelope.type = Type::Fallback;
        envelope.reason = stringField(root, "reason");
        return envelope;
    }

    if (type == "chunk") {
        envelope.type = Type::Chunk;
    } else if (type == "ack") {
        envelope.type = Type::Ack;
    } else {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "Unknown P2P envelope type: " + type);
    }

    const Json::Value& offset = root["offset"];
    envelope.transferId = stringField(root, "transfer_id");
    if (envelope.transferId.empty() || !offset.isUInt64()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "P2P envelope needs transfer_id and offset");
    }
    envelope.offset = offset.asUInt64();

    if (envelope.type == Type::Chunk) {
        try {
            envelope.payload = Crypto::fromBase64(stringField(root, "payload"));
        } catch (const std::invalid_argument& e) {
            throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, std::string("Bad chunk payload: ") + e.what());
        }
    }
    return envelope;
}

} // namespace Transport
} // namespace CipherLink
