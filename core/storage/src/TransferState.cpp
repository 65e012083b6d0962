#include "TransferState.h"
#include "Errors.h"
#include <chrono>

namespace CipherLink {

std::string toString(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Queued: return "queued";
        case TransferStatus::Uploading: return "uploading";
        case TransferStatus::Downloading: return "downloading";
        case TransferStatus::Paused: return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Failed: return "failed";
    }
    return "failed";
}

std::optional<TransferDirection> parseDirection(const std::string& value) {
    if (value == "upload") return TransferDirection::Upload;
    if (value == "download") return TransferDirection::Download;
    return std::nullopt;
}

std::optional<TransferStatus> parseStatus(const std::string& value) {
    if (value == "queued") return TransferStatus::Queued;
    if (value == "uploading") return TransferStatus::Uploading;
    if (value == "downloading") return TransferStatus::Downloading;
    if (value == "paused") return TransferStatus::Paused;
    if (value == "completed") return TransferStatus::Completed;
    if (value == "failed") return TransferStatus::Failed;
    return std::nullopt;
}

Json::Value TransferState::toJson() const {
    Json::Value root;
    root["transfer_id"] = transferId;
    root["session_id"] = sessionId;
    root["transfer_token"] = transferToken;
    root["direction"] = toString(direction);
    root["status"] = toString(status);
    root["total_bytes"] = Json::UInt64(totalBytes);
    root["chunk_size"] = Json::UInt(chunkSize);
    root["next_offset"] = Json::UInt64(nextOffset);
    root["next_chunk_index"] = Json::UInt64(nextChunkIndex);
    root["peer_public_key_b64"] = peerPublicKeyB64;
    root["payload_path"] = payloadPath;
    root["scan_required"] = scanRequired;
    root["claim_id"] = claimId;
    root["destination"] = destination;
    root["manifest_path"] = manifestPath;
    root["updated_at_ms"] = Json::Int64(updatedAtMs);
    root["attempt"] = attempt;
    root["error_message"] = errorMessage;
    return root;
}

namespace {

void readFields(const Json::Value& value, TransferState& state) {
    state.transferId = value["transfer_id"].asString();
    state.sessionId = value.get("session_id", "").asString();
    state.transferToken = value.get("transfer_token", "").asString();
    state.totalBytes = value.get("total_bytes", 0).asUInt64();
    state.chunkSize = value.get("chunk_size", 0).asUInt();
    state.nextOffset = value.get("next_offset", 0).asUInt64();
    state.nextChunkIndex = value.get("next_chunk_index", 0).asUInt64();
    state.peerPublicKeyB64 = value.get("peer_public_key_b64", "").asString();
    state.payloadPath = value.get("payload_path", "").asString();
    state.scanRequired = value.get("scan_required", false).asBool();
    state.claimId = value.get("claim_id", "").asString();
    state.destination = value.get("destination", "").asString();
    state.manifestPath = value.get("manifest_path", "").asString();
    state.updatedAtMs = value.get("updated_at_ms", 0).asInt64();
    state.attempt = value.get("attempt", 0).asInt();
    state.errorMessage = value.get("error_message", "").asString();
}

} // namespace

TransferState TransferState::fromJson(const Json::Value& value) {
    if (!value.isObject() || !value["transfer_id"].isString() || value["transfer_id"].asString().empty()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "Transfer state record has no transfer_id");
    }

    const Json::Value& directionField = value["direction"];
    const Json::Value& statusField = value["status"];
    std::optional<TransferDirection> direction;
    std::optional<TransferStatus> status;
    if (directionField.isString()) {
        direction = parseDirection(directionField.asString());
    }
    if (statusField.isString()) {
        status = parseStatus(statusField.asString());
    }
    if (!direction || !status) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
                            "Transfer state record has unknown direction or status");
    }

    TransferState state;
    try {
        readFields(value, state);
    } catch (const Json::Exception& e) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
                            std::string("Transfer state record has a mistyped field: ") + e.what());
    }
    state.direction = *direction;
    state.status = *status;
    return state;
}

int64_t currentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace CipherLink
