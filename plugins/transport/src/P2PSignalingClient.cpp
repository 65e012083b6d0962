#include "P2PSignalingClient.h"
#include "TransportError.h"
#include "LoggerMacros.h"
#include <json/json.h>
#include <sstream>

namespace CipherLink {
namespace Transport {

namespace {

Json::Value parseObject(const HttpResponse& response, const std::string& operation) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(response.bodyText());
    if (!Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, operation + " returned a malformed body");
    }
    return root;
}

std::string stringField(const Json::Value& object, const char* name, const std::string& operation) {
    const Json::Value& value = object[name];
    if (value.isNull()) {
        return "";
    }
    if (!value.isString()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
                            operation + " field '" + name + "' is not a string");
    }
    return value.asString();
}

std::vector<std::string> stringArray(const Json::Value& object, const char* name, const std::string& operation) {
    const Json::Value& value = object[name];
    std::vector<std::string> out;
    if (value.isNull()) {
        return out;
    }
    if (!value.isArray()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
                            operation + " field '" + name + "' is not an array");
    }
    for (const auto& item : value) {
        if (item.isString()) {
            out.push_back(item.asString());
        }
    }
    return out;
}

} // namespace

P2PSignalingClient::P2PSignalingClient(std::string baseUrl,
                                       std::shared_ptr<IHttpClient> client,
                                       P2PContext context,
                                       std::chrono::milliseconds timeout)
    : baseUrl_(std::move(baseUrl))
    , client_(std::move(client))
    , context_(std::move(context))
    , timeout_(timeout)
{
}

void P2PSignalingClient::postJson(const std::string& path, const std::string& field,
                                  const std::string& value, const std::string& operation) {
    Json::Value body;
    body["session_id"] = context_.sessionId;
    body["claim_id"] = context_.claimId;
    body[field] = value;

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::string text = Json::writeString(writer, body);

    HttpRequest request;
    request.method = "POST";
    request.url = buildUrl(baseUrl_, path);
    request.headers["Content-Type"] = "application/json";
    request.headers["Authorization"] = "Bearer " + context_.token;
    request.body.assign(text.begin(), text.end());
    request.timeout = timeout_;

    auto response = client_->send(request);
    if (response.status >= 400) {
        throw TransportError::http(response.status, operation);
    }
}

HttpResponse P2PSignalingClient::get(const std::string& path,
                                     std::vector<std::pair<std::string, std::string>> query,
                                     const std::string& operation) {
    query.insert(query.begin(), {{"session_id", context_.sessionId}, {"claim_id", context_.claimId}});

    HttpRequest request;
    request.url = buildUrl(baseUrl_, path, query);
    request.headers["Authorization"] = "Bearer " + context_.token;
    request.timeout = timeout_;

    auto response = client_->send(request);
    if (response.status == 409) {
        throw TransportError::unavailable(operation + " rejected by relay (409)");
    }
    if (response.status >= 400) {
        throw TransportError::http(response.status, operation);
    }
    return response;
}

void P2PSignalingClient::postOffer(const std::string& sdp) {
    postJson("/v1/p2p/offer", "sdp", sdp, "postOffer");
}

void P2PSignalingClient::postAnswer(const std::string& sdp) {
    postJson("/v1/p2p/answer", "sdp", sdp, "postAnswer");
}

void P2PSignalingClient::postIce(const std::string& candidate) {
    postJson("/v1/p2p/ice", "candidate", candidate, "postIce");
}

std::vector<SignalMessage> P2PSignalingClient::poll() {
    auto root = parseObject(get("/v1/p2p/poll", {}, "poll"), "poll");

    const Json::Value& list = root["messages"];
    if (!list.isNull() && !list.isArray()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "poll field 'messages' is not an array");
    }

    std::vector<SignalMessage> messages;
    for (const auto& item : list) {
        if (!item.isObject()) {
            throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "poll returned a non-object message");
        }
        std::string type = stringField(item, "type", "poll");
        SignalMessage message;
        if (type == "offer") {
            message.type = SignalMessage::Type::Offer;
            message.sdp = stringField(item, "sdp", "poll");
        } else if (type == "answer") {
            message.type = SignalMessage::Type::Answer;
            message.sdp = stringField(item, "sdp", "poll");
        } else if (type == "ice") {
            message.type = SignalMessage::Type::Ice;
            message.candidate = stringField(item, "candidate", "poll");
        } else {
            LOG_DEBUG_COMP_IF("Ignoring signaling message of type '" + type + "'", "P2PSignaling");
            continue;
        }
        messages.push_back(std::move(message));
    }
    return messages;
}

IceConfig P2PSignalingClient::fetchIceConfig() {
    auto root = parseObject(get("/v1/p2p/ice_config", {{"mode", toString(context_.iceMode)}}, "fetchIceConfig"),
                            "fetchIceConfig");

    IceConfig config;
    config.stunUrls = stringArray(root, "stun_urls", "fetchIceConfig");
    config.turnUrls = stringArray(root, "turn_urls", "fetchIceConfig");
    config.username = stringField(root, "username", "fetchIceConfig");
    config.credential = stringField(root, "credential", "fetchIceConfig");
    const Json::Value& ttl = root["ttl_seconds"];
    if (!ttl.isNull() && !ttl.isInt()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "fetchIceConfig field 'ttl_seconds' is not an integer");
    }
    config.ttlSeconds = ttl.isNull() ? 0 : ttl.asInt();

    if (context_.iceMode == IceMode::Relay && config.turnUrls.empty()) {
        throw TransportError::unavailable("Relay-only ICE requested but no TURN servers were issued");
    }
    return config;
}

} // namespace Transport
} // namespace CipherLink
