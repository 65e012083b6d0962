#include "HttpTransport.h"
#include "TransportError.h"
#include "Crypto.h"
#include "LoggerMacros.h"
#include <json/json.h>
#include <sstream>

namespace CipherLink {
namespace Transport {

namespace {

std::string writeCompact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parseBody(const HttpResponse& response, const std::string& operation) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(response.bodyText());
    if (!Json::parseFromStream(builder, stream, &root, &errors) || !root.isObject()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
            operation + " returned a malformed body: " + errors);
    }
    return root;
}

// Missing fields read as empty; fields of any other JSON type are malformed
std::string stringField(const Json::Value& payload, const char* name, const std::string& operation) {
    const Json::Value& value = payload[name];
    if (value.isNull()) {
        return "";
    }
    if (!value.isString()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD,
            operation + " response field '" + name + "' is not a string");
    }
    return value.asString();
}

std::string bearer(const std::string& token) {
    return "Bearer " + token;
}

} // namespace

HttpTransport::HttpTransport(std::string baseUrl,
                             std::shared_ptr<IHttpClient> client,
                             std::chrono::milliseconds timeout)
    : baseUrl_(std::move(baseUrl))
    , client_(std::move(client))
    , timeout_(timeout)
{
}

HttpRequest HttpTransport::jsonPost(const std::string& path, const std::string& body) const {
    HttpRequest request;
    request.method = "POST";
    request.url = buildUrl(baseUrl_, path);
    request.headers["Content-Type"] = "application/json";
    request.body.assign(body.begin(), body.end());
    request.timeout = timeout_;
    return request;
}

HttpResponse HttpTransport::execute(const HttpRequest& request, const std::string& operation) {
    HttpResponse response = client_->send(request);
    if (response.status >= 400) {
        LOG_WARN_COMP(operation + " failed with HTTP " + std::to_string(response.status), "HttpTransport");
        throw TransportError::http(response.status, operation);
    }
    return response;
}

std::string HttpTransport::initTransfer(
    const std::string& sessionId,
    const std::string& transferToken,
    const std::vector<uint8_t>& manifestCiphertext,
    uint64_t totalBytes,
    const std::optional<std::string>& transferId) {

    Json::Value body;
    body["session_id"] = sessionId;
    body["transfer_token"] = transferToken;
    body["file_manifest_ciphertext_b64"] = Crypto::toBase64(manifestCiphertext);
    body["total_bytes"] = Json::UInt64(totalBytes);
    if (transferId && !transferId->empty()) {
        body["transfer_id"] = *transferId;
    }

    auto response = execute(jsonPost("/v1/transfer/init", writeCompact(body)), "initTransfer");
    auto payload = parseBody(response, "initTransfer");
    std::string assigned = stringField(payload, "transfer_id", "initTransfer");
    if (assigned.empty()) {
        throw ProtocolError(Core::ErrorCode::MISSING_TRANSFER_ID, "initTransfer response has no transfer_id");
    }
    return assigned;
}

void HttpTransport::sendChunk(const std::string& sessionId, const std::string& transferId,
                              const std::string& transferToken, uint64_t offset,
                              const std::vector<uint8_t>& data) {
    HttpRequest request;
    request.method = "PUT";
    request.url = buildUrl(baseUrl_, "/v1/transfer/chunk");
    request.headers["Content-Type"] = "application/octet-stream";
    request.headers["Authorization"] = bearer(transferToken);
    request.headers["session_id"] = sessionId;
    request.headers["transfer_id"] = transferId;
    request.headers["offset"] = std::to_string(offset);
    request.body = data;
    request.timeout = timeout_;
    execute(request, "sendChunk");
}

void HttpTransport::finalizeTransfer(const std::string& sessionId, const std::string& transferId,
                                     const std::string& transferToken) {
    Json::Value body;
    body["session_id"] = sessionId;
    body["transfer_id"] = transferId;
    body["transfer_token"] = transferToken;
    execute(jsonPost("/v1/transfer/finalize", writeCompact(body)), "finalizeTransfer");
}

HttpRequest HttpTransport::manifestRequest(const std::string& sessionId, const std::string& transferId,
                                           const std::string& transferToken) const {
    HttpRequest request;
    request.url = buildUrl(baseUrl_, "/v1/transfer/manifest",
        {{"session_id", sessionId}, {"transfer_id", transferId}});
    request.headers["Authorization"] = bearer(transferToken);
    request.timeout = timeout_;
    return request;
}

HttpRequest HttpTransport::rangeRequest(const std::string& sessionId, const std::string& transferId,
                                        const std::string& transferToken, uint64_t offset,
                                        uint64_t length) const {
    HttpRequest request;
    request.url = buildUrl(baseUrl_, "/v1/transfer/download",
        {{"session_id", sessionId}, {"transfer_id", transferId}});
    request.headers["Authorization"] = bearer(transferToken);
    uint64_t last = length == 0 ? offset : offset + length - 1;
    request.headers["Range"] = "bytes=" + std::to_string(offset) + "-" + std::to_string(last);
    request.timeout = timeout_;
    return request;
}

std::vector<uint8_t> HttpTransport::fetchManifest(const std::string& sessionId, const std::string& transferId,
                                                  const std::string& transferToken) {
    return execute(manifestRequest(sessionId, transferId, transferToken), "fetchManifest").body;
}

std::vector<uint8_t> HttpTransport::fetchRange(const std::string& sessionId, const std::string& transferId,
                                               const std::string& transferToken, uint64_t offset,
                                               uint64_t length) {
    return execute(rangeRequest(sessionId, transferId, transferToken, offset, length), "fetchRange").body;
}

void HttpTransport::sendReceipt(const std::string& sessionId, const std::string& transferId,
                                const std::string& transferToken) {
    Json::Value body;
    body["session_id"] = sessionId;
    body["transfer_id"] = transferId;
    body["transfer_token"] = transferToken;
    body["status"] = "complete";
    execute(jsonPost("/v1/transfer/receipt", writeCompact(body)), "sendReceipt");
}

ScanSession HttpTransport::scanInit(const std::string& sessionId, const std::string& transferId,
                                    const std::string& transferToken, uint64_t totalBytes,
                                    uint32_t chunkSize) {
    Json::Value body;
    body["session_id"] = sessionId;
    body["transfer_id"] = transferId;
    body["transfer_token"] = transferToken;
    body["total_bytes"] = Json::UInt64(totalBytes);
    body["chunk_size"] = Json::UInt(chunkSize);

    auto response = execute(jsonPost("/v1/transfer/scan_init", writeCompact(body)), "scanInit");
    auto payload = parseBody(response, "scanInit");

    ScanSession session;
    session.scanId = stringField(payload, "scan_id", "scanInit");
    session.scanKeyB64 = stringField(payload, "scan_key_b64", "scanInit");
    if (session.scanId.empty() || session.scanKeyB64.empty()) {
        throw ProtocolError(Core::ErrorCode::MALFORMED_PAYLOAD, "scanInit response is missing scan_id or scan_key_b64");
    }
    return session;
}

void HttpTransport::scanChunk(const std::string& scanId, const std::string& transferToken,
                              uint64_t chunkIndex, const std::vector<uint8_t>& data) {
    HttpRequest request;
    request.method = "PUT";
    request.url = buildUrl(baseUrl_, "/v1/transfer/scan_chunk");
    request.headers["Content-Type"] = "application/octet-stream";
    request.headers["Authorization"] = bearer(transferToken);
    request.headers["scan_id"] = scanId;
    request.headers["chunk_index"] = std::to_string(chunkIndex);
    request.body = data;
    request.timeout = timeout_;
    execute(request, "scanChunk");
}

std::string HttpTransport::scanFinalize(const std::string& scanId, const std::string& transferToken) {
    Json::Value body;
    body["scan_id"] = scanId;
    body["transfer_token"] = transferToken;
    auto response = execute(jsonPost("/v1/transfer/scan_finalize", writeCompact(body)), "scanFinalize");
    return stringField(parseBody(response, "scanFinalize"), "status", "scanFinalize");
}

} // namespace Transport
} // namespace CipherLink
