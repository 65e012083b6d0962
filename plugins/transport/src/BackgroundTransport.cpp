#include "BackgroundTransport.h"
#include "FallbackTransport.h"
#include "TransportError.h"
#include "Logger.h"

namespace CipherLink {
namespace Transport {

BackgroundTransport::BackgroundTransport(std::shared_ptr<IBackgroundTransferService> service,
                                         std::shared_ptr<HttpTransport> relay)
    : service_(std::move(service))
    , relay_(std::move(relay))
{
}

void BackgroundTransport::requireService() {
    std::lock_guard<std::mutex> lock(probeMutex_);
    if (!available_) {
        available_ = service_ && service_->isAvailable();
        Logger::instance().log(LogLevel::INFO,
            std::string("Background transfer service ") + (*available_ ? "available" : "unavailable"),
            "BackgroundTransport");
    }
    if (!*available_) {
        throw TransportError::unavailable("Background transfer service is unavailable");
    }
}

std::vector<uint8_t> BackgroundTransport::fetchVia(const HttpRequest& request, const std::string& operation) {
    requireService();
    auto bytes = service_->fetch(request);
    if (bytes) {
        return std::move(*bytes);
    }
    // The service declined this one request; serve it directly
    return relay_->execute(request, operation).body;
}

std::string BackgroundTransport::initTransfer(
    const std::string& sessionId,
    const std::string& transferToken,
    const std::vector<uint8_t>& manifestCiphertext,
    uint64_t totalBytes,
    const std::optional<std::string>& transferId) {
    requireService();
    return relay_->initTransfer(sessionId, transferToken, manifestCiphertext, totalBytes, transferId);
}

void BackgroundTransport::sendChunk(const std::string& sessionId, const std::string& transferId,
                                    const std::string& transferToken, uint64_t offset,
                                    const std::vector<uint8_t>& data) {
    requireService();
    relay_->sendChunk(sessionId, transferId, transferToken, offset, data);
}

void BackgroundTransport::finalizeTransfer(const std::string& sessionId, const std::string& transferId,
                                           const std::string& transferToken) {
    requireService();
    relay_->finalizeTransfer(sessionId, transferId, transferToken);
}

std::vector<uint8_t> BackgroundTransport::fetchManifest(const std::string& sessionId,
                                                        const std::string& transferId,
                                                        const std::string& transferToken) {
    return fetchVia(relay_->manifestRequest(sessionId, transferId, transferToken), "fetchManifest");
}

std::vector<uint8_t> BackgroundTransport::fetchRange(const std::string& sessionId,
                                                     const std::string& transferId,
                                                     const std::string& transferToken,
                                                     uint64_t offset, uint64_t length) {
    return fetchVia(relay_->rangeRequest(sessionId, transferId, transferToken, offset, length), "fetchRange");
}

void BackgroundTransport::sendReceipt(const std::string& sessionId, const std::string& transferId,
                                      const std::string& transferToken) {
    requireService();
    relay_->sendReceipt(sessionId, transferId, transferToken);
}

ScanSession BackgroundTransport::scanInit(const std::string& sessionId, const std::string& transferId,
                                          const std::string& transferToken, uint64_t totalBytes,
                                          uint32_t chunkSize) {
    requireService();
    return relay_->scanInit(sessionId, transferId, transferToken, totalBytes, chunkSize);
}

void BackgroundTransport::scanChunk(const std::string& scanId, const std::string& transferToken,
                                    uint64_t chunkIndex, const std::vector<uint8_t>& data) {
    requireService();
    relay_->scanChunk(scanId, transferToken, chunkIndex, data);
}

std::string BackgroundTransport::scanFinalize(const std::string& scanId, const std::string& transferToken) {
    requireService();
    return relay_->scanFinalize(scanId, transferToken);
}

TransportPtr makeBackgroundTransport(std::shared_ptr<IBackgroundTransferService> service,
                                     std::shared_ptr<HttpTransport> relay) {
    auto primary = std::make_shared<BackgroundTransport>(std::move(service), relay);
    return std::make_shared<FallbackTransport>(primary, relay);
}

} // namespace Transport
} // namespace CipherLink
