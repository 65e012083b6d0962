#pragma once

#include "ITransport.h"
#include "IHttpClient.h"
#include <memory>
#include <chrono>

namespace CipherLink {
namespace Transport {

/**
 * @brief Direct request/response transport against the relay's /v1/transfer API
 */
class HttpTransport : public ITransport {
public:
    HttpTransport(std::string baseUrl,
                  std::shared_ptr<IHttpClient> client,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    std::string initTransfer(
        const std::string& sessionId,
        const std::string& transferToken,
        const std::vector<uint8_t>& manifestCiphertext,
        uint64_t totalBytes,
        const std::optional<std::string>& transferId = std::nullopt) override;

    void sendChunk(const std::string& sessionId, const std::string& transferId,
                   const std::string& transferToken, uint64_t offset,
                   const std::vector<uint8_t>& data) override;

    void finalizeTransfer(const std::string& sessionId, const std::string& transferId,
                          const std::string& transferToken) override;

    std::vector<uint8_t> fetchManifest(const std::string& sessionId, const std::string& transferId,
                                       const std::string& transferToken) override;

    std::vector<uint8_t> fetchRange(const std::string& sessionId, const std::string& transferId,
                                    const std::string& transferToken, uint64_t offset,
                                    uint64_t length) override;

    void sendReceipt(const std::string& sessionId, const std::string& transferId,
                     const std::string& transferToken) override;

    ScanSession scanInit(const std::string& sessionId, const std::string& transferId,
                         const std::string& transferToken, uint64_t totalBytes,
                         uint32_t chunkSize) override;

    void scanChunk(const std::string& scanId, const std::string& transferToken,
                   uint64_t chunkIndex, const std::vector<uint8_t>& data) override;

    std::string scanFinalize(const std::string& scanId, const std::string& transferToken) override;

    std::string name() const override { return "http"; }

    // Request builders shared with BackgroundTransport
    HttpRequest manifestRequest(const std::string& sessionId, const std::string& transferId,
                                const std::string& transferToken) const;
    HttpRequest rangeRequest(const std::string& sessionId, const std::string& transferId,
                             const std::string& transferToken, uint64_t offset,
                             uint64_t length) const;

    /**
     * @brief Send a prepared request
     * @throws TransportError::http for status >= 400
     */
    HttpResponse execute(const HttpRequest& request, const std::string& operation);

    const std::string& baseUrl() const { return baseUrl_; }

private:
    HttpRequest jsonPost(const std::string& path, const std::string& body) const;

    std::string baseUrl_;
    std::shared_ptr<IHttpClient> client_;
    std::chrono::milliseconds timeout_;
};

} // namespace Transport
} // namespace CipherLink
