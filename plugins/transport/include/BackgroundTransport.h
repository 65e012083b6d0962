#pragma once

#include "ITransport.h"
#include "HttpTransport.h"
#include <memory>
#include <mutex>
#include <optional>

namespace CipherLink {
namespace Transport {

/**
 * @brief OS-managed download service (URLSession, DownloadManager, ...)
 *
 * Platform bindings implement this. fetch() returns std::nullopt when the
 * service declines the request, in which case the caller uses direct HTTP.
 */
class IBackgroundTransferService {
public:
    virtual ~IBackgroundTransferService() = default;

    virtual bool isAvailable() = 0;
    virtual std::optional<std::vector<uint8_t>> fetch(const HttpRequest& request) = 0;
};

/**
 * @brief Transport that hands manifest and range downloads to the OS service
 *
 * Availability is probed on first use and cached. When the service is
 * missing every call throws TransportError::unavailable so the enclosing
 * FallbackTransport switches to the relay for good. Uploads and control
 * calls always go to the relay.
 */
class BackgroundTransport : public ITransport {
public:
    BackgroundTransport(std::shared_ptr<IBackgroundTransferService> service,
                        std::shared_ptr<HttpTransport> relay);

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

    std::string name() const override { return "background"; }

private:
    void requireService();
    std::vector<uint8_t> fetchVia(const HttpRequest& request, const std::string& operation);

    std::shared_ptr<IBackgroundTransferService> service_;
    std::shared_ptr<HttpTransport> relay_;

    std::mutex probeMutex_;
    std::optional<bool> available_;
};

/**
 * @brief FallbackTransport(BackgroundTransport(service, relay), relay)
 */
TransportPtr makeBackgroundTransport(std::shared_ptr<IBackgroundTransferService> service,
                                     std::shared_ptr<HttpTransport> relay);

} // namespace Transport
} // namespace CipherLink
