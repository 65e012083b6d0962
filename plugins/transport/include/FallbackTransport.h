#pragma once

#include "ITransport.h"
#include <atomic>
#include <functional>
#include <utility>

namespace CipherLink {
namespace Transport {

/**
 * @brief Routes calls to a primary transport until it becomes unavailable
 *
 * The switch happens when the primary throws an Unavailable TransportError
 * or when forceFallback() is called. It is one-way: once switched, every
 * call goes to the fallback for the lifetime of this object. The call
 * that triggered the switch is replayed on the fallback, and onFallback
 * fires exactly once.
 */
class FallbackTransport : public ITransport {
public:
    using FallbackCallback = std::function<void(const std::string& reason)>;

    FallbackTransport(TransportPtr primary, TransportPtr fallback, FallbackCallback onFallback = nullptr);

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

    bool forceFallback(const std::string& reason) override;

    std::string name() const override;

    bool usingFallback() const { return switched_.load(); }

private:
    template<typename Fn>
    auto route(Fn&& call) -> decltype(call(std::declval<ITransport&>()));

    bool switchToFallback(const std::string& reason);

    TransportPtr primary_;
    TransportPtr fallback_;
    FallbackCallback onFallback_;
    std::atomic<bool> switched_{false};
};

} // namespace Transport
} // namespace CipherLink
