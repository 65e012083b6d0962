#include "FallbackTransport.h"
#include "TransportError.h"
#include "Logger.h"
#include <utility>

namespace CipherLink {
namespace Transport {

FallbackTransport::FallbackTransport(TransportPtr primary, TransportPtr fallback, FallbackCallback onFallback)
    : primary_(std::move(primary))
    , fallback_(std::move(fallback))
    , onFallback_(std::move(onFallback))
{
}

template<typename Fn>
auto FallbackTransport::route(Fn&& call) -> decltype(call(std::declval<ITransport&>())) {
    if (!switched_.load()) {
        try {
            return call(*primary_);
        } catch (const TransportError& e) {
            if (!e.isUnavailable()) {
                throw;
            }
            switchToFallback(e.what());
        }
    }
    return call(*fallback_);
}

bool FallbackTransport::switchToFallback(const std::string& reason) {
    bool expected = false;
    if (!switched_.compare_exchange_strong(expected, true)) {
        return false;
    }
    Logger::instance().log(LogLevel::WARN,
        "Falling back from " + primary_->name() + " to " + fallback_->name() + ": " + reason,
        "FallbackTransport");
    if (onFallback_) {
        onFallback_(reason);
    }
    return true;
}

bool FallbackTransport::forceFallback(const std::string& reason) {
    if (switched_.load()) {
        return false;
    }
    primary_->forceFallback(reason);
    return switchToFallback(reason);
}

std::string FallbackTransport::name() const {
    return switched_.load() ? fallback_->name() : primary_->name();
}

std::string FallbackTransport::initTransfer(
    const std::string& sessionId,
    const std::string& transferToken,
    const std::vector<uint8_t>& manifestCiphertext,
    uint64_t totalBytes,
    const std::optional<std::string>& transferId) {
    return route([&](ITransport& t) {
        return t.initTransfer(sessionId, transferToken, manifestCiphertext, totalBytes, transferId);
    });
}

void FallbackTransport::sendChunk(const std::string& sessionId, const std::string& transferId,
                                  const std::string& transferToken, uint64_t offset,
                                  const std::vector<uint8_t>& data) {
    route([&](ITransport& t) {
        t.sendChunk(sessionId, transferId, transferToken, offset, data);
    });
}

void FallbackTransport::finalizeTransfer(const std::string& sessionId, const std::string& transferId,
                                         const std::string& transferToken) {
    route([&](ITransport& t) {
        t.finalizeTransfer(sessionId, transferId, transferToken);
    });
}

std::vector<uint8_t> FallbackTransport::fetchManifest(const std::string& sessionId,
                                                      const std::string& transferId,
                                                      const std::string& transferToken) {
    return route([&](ITransport& t) {
        return t.fetchManifest(sessionId, transferId, transferToken);
    });
}

std::vector<uint8_t> FallbackTransport::fetchRange(const std::string& sessionId,
                                                   const std::string& transferId,
                                                   const std::string& transferToken,
                                                   uint64_t offset, uint64_t length) {
    if (switched_.load()) {
        if (auto cached = primary_->takeCachedRange(transferId, offset)) {
            return std::move(*cached);
        }
    }
    return route([&](ITransport& t) {
        return t.fetchRange(sessionId, transferId, transferToken, offset, length);
    });
}

void FallbackTransport::sendReceipt(const std::string& sessionId, const std::string& transferId,
                                    const std::string& transferToken) {
    route([&](ITransport& t) {
        t.sendReceipt(sessionId, transferId, transferToken);
    });
}

ScanSession FallbackTransport::scanInit(const std::string& sessionId, const std::string& transferId,
                                        const std::string& transferToken, uint64_t totalBytes,
                                        uint32_t chunkSize) {
    return route([&](ITransport& t) {
        return t.scanInit(sessionId, transferId, transferToken, totalBytes, chunkSize);
    });
}

void FallbackTransport::scanChunk(const std::string& scanId, const std::string& transferToken,
                                  uint64_t chunkIndex, const std::vector<uint8_t>& data) {
    route([&](ITransport& t) {
        t.scanChunk(scanId, transferToken, chunkIndex, data);
    });
}

std::string FallbackTransport::scanFinalize(const std::string& scanId, const std::string& transferToken) {
    return route([&](ITransport& t) {
        return t.scanFinalize(scanId, transferToken);
    });
}

} // namespace Transport
} // namespace CipherLink
