#include "PeerNegotiator.h"
#include "TransportError.h"
#include "Logger.h"
#include "LoggerMacros.h"

namespace CipherLink {
namespace Transport {

PeerNegotiator::PeerNegotiator(std::shared_ptr<P2PSignalingClient> signaling,
                               IPeerConnection& connection,
                               P2POptions options,
                               FailureCallback onFailure)
    : signaling_(std::move(signaling))
    , connection_(connection)
    , options_(options)
    , onFailure_(std::move(onFailure))
{
}

PeerNegotiator::~PeerNegotiator() {
    stop();
}

void PeerNegotiator::start() {
    if (pollThread_.joinable()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = false;
    }
    pollThread_ = std::thread(&PeerNegotiator::pollLoop, this);
}

void PeerNegotiator::stop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        stopRequested_ = true;
    }
    stopCv_.notify_all();
    if (pollThread_.joinable()) {
        pollThread_.join();
    }
}

void PeerNegotiator::pollLoop() {
    while (true) {
        bool keepPolling = false;
        try {
            keepPolling = pollOnce();
        } catch (const std::exception& e) {
            fail(std::string("signaling poll aborted: ") + e.what());
        }
        if (!keepPolling) {
            return;
        }
        std::unique_lock<std::mutex> lock(stopMutex_);
        if (stopCv_.wait_for(lock, options_.pollInterval, [this] { return stopRequested_; })) {
            return;
        }
    }
}

bool PeerNegotiator::pollOnce() {
    if (failed_.load()) {
        return false;
    }

    std::vector<SignalMessage> messages;
    try {
        messages = signaling_->poll();
        std::lock_guard<std::mutex> lock(mutex_);
        consecutiveFailures_ = 0;
    } catch (const TransportError& e) {
        int failures = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            failures = ++consecutiveFailures_;
        }
        if (e.isUnavailable() || failures >= options_.maxPollFailures) {
            fail(std::string("signaling poll failed: ") + e.what());
            return false;
        }
        LOG_WARN_COMP("Signaling poll failed (" + std::to_string(failures) + "): " + e.what(), "PeerNegotiator");
        return true;
    } catch (const ProtocolError& e) {
        fail(std::string("malformed signaling response: ") + e.what());
        return false;
    }

    for (const auto& message : messages) {
        handle(message);
        if (failed_.load()) {
            return false;
        }
    }
    return true;
}

void PeerNegotiator::handle(const SignalMessage& message) {
    const bool initiator = signaling_->context().isInitiator;

    switch (message.type) {
        case SignalMessage::Type::Offer:
            if (initiator) {
                LOG_DEBUG_COMP_IF("Initiator ignores remote offer", "PeerNegotiator");
                return;
            }
            applyRemoteDescription(message);
            return;
        case SignalMessage::Type::Answer:
            if (!initiator) {
                LOG_DEBUG_COMP_IF("Responder ignores remote answer", "PeerNegotiator");
                return;
            }
            applyRemoteDescription(message);
            return;
        case SignalMessage::Type::Ice:
            break;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!remoteDescriptionSet_) {
            queuedCandidates_.push_back(message.candidate);
            return;
        }
    }
    try {
        connection_.addRemoteCandidate(message.candidate);
    } catch (const TransportError& e) {
        LOG_WARN_COMP(std::string("Remote candidate rejected: ") + e.what(), "PeerNegotiator");
    }
}

void PeerNegotiator::applyRemoteDescription(const SignalMessage& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remoteDescriptionSet_) {
            LOG_DEBUG_COMP_IF("Duplicate remote description ignored", "PeerNegotiator");
            return;
        }
    }

    try {
        connection_.setRemoteDescription(message.sdp, message.type);
    } catch (const TransportError& e) {
        fail(std::string("remote description rejected: ") + e.what());
        return;
    }

    std::deque<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remoteDescriptionSet_ = true;
        pending.swap(queuedCandidates_);
    }

    if (!pending.empty()) {
        LOG_DEBUG_COMP_IF("Flushing " + std::to_string(pending.size()) + " queued candidates", "PeerNegotiator");
    }
    for (const auto& candidate : pending) {
        try {
            connection_.addRemoteCandidate(candidate);
        } catch (const TransportError& e) {
            LOG_WARN_COMP(std::string("Queued candidate rejected: ") + e.what(), "PeerNegotiator");
        }
    }
}

void PeerNegotiator::fail(const std::string& reason) {
    bool expected = false;
    if (!failed_.compare_exchange_strong(expected, true)) {
        return;
    }
    Logger::instance().log(LogLevel::WARN, "P2P negotiation failed: " + reason, "PeerNegotiator");
    if (onFailure_) {
        onFailure_(reason);
    }
}

bool PeerNegotiator::hasRemoteDescription() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return remoteDescriptionSet_;
}

std::size_t PeerNegotiator::queuedCandidateCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queuedCandidates_.size();
}

} // namespace Transport
} // namespace CipherLink
