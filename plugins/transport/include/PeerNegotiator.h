#pragma once

#include "P2PSignalingClient.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace CipherLink {
namespace Transport {

/**
 * @brief Remote half of a peer connection, as seen by the negotiator
 */
class IPeerConnection {
public:
    virtual ~IPeerConnection() = default;

    /**
     * @param type Offer or Answer
     * @throws TransportError if the description is rejected
     */
    virtual void setRemoteDescription(const std::string& sdp, SignalMessage::Type type) = 0;
    virtual void addRemoteCandidate(const std::string& candidate) = 0;
};

/**
 * @brief Applies signaling messages polled from the relay to a peer connection
 *
 * The initiator applies the answer, the responder applies the offer.
 * Remote candidates that arrive before the remote description are queued
 * and flushed in arrival order once it is set. After maxPollFailures
 * consecutive poll failures, or on any rejected description, the
 * negotiation fails and onFailure fires once.
 */
class PeerNegotiator {
public:
    using FailureCallback = std::function<void(const std::string& reason)>;

    PeerNegotiator(std::shared_ptr<P2PSignalingClient> signaling,
                   IPeerConnection& connection,
                   P2POptions options,
                   FailureCallback onFailure);
    ~PeerNegotiator();

    PeerNegotiator(const PeerNegotiator&) = delete;
    PeerNegotiator& operator=(const PeerNegotiator&) = delete;

    // Poll every options.pollInterval on a background thread until stop()
    void start();
    void stop();

    /**
     * @brief Run one poll round
     * @return false once the negotiation has failed
     */
    bool pollOnce();

    void handle(const SignalMessage& message);

    bool hasRemoteDescription() const;
    std::size_t queuedCandidateCount() const;
    bool failed() const { return failed_.load(); }

private:
    void pollLoop();
    void applyRemoteDescription(const SignalMessage& message);
    void fail(const std::string& reason);

    std::shared_ptr<P2PSignalingClient> signaling_;
    IPeerConnection& connection_;
    P2POptions options_;
    FailureCallback onFailure_;

    mutable std::mutex mutex_;
    bool remoteDescriptionSet_ = false;
    std::deque<std::string> queuedCandidates_;
    int consecutiveFailures_ = 0;
    std::atomic<bool> failed_{false};

    std::mutex stopMutex_;
    std::condition_variable stopCv_;
    bool stopRequested_ = false;
    std::thread pollThread_;
};

} // namespace Transport
} // namespace CipherLink
