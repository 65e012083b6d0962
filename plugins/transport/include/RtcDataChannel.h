#pragma once

/**
 * @file RtcDataChannel.h
 * @brief WebRTC data channel using libdatachannel
 *
 * Built with WebRTC support only when libdatachannel is found
 * (CIPHERLINK_HAVE_WEBRTC). Without it isAvailable() is false and
 * connect() throws an Unavailable TransportError, so callers stay on
 * the relay.
 */

#include "IDataChannel.h"
#include "PeerNegotiator.h"
#include "P2PTransport.h"
#include <condition_variable>
#include <memory>
#include <mutex>

#ifdef CIPHERLINK_HAVE_WEBRTC
#include <rtc/rtc.hpp>
#endif

namespace CipherLink {
namespace Transport {

class RtcDataChannel : public IDataChannel, public IPeerConnection {
public:
    static constexpr const char* LABEL = "cipherlink";

    static bool isAvailable();

    /**
     * @brief Fetch ICE servers, create the peer connection and start signaling
     *
     * Returns immediately; use waitOpen() to wait for the channel.
     * @throws TransportError::unavailable when WebRTC is not built in or ICE config is refused
     */
    static std::shared_ptr<RtcDataChannel> connect(std::shared_ptr<P2PSignalingClient> signaling,
                                                   const P2POptions& options);

    ~RtcDataChannel() override;

    bool waitOpen(std::chrono::milliseconds timeout) override;
    bool isOpen() const override;
    void send(const std::string& message) override;
    void setMessageHandler(MessageHandler handler) override;
    void setClosedHandler(ClosedHandler handler) override;
    void close() override;

    void setRemoteDescription(const std::string& sdp, SignalMessage::Type type) override;
    void addRemoteCandidate(const std::string& candidate) override;

private:
    RtcDataChannel(std::shared_ptr<P2PSignalingClient> signaling, const P2POptions& options);

    void markOpen();
    void markFailed(const std::string& reason);
    void deliver(const std::string& message);

#ifdef CIPHERLINK_HAVE_WEBRTC
    void setupDataChannel(std::shared_ptr<rtc::DataChannel> channel);

    std::shared_ptr<rtc::PeerConnection> peerConnection_;
    std::shared_ptr<rtc::DataChannel> dataChannel_;
#endif

    std::shared_ptr<P2PSignalingClient> signaling_;
    P2POptions options_;
    std::unique_ptr<PeerNegotiator> negotiator_;

    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    bool open_ = false;
    bool failed_ = false;

    std::mutex handlerMutex_;
    MessageHandler messageHandler_;
    ClosedHandler closedHandler_;
};

/**
 * @brief Negotiate a WebRTC channel for context and wrap it with relay fallback
 *
 * When WebRTC is unavailable or the relay refuses ICE configuration the
 * relay itself is returned and onFallback fires with the reason.
 */
TransportPtr connectP2PTransport(const std::string& baseUrl,
                                 std::shared_ptr<IHttpClient> httpClient,
                                 const P2PContext& context,
                                 TransportPtr relay,
                                 const P2POptions& options = P2POptions(),
                                 FallbackTransport::FallbackCallback onFallback = nullptr);

} // namespace Transport
} // namespace CipherLink
