#pragma once

#include "IHttpClient.h"
#include "P2PTypes.h"
#include <memory>
#include <vector>

namespace CipherLink {
namespace Transport {

/**
 * @brief Relay-side signaling mailbox for one P2P claim (/v1/p2p/*)
 */
class P2PSignalingClient {
public:
    P2PSignalingClient(std::string baseUrl,
                       std::shared_ptr<IHttpClient> client,
                       P2PContext context,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    void postOffer(const std::string& sdp);
    void postAnswer(const std::string& sdp);
    void postIce(const std::string& candidate);

    /**
     * @brief Fetch and consume queued messages from the peer
     */
    std::vector<SignalMessage> poll();

    /**
     * @brief STUN/TURN servers for this claim
     * @throws TransportError::unavailable on 409 (TURN not provisioned)
     */
    IceConfig fetchIceConfig();

    const P2PContext& context() const { return context_; }

private:
    void postJson(const std::string& path, const std::string& field, const std::string& value,
                  const std::string& operation);
    HttpResponse get(const std::string& path,
                     std::vector<std::pair<std::string, std::string>> query,
                     const std::string& operation);

    std::string baseUrl_;
    std::shared_ptr<IHttpClient> client_;
    P2PContext context_;
    std::chrono::milliseconds timeout_;
};

} // namespace Transport
} // namespace CipherLink
