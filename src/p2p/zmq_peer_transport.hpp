#ifndef ZMQ_PEER_TRANSPORT_HPP
#define ZMQ_PEER_TRANSPORT_HPP

#include <string>
#include <atomic>
#include "peer_transport.hpp"
#include "network_handler.hpp"

namespace p2p {

// Sends each worker its request over a fresh DEALER connection and collects
// replies on a bound listener. Replies are routed back by a per-worker tag
// appended to the request id.
class ZmqPeerTransport : public PeerTransport {
public:
    ZmqPeerTransport(std::string advertisedIp, int port);

    bool bind();

    std::vector<reward::Candidate> dispatch(const std::vector<std::string> &workers,
                                            const WorkerRequest &request,
                                            std::chrono::milliseconds timeout) override;

    // Sticky until reset(): dispatches return immediately with what they sent
    void cancel() override { cancelled = true; }
    void reset() override { cancelled = false; }

    static std::string taggedRequestId(const std::string &requestId, size_t workerIndex);

private:
    std::string advertisedIp;
    int port;
    NetworkHandler listener;
    std::atomic<bool> cancelled{false};
};

} // namespace p2p

#endif // ZMQ_PEER_TRANSPORT_HPP
