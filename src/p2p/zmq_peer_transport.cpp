#include "zmq_peer_transport.hpp"
#include <map>
#include <memory>
#include <algorithm>

namespace p2p {

// Poll slice, so cancel() is noticed while waiting for replies
static const std::chrono::milliseconds POLL_SLICE(200);

ZmqPeerTransport::ZmqPeerTransport(std::string advertisedIp, int port)
    : advertisedIp(std::move(advertisedIp)), port(port), listener(this->advertisedIp, port) {}

bool ZmqPeerTransport::bind() {
    if (!listener.bind("0.0.0.0", port)) {
        std::cerr << "[ZmqPeerTransport] Failed to bind listener socket to port " << port << std::endl;
        return false;
    }
    std::cout << "[ZmqPeerTransport] Listening for worker replies on port " << port << std::endl;
    return true;
}

std::string ZmqPeerTransport::taggedRequestId(const std::string &requestId, size_t workerIndex) {
    return requestId + "/" + std::to_string(workerIndex);
}

std::vector<reward::Candidate> ZmqPeerTransport::dispatch(const std::vector<std::string> &workers,
                                                          const WorkerRequest &request,
                                                          std::chrono::milliseconds timeout) {
    using clock = std::chrono::steady_clock;

    std::vector<reward::Candidate> candidates(workers.size());
    std::map<std::string, size_t> pending;  // tagged request id -> worker index
    std::vector<std::unique_ptr<NetworkHandler>> senders;

    const auto start = clock::now();
    const auto deadline = start + timeout;

    for (size_t i = 0; i < workers.size(); ++i) {
        candidates[i].workerId = workers[i];

        std::string ip;
        int workerPort = 0;
        if (!splitEndpoint(workers[i], ip, workerPort)) {
            std::cerr << "[ZmqPeerTransport] Invalid worker endpoint: " << workers[i] << std::endl;
            continue;
        }

        WorkerRequest tagged = request;
        tagged.requestId = taggedRequestId(request.requestId, i);

        auto handler = std::unique_ptr<NetworkHandler>(new NetworkHandler(advertisedIp, port));
        if (!handler->connect(ip, workerPort)) {
            std::cerr << "[ZmqPeerTransport] Failed to connect to " << workers[i] << std::endl;
            continue;
        }
        if (!handler->sendData(encodeRequest(tagged))) {
            std::cerr << "[ZmqPeerTransport] Failed to send request to " << workers[i] << std::endl;
            continue;
        }
        pending[tagged.requestId] = i;
        senders.push_back(std::move(handler));
    }

    while (!pending.empty() && !cancelled) {
        auto now = clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto wait = std::min(remaining, POLL_SLICE);

        std::string senderIp;
        int senderPort = 0;
        std::string payload = listener.receiveData(senderIp, senderPort, static_cast<int>(wait.count()));
        if (payload.empty()) {
            continue;
        }

        WorkerReply reply;
        try {
            reply = decodeReply(payload);
        } catch (const WireFormatError &e) {
            std::cerr << "[ZmqPeerTransport] Dropping malformed reply from " << senderIp << ":" << senderPort
                      << ": " << e.what() << std::endl;
            continue;
        }

        auto it = pending.find(reply.requestId);
        if (it == pending.end()) {
            std::cout << "[ZmqPeerTransport] Ignoring stale reply " << reply.requestId << std::endl;
            continue;
        }

        reward::Candidate &candidate = candidates[it->second];
        candidate.output = reply.output;
        candidate.latencySeconds = std::chrono::duration<double>(clock::now() - start).count();
        pending.erase(it);
    }

    if (!pending.empty()) {
        std::cout << "[ZmqPeerTransport] " << pending.size() << " of " << workers.size()
                  << " workers did not reply in time" << std::endl;
    }

    return candidates;
}

} // namespace p2p
