#ifndef PEER_TRANSPORT_HPP
#define PEER_TRANSPORT_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <stdexcept>
#include "../reward/round_types.hpp"

namespace p2p {

class WireFormatError : public std::runtime_error {
public:
    explicit WireFormatError(const std::string &what) : std::runtime_error(what) {}
};

// {"prompt", "request_id", "requester"}
struct WorkerRequest {
    std::string prompt;
    std::string requestId;
    std::string requester;
};

// {"request_id", "output"}; output is null when the worker has nothing to say
struct WorkerReply {
    std::string requestId;
    std::optional<std::string> output;
};

std::string encodeRequest(const WorkerRequest &request);
WorkerRequest decodeRequest(const std::string &payload);

std::string encodeReply(const WorkerReply &reply);
WorkerReply decodeReply(const std::string &payload);

// Fan-out/fan-in to workers with a single shared deadline.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    // One candidate per worker, in worker order. Workers that do not answer
    // before the deadline get a candidate without output.
    virtual std::vector<reward::Candidate> dispatch(const std::vector<std::string> &workers,
                                                    const WorkerRequest &request,
                                                    std::chrono::milliseconds timeout) = 0;

    // Makes an in-flight dispatch return early with what it has.
    virtual void cancel() {}

    // Clears a cancel() so later dispatches wait for replies again.
    virtual void reset() {}
};

} // namespace p2p

#endif // PEER_TRANSPORT_HPP
