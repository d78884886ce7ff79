#ifndef WORKER_NODE_HPP
#define WORKER_NODE_HPP

#include <string>
#include <vector>
#include <queue>
#include <mutex>
#include <thread>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include "../config/node_config.hpp"
#include "../llm/inference_engine.hpp"
#include "../p2p/network_handler.hpp"
#include "../p2p/peer_transport.hpp"
#include "../worker/response_pipeline.hpp"
#include "../worker/request_prioritizer.hpp"

namespace node {

struct InboundRequest {
    double priority = 0.0;
    unsigned long long sequence = 0;  // arrival order, breaks priority ties
    std::string senderIp;
    int senderPort = 0;
    p2p::WorkerRequest request;
};

struct InboundRequestOrder {
    bool operator()(const InboundRequest &a, const InboundRequest &b) const {
        if (a.priority != b.priority) {
            return a.priority < b.priority;
        }
        return a.sequence > b.sequence;
    }
};

// Answers evaluator prompts. A receiver thread queues requests by priority;
// a processor thread runs them through the response pipeline one at a time
// and sends the reply back to the sender.
class WorkerNode {
public:
    WorkerNode(llm::InferenceEngine &engine, const config::WorkerConfig &cfg);
    ~WorkerNode();

    bool initialize();

    void startListening();
    void stopListening();

    // Admission plus pipeline; rejected requests get a reply without output.
    p2p::WorkerReply handleRequest(const p2p::WorkerRequest &request);

    // Queue a decoded request as if it came off the wire.
    void enqueue(const p2p::WorkerRequest &request, const std::string &senderIp, int senderPort);
    size_t queuedRequests();

    worker::ResponsePipeline &pipeline() { return responsePipeline; }

private:
    config::WorkerConfig cfg;
    worker::ResponsePipeline responsePipeline;
    worker::RequestPrioritizer prioritizer;

    p2p::NetworkHandler listener;
    std::atomic<bool> running{false};

    std::thread receiverThread;
    std::thread processorThread;
    std::mutex mtx;
    std::condition_variable cv;
    std::priority_queue<InboundRequest, std::vector<InboundRequest>, InboundRequestOrder> requestQueue;
    unsigned long long nextSequence = 0;

    void receiveLoop();
    void processMessages();
    bool sendReply(const p2p::WorkerReply &reply, const std::string &recipientIp, int recipientPort);

    static worker::ResponsePipelineOptions pipelineOptions(const config::WorkerConfig &cfg);
};

} // namespace node

#endif // WORKER_NODE_HPP
