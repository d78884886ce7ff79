#include "worker_node.hpp"
#include <iostream>

namespace node {

worker::ResponsePipelineOptions WorkerNode::pipelineOptions(const config::WorkerConfig &cfg) {
    worker::ResponsePipelineOptions options;
    options.cacheEnabled = cfg.cacheEnabled;
    options.cacheCrisisResponses = cfg.cacheCrisisResponses;
    options.cacheMaxSize = cfg.cacheMaxSize;
    options.maxWorkers = cfg.maxWorkers;
    options.generationTimeout = std::chrono::milliseconds(
        static_cast<long long>(cfg.generationTimeoutSeconds * 1000.0));
    options.generation.maxInputTokens = cfg.maxInputTokens;
    options.generation.maxNewTokens = cfg.maxNewTokens;
    options.generation.temperature = cfg.temperature;
    return options;
}

WorkerNode::WorkerNode(llm::InferenceEngine &engine, const config::WorkerConfig &cfg)
    : cfg(cfg),
      responsePipeline(engine, pipelineOptions(cfg)),
      prioritizer(cfg.requesters, cfg.allowUnregistered),
      listener(cfg.ip, cfg.port) {
    std::cout << "[WorkerNode] Created with IP: " << cfg.ip << ", port: " << cfg.port << std::endl;
}

WorkerNode::~WorkerNode() {
    stopListening();
    std::cout << "[WorkerNode] Destroyed." << std::endl;
}

bool WorkerNode::initialize() {
    if (!listener.bind("0.0.0.0", cfg.port)) {
        std::cerr << "[WorkerNode] Failed to bind listener socket to port " << cfg.port << std::endl;
        return false;
    }

    std::cout << "[WorkerNode] Successfully initialized and bound to port " << cfg.port
              << " (cache " << (cfg.cacheEnabled ? "enabled" : "disabled")
              << ", max " << cfg.cacheMaxSize << " entries)" << std::endl;
    return true;
}

p2p::WorkerReply WorkerNode::handleRequest(const p2p::WorkerRequest &request) {
    p2p::WorkerReply reply;
    reply.requestId = request.requestId;

    worker::AdmissionDecision decision = prioritizer.admit(request.requester);
    if (decision.rejected) {
        std::cerr << "[WorkerNode] Rejecting request " << request.requestId << " from '"
                  << request.requester << "': " << decision.reason << std::endl;
        return reply;
    }

    std::cout << "[WorkerNode] Processing request: " << request.requestId << std::endl;
    auto start = std::chrono::steady_clock::now();
    worker::PipelineResult result = responsePipeline.respond(request.prompt);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    std::cout << "[WorkerNode] Response generated in " << elapsed << "s ("
              << worker::sourceName(result.source) << ")" << std::endl;
    reply.output = result.text;
    return reply;
}

void WorkerNode::enqueue(const p2p::WorkerRequest &request, const std::string &senderIp, int senderPort) {
    InboundRequest inbound;
    inbound.priority = prioritizer.priorityFor(request.prompt, request.requester);
    inbound.senderIp = senderIp;
    inbound.senderPort = senderPort;
    inbound.request = request;

    {
        std::lock_guard<std::mutex> lock(mtx);
        inbound.sequence = nextSequence++;
        requestQueue.push(std::move(inbound));
    }
    cv.notify_one();
}

size_t WorkerNode::queuedRequests() {
    std::lock_guard<std::mutex> lock(mtx);
    return requestQueue.size();
}

void WorkerNode::startListening() {
    if (running) {
        return;
    }

    running = true;
    receiverThread = std::thread(&WorkerNode::receiveLoop, this);
    processorThread = std::thread(&WorkerNode::processMessages, this);

    std::cout << "[WorkerNode] Started listening for requests" << std::endl;
}

void WorkerNode::stopListening() {
    if (!running) {
        return;
    }

    running = false;
    cv.notify_all();

    if (receiverThread.joinable()) {
        receiverThread.join();
    }

    if (processorThread.joinable()) {
        processorThread.join();
    }

    std::cout << "[WorkerNode] Stopped listening for requests" << std::endl;
}

void WorkerNode::receiveLoop() {
    while (running) {
        std::string senderIp;
        int senderPort = 0;
        std::string msg = listener.receiveData(senderIp, senderPort, 100); // poll with 100ms timeout
        if (msg.empty()) {
            continue;
        }

        try {
            enqueue(p2p::decodeRequest(msg), senderIp, senderPort);
        } catch (const p2p::WireFormatError &e) {
            std::cerr << "[WorkerNode] Dropping malformed request from " << senderIp << ":" << senderPort
                      << ": " << e.what() << std::endl;
        }
    }
}

void WorkerNode::processMessages() {
    while (running) {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [&] { return !requestQueue.empty() || !running; });

        if (!running) {
            break;
        }

        InboundRequest inbound = requestQueue.top();
        requestQueue.pop();
        lock.unlock();

        try {
            p2p::WorkerReply reply = handleRequest(inbound.request);
            if (!sendReply(reply, inbound.senderIp, inbound.senderPort)) {
                std::cerr << "[WorkerNode] Failed to deliver reply for " << reply.requestId << std::endl;
            }
        } catch (const std::exception &e) {
            std::cerr << "[WorkerNode] Error handling request " << inbound.request.requestId
                      << ": " << e.what() << std::endl;
        }
    }
}

bool WorkerNode::sendReply(const p2p::WorkerReply &reply, const std::string &recipientIp, int recipientPort) {
    p2p::NetworkHandler handler(cfg.ip, cfg.port);
    if (!handler.connect(recipientIp, recipientPort)) {
        std::cerr << "[WorkerNode] Failed to connect to " << recipientIp << ":" << recipientPort << std::endl;
        return false;
    }

    bool sent = handler.sendData(p2p::encodeReply(reply));
    handler.disconnect();
    return sent;
}

} // namespace node
