#include "evaluator_node.hpp"
#include <iostream>
#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "../reward/score_blender.hpp"

namespace node {

EvaluatorNode::EvaluatorNode(llm::InferenceEngine &referenceEngine,
                             llm::JudgeOracle &judge,
                             p2p::PeerTransport &transport,
                             reward::ReputationTracker &reputation,
                             reward::PromptSource &prompts,
                             reward::RoundReporter *reporter,
                             EvaluatorOptions options)
    : referenceEngine(referenceEngine),
      judge(judge),
      transport(transport),
      reputation(reputation),
      prompts(prompts),
      reporter(reporter),
      options(std::move(options)),
      scorer(judge, this->options.judgeInputBudget),
      rng(std::random_device{}()) {
    std::cout << "[EvaluatorNode] Created with " << this->options.workers.size() << " known workers" << std::endl;
}

EvaluatorNode::~EvaluatorNode() {
    stop();
    std::cout << "[EvaluatorNode] Destroyed" << std::endl;
}

std::string EvaluatorNode::newRequestId() {
    boost::uuids::random_generator generator;
    return "req_" + boost::uuids::to_string(generator());
}

std::vector<std::string> EvaluatorNode::sampleWorkers() {
    std::vector<std::string> pool = options.workers;
    std::sort(pool.begin(), pool.end());
    pool.erase(std::unique(pool.begin(), pool.end()), pool.end());
    std::shuffle(pool.begin(), pool.end(), rng);
    if (pool.size() > options.sampleSize) {
        pool.resize(options.sampleSize);
    }
    return pool;
}

std::string EvaluatorNode::generateReference(const std::string &prompt) {
    std::string input = "You are a helpful therapist.\n\nUser: " + prompt + "\n\nTherapist:";
    return llm::dropIncompleteUtf8Tail(referenceEngine.generate(input, options.reference));
}

reward::RoundSummary EvaluatorNode::runRound() {
    return runRound(prompts.draw());
}

reward::RoundSummary EvaluatorNode::runRound(const std::string &prompt) {
    reward::RoundSummary summary;
    reward::Round &round = summary.round;
    round.requestId = newRequestId();
    round.prompt = prompt;
    round.createdAt = std::chrono::system_clock::now();
    round.workerIds = sampleWorkers();

    std::cout << "[EvaluatorNode] Request ID: " << round.requestId << std::endl;
    std::cout << "[EvaluatorNode] Prompt: " << round.prompt << std::endl;

    if (round.workerIds.empty()) {
        std::cerr << "[EvaluatorNode] No workers to query, skipping round" << std::endl;
        return summary;
    }

    try {
        round.reference = generateReference(prompt);
    } catch (const std::exception &e) {
        std::cerr << "[EvaluatorNode] Error generating reference answer, skipping round: " << e.what() << std::endl;
        return summary;
    }
    std::cout << "[EvaluatorNode] Reference: " << round.reference.substr(0, 50) << "..." << std::endl;

    if (stopRequested) {
        std::cout << "[EvaluatorNode] Stop requested, dropping round " << round.requestId << std::endl;
        return summary;
    }

    p2p::WorkerRequest request{round.prompt, round.requestId, options.requesterId};
    try {
        summary.candidates = transport.dispatch(round.workerIds, request, options.dispatchTimeout);
    } catch (const std::exception &e) {
        std::cerr << "[EvaluatorNode] Dispatch failed: " << e.what() << std::endl;
    }

    // Silence caused by our own shutdown says nothing about the workers
    if (stopRequested) {
        std::cout << "[EvaluatorNode] Dispatch interrupted by stop, dropping round " << round.requestId << std::endl;
        summary.candidates.clear();
        return summary;
    }

    // Whatever happened on the wire, every sampled worker gets a candidate
    if (summary.candidates.size() != round.workerIds.size()) {
        std::vector<reward::Candidate> aligned;
        for (const auto &workerId : round.workerIds) {
            reward::Candidate candidate;
            candidate.workerId = workerId;
            for (const auto &received : summary.candidates) {
                if (received.workerId == workerId) {
                    candidate = received;
                    break;
                }
            }
            aligned.push_back(candidate);
        }
        summary.candidates = std::move(aligned);
    }

    size_t answered = std::count_if(summary.candidates.begin(), summary.candidates.end(),
                                     [](const reward::Candidate &c) { return c.hasOutput(); });
    std::cout << "[EvaluatorNode] Received " << answered << "/" << summary.candidates.size() << " responses" << std::endl;

    std::vector<reward::ScoredCandidate> scores = scorer.scoreAll(round.prompt, round.reference, summary.candidates);
    summary.blended = reward::ScoreBlender::blendAll(summary.candidates, scores, &summary.records);

    reputation.update(summary.blended);
    if (!options.reputationFile.empty()) {
        reputation.save(options.reputationFile);
    }

    for (const auto &entry : summary.blended) {
        std::cout << "[EvaluatorNode] " << entry.first << " -> " << entry.second << std::endl;
    }

    if (reporter) {
        try {
            reporter->report(summary);
        } catch (const std::exception &e) {
            std::cerr << "[EvaluatorNode] Error reporting round: " << e.what() << std::endl;
        }
    }

    return summary;
}

void EvaluatorNode::start() {
    if (running) {
        return;
    }

    running = true;
    roundThread = std::thread(&EvaluatorNode::roundLoop, this);
    std::cout << "[EvaluatorNode] Started round loop" << std::endl;
}

void EvaluatorNode::stop() {
    {
        std::lock_guard<std::mutex> lock(loopMutex);
        if (!running) {
            return;
        }
        running = false;
        stopRequested = true;
    }
    transport.cancel();
    loopCv.notify_all();

    if (roundThread.joinable()) {
        roundThread.join();
    }

    stopRequested = false;
    transport.reset();
    std::cout << "[EvaluatorNode] Stopped round loop" << std::endl;
}

void EvaluatorNode::roundLoop() {
    while (running) {
        try {
            runRound();
        } catch (const std::exception &e) {
            std::cerr << "[EvaluatorNode] Round failed: " << e.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(loopMutex);
        loopCv.wait_for(lock, options.roundInterval, [this] { return !running; });
    }
}

} // namespace node
