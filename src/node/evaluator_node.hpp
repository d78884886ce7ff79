#ifndef EVALUATOR_NODE_HPP
#define EVALUATOR_NODE_HPP

#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <random>
#include "../llm/inference_engine.hpp"
#include "../llm/judge_oracle.hpp"
#include "../p2p/peer_transport.hpp"
#include "../reward/batch_scorer.hpp"
#include "../reward/reputation_tracker.hpp"
#include "../reward/prompt_source.hpp"
#include "../reward/round_reporter.hpp"

namespace node {

struct EvaluatorOptions {
    std::vector<std::string> workers;  // "ip:port"
    size_t sampleSize = 10;
    std::chrono::milliseconds roundInterval = std::chrono::seconds(300);
    std::chrono::milliseconds dispatchTimeout = std::chrono::seconds(500);
    std::string requesterId = "evaluator";
    size_t judgeInputBudget = reward::DEFAULT_JUDGE_INPUT_BUDGET;
    llm::GenerationParams reference{3072, 1000, 0.7f};
    std::string reputationFile;  // empty: not persisted
};

// Coordinates evaluation rounds: prompt, reference answer, fan-out to a
// sample of workers, judging, blending and reputation update. Collaborators
// are borrowed and must outlive the node.
class EvaluatorNode {
public:
    EvaluatorNode(llm::InferenceEngine &referenceEngine,
                  llm::JudgeOracle &judge,
                  p2p::PeerTransport &transport,
                  reward::ReputationTracker &reputation,
                  reward::PromptSource &prompts,
                  reward::RoundReporter *reporter,
                  EvaluatorOptions options);
    ~EvaluatorNode();

    // One full round with a freshly drawn prompt.
    reward::RoundSummary runRound();
    reward::RoundSummary runRound(const std::string &prompt);

    // Rounds on a background thread, one interval apart, until stop().
    // A round cut short by stop() is dropped: no scores, no reputation change.
    void start();
    void stop();
    bool isRunning() const { return running; }

    std::vector<std::string> sampleWorkers();

    static std::string newRequestId();

private:
    llm::InferenceEngine &referenceEngine;
    llm::JudgeOracle &judge;
    p2p::PeerTransport &transport;
    reward::ReputationTracker &reputation;
    reward::PromptSource &prompts;
    reward::RoundReporter *reporter;
    EvaluatorOptions options;
    reward::BatchScorer scorer;
    std::mt19937 rng;

    std::atomic<bool> running{false};
    std::atomic<bool> stopRequested{false};  // set by stop() while a round may be in flight
    std::thread roundThread;
    std::mutex loopMutex;
    std::condition_variable loopCv;

    void roundLoop();
    std::string generateReference(const std::string &prompt);
};

} // namespace node

#endif // EVALUATOR_NODE_HPP
