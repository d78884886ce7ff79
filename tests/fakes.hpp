#ifndef CARENET_TEST_FAKES_HPP
#define CARENET_TEST_FAKES_HPP

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <thread>
#include <functional>
#include "../src/llm/inference_engine.hpp"
#include "../src/llm/judge_oracle.hpp"
#include "../src/p2p/peer_transport.hpp"
#include "../src/reward/round_reporter.hpp"

namespace testing_fakes {

// Scores each candidate from a text -> score table (0 for unknown text).
class FakeJudge : public llm::JudgeOracle {
public:
    std::map<std::string, double> scoreByText;
    std::vector<std::vector<std::string>> calls;
    // Calls (0-based) that throw instead of answering
    std::vector<size_t> failingCalls;
    bool parseFailure = false;
    bool wrongLength = false;

    std::vector<double> score(const std::string &, const std::string &,
                              const std::vector<std::string> &candidates) override {
        size_t callIndex = calls.size();
        calls.push_back(candidates);
        for (size_t failing : failingCalls) {
            if (failing == callIndex) {
                throw llm::JudgeError("judge unreachable");
            }
        }
        if (parseFailure) {
            throw llm::JudgeParseError("no scores array");
        }

        std::vector<double> scores;
        for (const auto &text : candidates) {
            auto it = scoreByText.find(text);
            scores.push_back(it == scoreByText.end() ? 0.0 : it->second);
        }
        if (wrongLength) {
            scores.push_back(0.5);
        }
        return scores;
    }
};

class FakeEngine : public llm::InferenceEngine {
public:
    std::string reply = "This is a generated answer.";
    bool fail = false;
    std::chrono::milliseconds delay{0};
    std::atomic<int> calls{0};
    std::string lastPrompt;
    std::mutex promptMutex;

    std::string generate(const std::string &prompt, const llm::GenerationParams &) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(promptMutex);
            lastPrompt = prompt;
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        if (fail) {
            throw llm::InferenceError("model not loaded");
        }
        return reply;
    }
};

// Answers each worker from a table; workers missing from it stay silent.
class FakeTransport : public p2p::PeerTransport {
public:
    struct Answer {
        std::string output;
        double latencySeconds;
    };
    std::map<std::string, Answer> answers;
    std::vector<p2p::WorkerRequest> requests;
    bool fail = false;

    std::vector<reward::Candidate> dispatch(const std::vector<std::string> &workers,
                                            const p2p::WorkerRequest &request,
                                            std::chrono::milliseconds) override {
        requests.push_back(request);
        if (fail) {
            throw std::runtime_error("socket error");
        }

        std::vector<reward::Candidate> candidates;
        for (const auto &worker : workers) {
            reward::Candidate candidate;
            candidate.workerId = worker;
            auto it = answers.find(worker);
            if (it != answers.end()) {
                candidate.output = it->second.output;
                candidate.latencySeconds = it->second.latencySeconds;
            }
            candidates.push_back(candidate);
        }
        return candidates;
    }
};

class RecordingReporter : public reward::RoundReporter {
public:
    std::vector<reward::RoundSummary> rounds;

    void report(const reward::RoundSummary &summary) override {
        rounds.push_back(summary);
    }
};

inline std::string repeatWord(const std::string &word, size_t count) {
    std::string text;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            text += " ";
        }
        text += word;
    }
    return text;
}

} // namespace testing_fakes

#endif // CARENET_TEST_FAKES_HPP
