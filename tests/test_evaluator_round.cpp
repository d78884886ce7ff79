#include <gtest/gtest.h>
#include <algorithm>
#include <condition_variable>
#include "fakes.hpp"
#include "../src/node/evaluator_node.hpp"

using namespace testing_fakes;

namespace {

class EvaluatorRoundTest : public ::testing::Test {
protected:
    FakeEngine reference;
    FakeJudge judge;
    FakeTransport transport;
    reward::ReputationTracker reputation;
    reward::PromptSource prompts{std::vector<std::string>{"How can I manage my anxiety?"}};
    RecordingReporter reporter;

    node::EvaluatorOptions options() {
        node::EvaluatorOptions opts;
        opts.workers = {"w-null", "w-fast", "w-slow"};
        opts.sampleSize = 10;
        opts.roundInterval = std::chrono::milliseconds(10);
        return opts;
    }

    void SetUp() override {
        reference.reply = "A careful reference answer.";
        transport.answers["w-fast"] = {"fast answer", 8.0};
        transport.answers["w-slow"] = {"slow answer", 25.0};
        judge.scoreByText = {{"fast answer", 0.9}, {"slow answer", 0.3}};
    }
};

// Holds every dispatch until cancel(), then returns silent candidates.
class CancellableTransport : public p2p::PeerTransport {
public:
    std::atomic<int> dispatches{0};
    std::atomic<int> resets{0};

    std::vector<reward::Candidate> dispatch(const std::vector<std::string> &workers,
                                            const p2p::WorkerRequest &,
                                            std::chrono::milliseconds timeout) override {
        ++dispatches;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait_for(lock, timeout, [this] { return cancelled; });
        }
        std::vector<reward::Candidate> candidates;
        for (const auto &worker : workers) {
            reward::Candidate candidate;
            candidate.workerId = worker;
            candidates.push_back(candidate);
        }
        return candidates;
    }

    void cancel() override {
        {
            std::lock_guard<std::mutex> lock(mtx);
            cancelled = true;
        }
        cv.notify_all();
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mtx);
        cancelled = false;
        ++resets;
    }

private:
    std::mutex mtx;
    std::condition_variable cv;
    bool cancelled = false;
};

double scoreOf(const reward::BlendedScores &blended, const std::string &workerId) {
    for (const auto &entry : blended) {
        if (entry.first == workerId) {
            return entry.second;
        }
    }
    ADD_FAILURE() << "no score for " << workerId;
    return -1.0;
}

} // namespace

TEST_F(EvaluatorRoundTest, BlendsEveryWorkerAndUpdatesReputation) {
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, &reporter, options());

    reward::RoundSummary summary = evaluator.runRound("How can I manage my anxiety?");

    ASSERT_EQ(summary.blended.size(), 3u);
    EXPECT_DOUBLE_EQ(scoreOf(summary.blended, "w-null"), 0.0);
    EXPECT_NEAR(scoreOf(summary.blended, "w-fast"), 93.0, 1e-9);
    EXPECT_NEAR(scoreOf(summary.blended, "w-slow"), 27.0, 1e-9);

    // Blended vector follows the sampled worker order
    for (size_t i = 0; i < summary.blended.size(); ++i) {
        EXPECT_EQ(summary.blended[i].first, summary.round.workerIds[i]);
    }

    auto standing = reputation.scores();
    ASSERT_EQ(standing.size(), 3u);
    EXPECT_DOUBLE_EQ(standing["w-null"], 0.0);
    EXPECT_NEAR(standing["w-fast"], 0.1 * 0.93, 1e-9);
    EXPECT_NEAR(standing["w-slow"], 0.1 * 0.27, 1e-9);

    ASSERT_EQ(reporter.rounds.size(), 1u);
    EXPECT_EQ(reporter.rounds[0].records.size(), 2u);
}

TEST_F(EvaluatorRoundTest, SendsPromptWithRequestIdAndRequester) {
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, nullptr, options());

    reward::RoundSummary summary = evaluator.runRound("Why do I feel tired?");

    ASSERT_EQ(transport.requests.size(), 1u);
    EXPECT_EQ(transport.requests[0].prompt, "Why do I feel tired?");
    EXPECT_EQ(transport.requests[0].requestId, summary.round.requestId);
    EXPECT_EQ(transport.requests[0].requester, "evaluator");
    EXPECT_EQ(summary.round.requestId.rfind("req_", 0), 0u);
    EXPECT_EQ(summary.round.reference, "A careful reference answer.");
    EXPECT_NE(reference.lastPrompt.find("User: Why do I feel tired?"), std::string::npos);
}

TEST_F(EvaluatorRoundTest, ReferenceFailureSkipsTheRound) {
    reference.fail = true;
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, &reporter, options());

    reward::RoundSummary summary = evaluator.runRound("prompt");

    EXPECT_TRUE(summary.blended.empty());
    EXPECT_TRUE(transport.requests.empty());
    EXPECT_TRUE(reputation.scores().empty());
    EXPECT_TRUE(reporter.rounds.empty());
}

TEST_F(EvaluatorRoundTest, TransportFailureScoresEveryoneZero) {
    transport.fail = true;
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, nullptr, options());

    reward::RoundSummary summary = evaluator.runRound("prompt");

    ASSERT_EQ(summary.blended.size(), 3u);
    for (const auto &entry : summary.blended) {
        EXPECT_DOUBLE_EQ(entry.second, 0.0);
    }
    EXPECT_TRUE(judge.calls.empty());
    EXPECT_EQ(reputation.scores().size(), 3u);
}

TEST_F(EvaluatorRoundTest, JudgeFailureStillUpdatesReputationWithZeros) {
    judge.failingCalls = {0};
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, nullptr, options());

    reward::RoundSummary summary = evaluator.runRound("prompt");

    ASSERT_EQ(summary.blended.size(), 3u);
    for (const auto &entry : summary.blended) {
        EXPECT_DOUBLE_EQ(entry.second, 0.0);
    }
    EXPECT_EQ(reputation.scores().size(), 3u);
}

TEST_F(EvaluatorRoundTest, SampleIsUniqueAndBounded) {
    node::EvaluatorOptions opts = options();
    opts.workers = {"a", "b", "c", "d", "e", "a", "b"};
    opts.sampleSize = 3;
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, nullptr, opts);

    for (int i = 0; i < 20; ++i) {
        std::vector<std::string> sample = evaluator.sampleWorkers();
        ASSERT_EQ(sample.size(), 3u);
        std::sort(sample.begin(), sample.end());
        EXPECT_EQ(std::unique(sample.begin(), sample.end()), sample.end());
    }

    opts.sampleSize = 10;
    node::EvaluatorNode wide(reference, judge, transport, reputation, prompts, nullptr, opts);
    EXPECT_EQ(wide.sampleWorkers().size(), 5u);
}

TEST_F(EvaluatorRoundTest, NoWorkersSkipsTheRound) {
    node::EvaluatorOptions opts = options();
    opts.workers.clear();
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, nullptr, opts);

    reward::RoundSummary summary = evaluator.runRound("prompt");

    EXPECT_TRUE(summary.blended.empty());
    EXPECT_EQ(reference.calls.load(), 0);
}

TEST_F(EvaluatorRoundTest, StopInterruptsTheRoundLoop) {
    node::EvaluatorOptions opts = options();
    opts.roundInterval = std::chrono::hours(1);
    node::EvaluatorNode evaluator(reference, judge, transport, reputation, prompts, nullptr, opts);

    evaluator.start();
    EXPECT_TRUE(evaluator.isRunning());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    // The loop is parked in its hour-long wait by now
    auto begin = std::chrono::steady_clock::now();
    evaluator.stop();

    EXPECT_FALSE(evaluator.isRunning());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
    EXPECT_EQ(transport.requests.size(), 1u);
}

TEST_F(EvaluatorRoundTest, StopDuringDispatchLeavesReputationUntouched) {
    reputation.update({{"w1", 100.0}, {"w2", 100.0}});
    double before = reputation.getReputationScore("w1");

    CancellableTransport blocking;
    node::EvaluatorOptions opts = options();
    opts.workers = {"w1", "w2"};
    opts.dispatchTimeout = std::chrono::seconds(30);
    node::EvaluatorNode evaluator(reference, judge, blocking, reputation, prompts, &reporter, opts);

    evaluator.start();
    auto begin = std::chrono::steady_clock::now();
    while (blocking.dispatches.load() == 0 && std::chrono::steady_clock::now() - begin < std::chrono::seconds(5)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_EQ(blocking.dispatches.load(), 1);
    evaluator.stop();

    EXPECT_DOUBLE_EQ(reputation.getReputationScore("w1"), before);
    EXPECT_DOUBLE_EQ(reputation.getReputationScore("w2"), before);
    EXPECT_TRUE(judge.calls.empty());
    EXPECT_TRUE(reporter.rounds.empty());
}

TEST_F(EvaluatorRoundTest, RestartAfterStopDispatchesNormally) {
    CancellableTransport blocking;
    node::EvaluatorOptions opts = options();
    opts.dispatchTimeout = std::chrono::milliseconds(200);
    opts.roundInterval = std::chrono::hours(1);
    node::EvaluatorNode evaluator(reference, judge, blocking, reputation, prompts, &reporter, opts);

    evaluator.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    evaluator.stop();
    EXPECT_EQ(blocking.resets.load(), 1);

    // The cancel is cleared, so this round waits out its deadline and counts
    auto begin = std::chrono::steady_clock::now();
    reward::RoundSummary summary = evaluator.runRound("How can I manage my anxiety?");
    EXPECT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(150));
    EXPECT_EQ(summary.blended.size(), 3u);
    EXPECT_EQ(reporter.rounds.size(), 1u);
}

TEST(EvaluatorNodeTest, RequestIdsAreUnique) {
    std::string first = node::EvaluatorNode::newRequestId();
    std::string second = node::EvaluatorNode::newRequestId();
    EXPECT_NE(first, second);
    EXPECT_EQ(first.size(), 4u + 36u);
}
