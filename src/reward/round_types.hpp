#ifndef ROUND_TYPES_HPP
#define ROUND_TYPES_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <utility>

namespace reward {

// One worker's reply within a round. An absent or empty output means the
// worker did not answer; latency is meaningless in that case.
struct Candidate {
    std::string workerId;
    std::optional<std::string> output;
    double latencySeconds = 0.0;  // measured by the evaluator, dispatch to receipt

    bool hasOutput() const { return output.has_value() && !output->empty(); }
};

struct Round {
    std::string requestId;
    std::string prompt;
    std::string reference;
    std::vector<std::string> workerIds;
    std::chrono::system_clock::time_point createdAt;
};

struct ScoredCandidate {
    std::string workerId;
    double score = 0.0;
};

struct ScoreRecord {
    std::string workerId;
    double quality = 0.0;            // judge score in [0,1]
    double latencySeconds = 0.0;
    double latencyBonus = 0.0;       // already weighted
    double qualityContribution = 0.0;
    double total = 0.0;
};

// Blended incentive per sampled worker, in sampling order.
using BlendedScores = std::vector<std::pair<std::string, double>>;

} // namespace reward

#endif // ROUND_TYPES_HPP
