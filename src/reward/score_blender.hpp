#ifndef SCORE_BLENDER_HPP
#define SCORE_BLENDER_HPP

#include <optional>
#include <vector>
#include "round_types.hpp"

namespace reward {

constexpr double QUALITY_WEIGHT = 0.7;
constexpr double LATENCY_WEIGHT = 0.3;
// Latency bonus is only paid above this quality
constexpr double LATENCY_BONUS_MIN_QUALITY = 0.2;

// Turns (quality, latency) into the blended incentive in [0,100].
class ScoreBlender {
public:
    // Unweighted bonus for a latency tier: <10s 100, <20s 50, <30s 20, else 0.
    static double latencyTierBonus(double latencySeconds);

    static double blend(const Candidate &candidate, std::optional<double> quality);

    // Full breakdown, or nullopt when the candidate earns nothing.
    static std::optional<ScoreRecord> record(const Candidate &candidate, std::optional<double> quality);

    // One entry per candidate in candidate order; workers without a score get 0.
    static BlendedScores blendAll(const std::vector<Candidate> &candidates,
                                  const std::vector<ScoredCandidate> &scores,
                                  std::vector<ScoreRecord> *records = nullptr);
};

} // namespace reward

#endif // SCORE_BLENDER_HPP
