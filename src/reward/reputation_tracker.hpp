#ifndef REPUTATION_TRACKER_HPP
#define REPUTATION_TRACKER_HPP

#include <string>
#include <map>
#include <mutex>
#include "round_types.hpp"

namespace reward {

constexpr double DEFAULT_REPUTATION_ALPHA = 0.1;

// Per-worker standing as an exponential moving average of blended scores,
// normalized to [0,1]. Values are only ever merged, never replaced.
class ReputationTracker {
public:
    explicit ReputationTracker(double alpha = DEFAULT_REPUTATION_ALPHA);

    // Folds one round into the standing of every worker in the vector.
    void update(const BlendedScores &blended);

    double getReputationScore(const std::string &workerId) const;

    std::map<std::string, double> scores() const;

    // Reputations normalized to sum to 1; all zero when nothing is known.
    std::map<std::string, double> weights() const;

    bool save(const std::string &path) const;
    bool load(const std::string &path);

    double getAlpha() const { return alpha; }

private:
    double alpha;
    std::map<std::string, double> reputationScores;
    mutable std::mutex reputationMutex;
};

} // namespace reward

#endif // REPUTATION_TRACKER_HPP
