#ifndef REQUEST_PRIORITIZER_HPP
#define REQUEST_PRIORITIZER_HPP

#include <string>
#include <map>
#include <optional>

namespace worker {

// Crisis prompts get this multiplier on top of the requester's stake
constexpr double CRISIS_PRIORITY_MULTIPLIER = 2.0;

// Monotonic in stake, doubled for crisis prompts. Negative stake counts as 0.
double priority(const std::string &prompt, double requesterStake);

struct AdmissionDecision {
    bool rejected = false;
    std::string reason;
};

// Known requesters and their stake; decides admission and queue priority.
class RequestPrioritizer {
public:
    RequestPrioritizer(std::map<std::string, double> requesterStakes, bool allowUnregistered);

    AdmissionDecision admit(const std::string &requesterId) const;

    std::optional<double> stakeOf(const std::string &requesterId) const;

    // Unknown requesters are weighted as zero stake
    double priorityFor(const std::string &prompt, const std::string &requesterId) const;

private:
    std::map<std::string, double> requesterStakes;
    bool allowUnregistered;
};

} // namespace worker

#endif // REQUEST_PRIORITIZER_HPP
