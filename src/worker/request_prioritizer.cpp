#include "request_prioritizer.hpp"
#include <algorithm>
#include <cmath>
#include "prompt_classifier.hpp"

namespace worker {

double priority(const std::string &prompt, double requesterStake) {
    double base = std::isfinite(requesterStake) ? std::max(0.0, requesterStake) : 0.0;
    if (isCrisis(prompt)) {
        base *= CRISIS_PRIORITY_MULTIPLIER;
    }
    return base;
}

RequestPrioritizer::RequestPrioritizer(std::map<std::string, double> requesterStakes, bool allowUnregistered)
    : requesterStakes(std::move(requesterStakes)), allowUnregistered(allowUnregistered) {}

AdmissionDecision RequestPrioritizer::admit(const std::string &requesterId) const {
    if (requesterId.empty()) {
        return {true, "Missing requester identity"};
    }
    if (requesterStakes.count(requesterId) == 0 && !allowUnregistered) {
        return {true, "Unrecognized requester"};
    }
    return {false, "Requester recognized"};
}

std::optional<double> RequestPrioritizer::stakeOf(const std::string &requesterId) const {
    auto it = requesterStakes.find(requesterId);
    if (it == requesterStakes.end()) {
        return std::nullopt;
    }
    return it->second;
}

double RequestPrioritizer::priorityFor(const std::string &prompt, const std::string &requesterId) const {
    return priority(prompt, stakeOf(requesterId).value_or(0.0));
}

} // namespace worker
