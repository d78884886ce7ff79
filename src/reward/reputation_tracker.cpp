#include "reputation_tracker.hpp"
#include <iostream>
#include <fstream>
#include <cmath>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace reward {

ReputationTracker::ReputationTracker(double alpha) : alpha(alpha) {
    if (!(alpha > 0.0 && alpha <= 1.0)) {
        throw std::invalid_argument("reputation alpha must be in (0, 1]");
    }
}

void ReputationTracker::update(const BlendedScores &blended) {
    std::lock_guard<std::mutex> lock(reputationMutex);
    for (const auto &entry : blended) {
        double reward = std::isfinite(entry.second) ? entry.second / 100.0 : 0.0;
        double &current = reputationScores[entry.first];  // new workers start at 0
        current = alpha * reward + (1.0 - alpha) * current;
    }
}

double ReputationTracker::getReputationScore(const std::string &workerId) const {
    std::lock_guard<std::mutex> lock(reputationMutex);
    auto it = reputationScores.find(workerId);
    return it == reputationScores.end() ? 0.0 : it->second;
}

std::map<std::string, double> ReputationTracker::scores() const {
    std::lock_guard<std::mutex> lock(reputationMutex);
    return reputationScores;
}

std::map<std::string, double> ReputationTracker::weights() const {
    std::lock_guard<std::mutex> lock(reputationMutex);
    double sum = 0.0;
    for (const auto &entry : reputationScores) {
        sum += entry.second;
    }

    std::map<std::string, double> normalized;
    for (const auto &entry : reputationScores) {
        normalized[entry.first] = sum > 0.0 ? entry.second / sum : 0.0;
    }
    return normalized;
}

bool ReputationTracker::save(const std::string &path) const {
    json state;
    {
        std::lock_guard<std::mutex> lock(reputationMutex);
        state["alpha"] = alpha;
        state["scores"] = reputationScores;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ReputationTracker] Failed to open " << path << " for writing" << std::endl;
        return false;
    }
    file << state.dump(2, ' ', false, json::error_handler_t::replace);
    return file.good();
}

bool ReputationTracker::load(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cout << "[ReputationTracker] No saved state at " << path << ", starting fresh" << std::endl;
        return true;
    }

    try {
        json state;
        file >> state;
        if (!state.contains("scores") || !state["scores"].is_object()) {
            std::cerr << "[ReputationTracker] State file " << path << " has no 'scores' object" << std::endl;
            return false;
        }

        std::lock_guard<std::mutex> lock(reputationMutex);
        for (auto it = state["scores"].begin(); it != state["scores"].end(); ++it) {
            if (it.value().is_number()) {
                reputationScores[it.key()] = it.value().get<double>();
            }
        }
        std::cout << "[ReputationTracker] Loaded " << reputationScores.size() << " reputations from " << path << std::endl;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "[ReputationTracker] Error loading state: " << e.what() << std::endl;
        return false;
    }
}

} // namespace reward
