#include "score_blender.hpp"
#include <map>

namespace reward {

double ScoreBlender::latencyTierBonus(double latencySeconds) {
    if (latencySeconds < 10.0) {
        return 100.0;
    } else if (latencySeconds < 20.0) {
        return 50.0;
    } else if (latencySeconds < 30.0) {
        return 20.0;
    }
    return 0.0;
}

std::optional<ScoreRecord> ScoreBlender::record(const Candidate &candidate, std::optional<double> quality) {
    if (!candidate.hasOutput() || !quality.has_value() || !(*quality > 0.0)) {
        return std::nullopt;
    }

    ScoreRecord rec;
    rec.workerId = candidate.workerId;
    rec.quality = *quality;
    rec.latencySeconds = candidate.latencySeconds;

    double bonus = 0.0;
    if (*quality > LATENCY_BONUS_MIN_QUALITY) {
        bonus = latencyTierBonus(candidate.latencySeconds);
    }
    rec.latencyBonus = bonus * LATENCY_WEIGHT;
    rec.qualityContribution = *quality * 100.0 * QUALITY_WEIGHT;
    rec.total = rec.latencyBonus + rec.qualityContribution;
    return rec;
}

double ScoreBlender::blend(const Candidate &candidate, std::optional<double> quality) {
    auto rec = record(candidate, quality);
    return rec ? rec->total : 0.0;
}

BlendedScores ScoreBlender::blendAll(const std::vector<Candidate> &candidates,
                                     const std::vector<ScoredCandidate> &scores,
                                     std::vector<ScoreRecord> *records) {
    std::map<std::string, double> byWorker;
    for (const auto &s : scores) {
        byWorker[s.workerId] = s.score;
    }

    BlendedScores blended;
    blended.reserve(candidates.size());
    for (const auto &candidate : candidates) {
        std::optional<double> quality;
        auto it = byWorker.find(candidate.workerId);
        if (it != byWorker.end()) {
            quality = it->second;
        }

        auto rec = record(candidate, quality);
        if (rec) {
            blended.emplace_back(candidate.workerId, rec->total);
            if (records) {
                records->push_back(*rec);
            }
        } else {
            blended.emplace_back(candidate.workerId, 0.0);
        }
    }
    return blended;
}

} // namespace reward
