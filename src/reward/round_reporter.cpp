#include "round_reporter.hpp"
#include <iostream>
#include <fstream>
#include <chrono>

using json = nlohmann::json;

namespace reward {

json toJson(const RoundSummary &summary) {
    json responses = json::array();
    for (const auto &rec : summary.records) {
        std::string output;
        for (const auto &candidate : summary.candidates) {
            if (candidate.workerId == rec.workerId && candidate.output) {
                output = *candidate.output;
                break;
            }
        }
        responses.push_back({
            {"worker_id", rec.workerId},
            {"response", output},
            {"response_time", rec.latencySeconds},
            {"response_time_score", rec.latencyBonus},
            {"quality_score", rec.qualityContribution},
            {"judge_score", rec.quality},
            {"total_score", rec.total}
        });
    }

    json blended = json::object();
    for (const auto &entry : summary.blended) {
        blended[entry.first] = entry.second;
    }

    auto created = std::chrono::duration_cast<std::chrono::milliseconds>(
        summary.round.createdAt.time_since_epoch()).count();

    return {
        {"request_id", summary.round.requestId},
        {"timestamp_ms", created},
        {"prompt", summary.round.prompt},
        {"base_response", summary.round.reference},
        {"workers", summary.round.workerIds},
        {"responses", responses},
        {"rewards", blended}
    };
}

JsonlRoundReporter::JsonlRoundReporter(std::string path) : path(std::move(path)) {}

void JsonlRoundReporter::report(const RoundSummary &summary) {
    if (summary.records.empty()) {
        std::cerr << "[RoundReporter] No responses received for request " << summary.round.requestId << std::endl;
    }

    std::lock_guard<std::mutex> lock(fileMutex);
    std::ofstream file(path, std::ios::app);
    if (!file.is_open()) {
        std::cerr << "[RoundReporter] Failed to open report file: " << path << std::endl;
        return;
    }
    file << toJson(summary).dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
}

} // namespace reward
