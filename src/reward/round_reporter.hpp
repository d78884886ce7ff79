#ifndef ROUND_REPORTER_HPP
#define ROUND_REPORTER_HPP

#include <string>
#include <vector>
#include <mutex>
#include <nlohmann/json.hpp>
#include "round_types.hpp"

namespace reward {

struct RoundSummary {
    Round round;
    std::vector<Candidate> candidates;
    std::vector<ScoreRecord> records;
    BlendedScores blended;
};

nlohmann::json toJson(const RoundSummary &summary);

// Sink for finished rounds (dashboards, telemetry).
class RoundReporter {
public:
    virtual ~RoundReporter() = default;

    virtual void report(const RoundSummary &summary) = 0;
};

// Appends one JSON object per round to a file.
class JsonlRoundReporter : public RoundReporter {
public:
    explicit JsonlRoundReporter(std::string path);

    void report(const RoundSummary &summary) override;

private:
    std::string path;
    std::mutex fileMutex;
};

} // namespace reward

#endif // ROUND_REPORTER_HPP
