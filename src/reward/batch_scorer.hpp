#ifndef BATCH_SCORER_HPP
#define BATCH_SCORER_HPP

#include <string>
#include <vector>
#include "round_types.hpp"
#include "../llm/judge_oracle.hpp"

namespace reward {

// Characters added per candidate for the judge prompt's numbering/formatting.
constexpr size_t JUDGE_ITEM_OVERHEAD = 10;
constexpr size_t DEFAULT_JUDGE_INPUT_BUDGET = 16000;

// Splits a candidate set into judge calls that fit the judge's input budget and
// reassembles one score per candidate, in input order.
class BatchScorer {
public:
    BatchScorer(llm::JudgeOracle &judge, size_t inputBudget = DEFAULT_JUDGE_INPUT_BUDGET);

    std::vector<ScoredCandidate> scoreAll(const std::string &prompt,
                                          const std::string &reference,
                                          const std::vector<Candidate> &candidates);

    // Largest number of candidates per judge call, or <= 0 when not even one
    // fits. Returns 0 when there is nothing to score.
    long maxBatchSize(const std::string &prompt,
                      const std::string &reference,
                      const std::vector<Candidate> &candidates) const;

private:
    llm::JudgeOracle &judge;
    size_t inputBudget;

    std::vector<double> scoreBatch(const std::string &prompt,
                                   const std::string &reference,
                                   const std::vector<std::string> &batch,
                                   size_t batchIndex, size_t batchCount);
};

} // namespace reward

#endif // BATCH_SCORER_HPP
