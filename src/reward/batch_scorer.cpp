#include "batch_scorer.hpp"
#include <iostream>
#include <cmath>
#include <algorithm>

namespace reward {

BatchScorer::BatchScorer(llm::JudgeOracle &judge, size_t inputBudget)
    : judge(judge), inputBudget(inputBudget) {}

long BatchScorer::maxBatchSize(const std::string &prompt,
                               const std::string &reference,
                               const std::vector<Candidate> &candidates) const {
    size_t totalSize = 0;
    size_t count = 0;
    for (const auto &candidate : candidates) {
        if (!candidate.hasOutput()) {
            continue;
        }
        totalSize += candidate.output->size() + JUDGE_ITEM_OVERHEAD;
        ++count;
    }
    if (count == 0) {
        return 0;
    }

    double avgSize = static_cast<double>(totalSize) / static_cast<double>(count);
    double room = static_cast<double>(inputBudget) -
                  static_cast<double>(prompt.size()) -
                  static_cast<double>(reference.size());
    // One slot of safety margin
    return static_cast<long>(std::floor(room / avgSize)) - 1;
}

std::vector<ScoredCandidate> BatchScorer::scoreAll(const std::string &prompt,
                                                   const std::string &reference,
                                                   const std::vector<Candidate> &candidates) {
    std::vector<ScoredCandidate> results;
    results.reserve(candidates.size());
    std::vector<size_t> answered;  // indices into results
    std::vector<std::string> texts;
    for (const auto &candidate : candidates) {
        results.push_back({candidate.workerId, 0.0});
        if (candidate.hasOutput()) {
            answered.push_back(results.size() - 1);
            texts.push_back(*candidate.output);
        }
    }

    if (texts.empty()) {
        std::cout << "[BatchScorer] No responses to score" << std::endl;
        return results;
    }

    long batchSize = maxBatchSize(prompt, reference, candidates);
    if (batchSize <= 0) {
        std::cerr << "[BatchScorer] Judge input budget " << inputBudget
                  << " cannot fit a single response (prompt " << prompt.size()
                  << ", reference " << reference.size() << "), scoring "
                  << texts.size() << " responses as 0" << std::endl;
        return results;
    }

    size_t step = static_cast<size_t>(batchSize);
    size_t batchCount = (texts.size() + step - 1) / step;
    for (size_t start = 0, batchIndex = 0; start < texts.size(); start += step, ++batchIndex) {
        size_t end = std::min(start + step, texts.size());
        std::vector<std::string> batch(texts.begin() + start, texts.begin() + end);

        std::vector<double> scores = scoreBatch(prompt, reference, batch, batchIndex, batchCount);
        for (size_t i = 0; i < scores.size(); ++i) {
            results[answered[start + i]].score = scores[i];
        }
    }

    return results;
}

std::vector<double> BatchScorer::scoreBatch(const std::string &prompt,
                                            const std::string &reference,
                                            const std::vector<std::string> &batch,
                                            size_t batchIndex, size_t batchCount) {
    std::vector<double> scores(batch.size(), 0.0);
    try {
        std::vector<double> judged = judge.score(prompt, reference, batch);
        if (judged.size() != batch.size()) {
            std::cerr << "[BatchScorer] Judge returned " << judged.size() << " scores for batch of "
                      << batch.size() << ", zero-scoring batch" << std::endl;
            return scores;
        }
        for (size_t i = 0; i < judged.size(); ++i) {
            double s = judged[i];
            scores[i] = std::isfinite(s) ? std::max(0.0, std::min(1.0, s)) : 0.0;
        }
    } catch (const llm::JudgeParseError &e) {
        std::cerr << "[BatchScorer] Error parsing judge reply: " << e.what() << std::endl;
        return scores;
    } catch (const std::exception &e) {
        std::cerr << "[BatchScorer] Judge call failed: " << e.what() << std::endl;
        return scores;
    }

    if (batchCount > 1) {
        std::cout << "[BatchScorer] Processed batch " << (batchIndex + 1) << "/" << batchCount
                  << " (" << batch.size() << " responses)" << std::endl;
    }
    return scores;
}

} // namespace reward
