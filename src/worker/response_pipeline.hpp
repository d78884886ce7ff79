#ifndef RESPONSE_PIPELINE_HPP
#define RESPONSE_PIPELINE_HPP

#include <string>
#include <chrono>
#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include "../llm/inference_engine.hpp"
#include "response_cache.hpp"
#include "quality_gate.hpp"

namespace worker {

enum class ResponseSource {
    Cache,
    Crisis,
    Template,
    Generated,
    Fallback
};

const char *sourceName(ResponseSource source);

struct PipelineResult {
    std::string text;
    ResponseSource source = ResponseSource::Fallback;
};

struct ResponsePipelineOptions {
    bool cacheEnabled = true;
    bool cacheCrisisResponses = false;
    size_t cacheMaxSize = DEFAULT_CACHE_MAX_SIZE;
    size_t maxWorkers = 4;
    std::chrono::milliseconds generationTimeout = std::chrono::seconds(120);
    llm::GenerationParams generation;
    QualityGateOptions quality;
};

// Words kept from a generated answer before it is cut
constexpr size_t GENERATED_MAX_WORDS = 200;
// Shorter generated answers get the seek-help suffix
constexpr size_t GENERATED_MIN_WORDS = 30;
// Generations allowed to wait behind each busy pool thread
constexpr size_t QUEUED_GENERATIONS_PER_WORKER = 1;

// Per-request decision pipeline of a worker: cache, crisis override,
// template behind the quality gate, generation fallback, cache insert.
// The engine must outlive the pipeline.
class ResponsePipeline {
public:
    ResponsePipeline(llm::InferenceEngine &engine, ResponsePipelineOptions options = ResponsePipelineOptions());
    ~ResponsePipeline();

    ResponsePipeline(const ResponsePipeline &) = delete;
    ResponsePipeline &operator=(const ResponsePipeline &) = delete;

    // Never throws; failures turn into the safe fallback response.
    PipelineResult respond(const std::string &prompt);

    // Model path only, post-processed. Throws on engine failure.
    std::string generateModelResponse(const std::string &prompt);

    static std::string postProcess(const std::string &raw);

    ResponseCache &cache() { return responseCache; }
    const QualityGate &qualityGate() const { return gate; }

private:
    llm::InferenceEngine &engine;
    ResponsePipelineOptions options;
    ResponseCache responseCache;
    QualityGate gate;
    std::atomic<size_t> pendingGenerations{0};  // running or queued on the pool
    boost::asio::thread_pool generationPool;  // last: joined before the rest is torn down

    std::string generateOnPool(const std::string &prompt, const std::string &key);
};

} // namespace worker

#endif // RESPONSE_PIPELINE_HPP
