#ifndef NODE_CONFIG_HPP
#define NODE_CONFIG_HPP

#include <string>
#include <vector>
#include <map>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

struct JudgeConfig {
    std::string url = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-4";
    std::string apiKey;          // falls back to $OPENAI_API_KEY
    size_t inputBudget = 16000;  // characters per judge call
    long timeoutSeconds = 120;
};

struct EvaluatorConfig {
    std::string ip = "127.0.0.1";
    int port = 5555;
    std::string requesterId = "evaluator";
    std::vector<std::string> workers;  // "ip:port"
    size_t sampleSize = 10;
    double roundIntervalSeconds = 300.0;
    double dispatchTimeoutSeconds = 500.0;

    std::string referenceModel = "models/reference.gguf";
    int referenceMaxTokens = 1000;
    int referenceContextSize = 4096;
    int threads = 0;
    bool useGpu = false;

    std::string promptDataset;  // empty: built-in prompts
    std::string reputationFile = "reputation.json";
    double reputationAlpha = 0.1;
    std::string reportFile = "rounds.jsonl";

    JudgeConfig judge;
};

struct WorkerConfig {
    std::string ip = "127.0.0.1";
    int port = 6000;

    std::string model = "models/worker.gguf";
    int contextSize = 2048;
    int threads = 0;
    bool useGpu = false;

    bool cacheEnabled = true;
    size_t cacheMaxSize = 1000;
    bool cacheCrisisResponses = false;

    size_t maxWorkers = 4;
    double generationTimeoutSeconds = 120.0;
    int maxInputTokens = 512;
    int maxNewTokens = 150;
    float temperature = 0.7f;

    bool allowUnregistered = false;
    std::map<std::string, double> requesters;  // requester id -> stake
};

// Missing keys keep their defaults; keys of the wrong type throw ConfigError.
EvaluatorConfig parseEvaluatorConfig(const nlohmann::json &root);
WorkerConfig parseWorkerConfig(const nlohmann::json &root);

// Throws ConfigError if the file cannot be read or parsed.
nlohmann::json readConfigFile(const std::string &path);

EvaluatorConfig loadEvaluatorConfig(const std::string &path);
WorkerConfig loadWorkerConfig(const std::string &path);

} // namespace config

#endif // NODE_CONFIG_HPP
