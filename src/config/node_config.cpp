#include "node_config.hpp"
#include <iostream>
#include <fstream>
#include <cstdlib>
#include <limits>

using json = nlohmann::json;

namespace config {

namespace {

void read(const json &root, const char *key, std::string &target) {
    if (!root.contains(key)) return;
    if (!root[key].is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    target = root[key].get<std::string>();
}

void read(const json &root, const char *key, bool &target) {
    if (!root.contains(key)) return;
    if (!root[key].is_boolean()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    target = root[key].get<bool>();
}

void read(const json &root, const char *key, double &target) {
    if (!root.contains(key)) return;
    if (!root[key].is_number()) {
        throw ConfigError(std::string("'") + key + "' must be a number");
    }
    target = root[key].get<double>();
}

void read(const json &root, const char *key, float &target) {
    double value = target;
    read(root, key, value);
    target = static_cast<float>(value);
}

void read(const json &root, const char *key, long &target) {
    if (!root.contains(key)) return;
    if (!root[key].is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    target = root[key].get<long>();
}

void read(const json &root, const char *key, int &target) {
    long value = target;
    read(root, key, value);
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigError(std::string("'") + key + "' out of range: " + std::to_string(value));
    }
    target = static_cast<int>(value);
}

void read(const json &root, const char *key, size_t &target) {
    if (!root.contains(key)) return;
    const json &value = root[key];
    if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<long long>() < 0)) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    target = value.get<size_t>();
}

void requirePort(int port, const char *what) {
    if (port <= 0 || port > 65535) {
        throw ConfigError(std::string(what) + " port out of range: " + std::to_string(port));
    }
}

} // namespace

EvaluatorConfig parseEvaluatorConfig(const json &root) {
    if (!root.is_object()) {
        throw ConfigError("evaluator config must be a JSON object");
    }

    EvaluatorConfig cfg;
    read(root, "ip", cfg.ip);
    read(root, "port", cfg.port);
    read(root, "requester_id", cfg.requesterId);
    read(root, "sample_size", cfg.sampleSize);
    read(root, "round_interval", cfg.roundIntervalSeconds);
    read(root, "dispatch_timeout", cfg.dispatchTimeoutSeconds);
    read(root, "reference_model", cfg.referenceModel);
    read(root, "reference_max_tokens", cfg.referenceMaxTokens);
    read(root, "reference_context_size", cfg.referenceContextSize);
    read(root, "threads", cfg.threads);
    read(root, "use_gpu", cfg.useGpu);
    read(root, "prompt_dataset", cfg.promptDataset);
    read(root, "reputation_file", cfg.reputationFile);
    read(root, "reputation_alpha", cfg.reputationAlpha);
    read(root, "report_file", cfg.reportFile);

    if (root.contains("workers")) {
        if (!root["workers"].is_array()) {
            throw ConfigError("'workers' must be an array of \"ip:port\" strings");
        }
        for (const auto &worker : root["workers"]) {
            if (!worker.is_string() || worker.get<std::string>().find(':') == std::string::npos) {
                throw ConfigError("invalid worker endpoint: " + worker.dump());
            }
            cfg.workers.push_back(worker.get<std::string>());
        }
    }

    if (root.contains("judge")) {
        const json &judge = root["judge"];
        if (!judge.is_object()) {
            throw ConfigError("'judge' must be an object");
        }
        read(judge, "url", cfg.judge.url);
        read(judge, "model", cfg.judge.model);
        read(judge, "api_key", cfg.judge.apiKey);
        read(judge, "input_budget", cfg.judge.inputBudget);
        read(judge, "timeout", cfg.judge.timeoutSeconds);
    }
    if (cfg.judge.apiKey.empty()) {
        if (const char *key = std::getenv("OPENAI_API_KEY")) {
            cfg.judge.apiKey = key;
        }
    }

    requirePort(cfg.port, "evaluator");
    if (cfg.sampleSize == 0) {
        throw ConfigError("'sample_size' must be at least 1");
    }
    if (cfg.roundIntervalSeconds < 0 || cfg.dispatchTimeoutSeconds <= 0) {
        throw ConfigError("'round_interval' must be >= 0 and 'dispatch_timeout' > 0");
    }
    if (!(cfg.reputationAlpha > 0.0 && cfg.reputationAlpha <= 1.0)) {
        throw ConfigError("'reputation_alpha' must be in (0, 1]");
    }
    if (cfg.referenceMaxTokens <= 0 || cfg.referenceMaxTokens >= cfg.referenceContextSize) {
        throw ConfigError("'reference_max_tokens' must be positive and below 'reference_context_size'");
    }
    return cfg;
}

WorkerConfig parseWorkerConfig(const json &root) {
    if (!root.is_object()) {
        throw ConfigError("worker config must be a JSON object");
    }

    WorkerConfig cfg;
    read(root, "ip", cfg.ip);
    read(root, "port", cfg.port);
    read(root, "model", cfg.model);
    read(root, "context_size", cfg.contextSize);
    read(root, "threads", cfg.threads);
    read(root, "use_gpu", cfg.useGpu);
    read(root, "cache_enabled", cfg.cacheEnabled);
    read(root, "cache_max_size", cfg.cacheMaxSize);
    read(root, "cache_crisis_responses", cfg.cacheCrisisResponses);
    read(root, "max_workers", cfg.maxWorkers);
    read(root, "generation_timeout", cfg.generationTimeoutSeconds);
    read(root, "max_input_tokens", cfg.maxInputTokens);
    read(root, "max_new_tokens", cfg.maxNewTokens);
    read(root, "temperature", cfg.temperature);
    read(root, "allow_unregistered", cfg.allowUnregistered);

    if (root.contains("requesters")) {
        const json &requesters = root["requesters"];
        if (!requesters.is_object()) {
            throw ConfigError("'requesters' must map requester ids to stake");
        }
        for (auto it = requesters.begin(); it != requesters.end(); ++it) {
            if (!it.value().is_number()) {
                throw ConfigError("stake of requester '" + it.key() + "' must be a number");
            }
            cfg.requesters[it.key()] = it.value().get<double>();
        }
    }

    requirePort(cfg.port, "worker");
    if (cfg.cacheMaxSize == 0) {
        throw ConfigError("'cache_max_size' must be at least 1");
    }
    if (cfg.maxWorkers == 0) {
        throw ConfigError("'max_workers' must be at least 1");
    }
    if (cfg.generationTimeoutSeconds <= 0 || cfg.maxNewTokens <= 0 || cfg.maxInputTokens <= 0) {
        throw ConfigError("generation limits must be positive");
    }
    if (cfg.contextSize > 0 && cfg.maxNewTokens >= cfg.contextSize) {
        throw ConfigError("'max_new_tokens' must be below 'context_size'");
    }
    return cfg;
}

json readConfigFile(const std::string &path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("could not open config file: " + path);
    }
    try {
        json root;
        file >> root;
        return root;
    } catch (const json::parse_error &e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
}

EvaluatorConfig loadEvaluatorConfig(const std::string &path) {
    std::cout << "[Config] Loading evaluator config from: " << path << std::endl;
    return parseEvaluatorConfig(readConfigFile(path));
}

WorkerConfig loadWorkerConfig(const std::string &path) {
    std::cout << "[Config] Loading worker config from: " << path << std::endl;
    return parseWorkerConfig(readConfigFile(path));
}

} // namespace config
