#include <iostream>
#include <string>
#include <memory>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include "evaluator_node.hpp"
#include "../config/node_config.hpp"
#include "../llm/llama_wrapper.hpp"
#include "../llm/judge_client.hpp"
#include "../p2p/zmq_peer_transport.hpp"

// Global flag for program termination
std::atomic<bool> shouldExit(false);

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    shouldExit = true;
}

namespace {

std::chrono::milliseconds toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "Starting Evaluator Node..." << std::endl;

    config::EvaluatorConfig cfg;
    try {
        if (argc > 1) {
            cfg = config::loadEvaluatorConfig(argv[1]);
        } else {
            std::cout << "No config file given, using defaults" << std::endl;
            cfg = config::parseEvaluatorConfig(nlohmann::json::object());
        }
    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    if (cfg.judge.apiKey.empty()) {
        std::cerr << "Warning: no judge API key configured, every judge call will fail and score 0" << std::endl;
    }

    try {
        llm::LlamaWrapper referenceModel;
        std::cout << "Loading reference model from: " << cfg.referenceModel << std::endl;
        if (!referenceModel.loadModel(cfg.referenceModel, cfg.referenceContextSize, cfg.threads, cfg.useGpu)) {
            std::cerr << "Failed to load reference model." << std::endl;
            return 1;
        }

        llm::JudgeClientOptions judgeOptions;
        judgeOptions.url = cfg.judge.url;
        judgeOptions.model = cfg.judge.model;
        judgeOptions.apiKey = cfg.judge.apiKey;
        judgeOptions.timeoutSeconds = cfg.judge.timeoutSeconds;
        llm::HttpJudgeClient judge(judgeOptions);

        p2p::ZmqPeerTransport transport(cfg.ip, cfg.port);
        if (!transport.bind()) {
            std::cerr << "Failed to bind reply listener on port " << cfg.port << std::endl;
            return 1;
        }

        reward::ReputationTracker reputation(cfg.reputationAlpha);
        if (!cfg.reputationFile.empty() && !reputation.load(cfg.reputationFile)) {
            std::cerr << "Could not read reputation file " << cfg.reputationFile << ", starting fresh" << std::endl;
        }

        reward::PromptSource prompts;
        if (!cfg.promptDataset.empty() && !prompts.loadDataset(cfg.promptDataset)) {
            std::cerr << "Falling back to built-in prompts" << std::endl;
        }

        std::unique_ptr<reward::RoundReporter> reporter;
        if (!cfg.reportFile.empty()) {
            reporter.reset(new reward::JsonlRoundReporter(cfg.reportFile));
        }

        node::EvaluatorOptions options;
        options.workers = cfg.workers;
        options.sampleSize = cfg.sampleSize;
        options.roundInterval = toMillis(cfg.roundIntervalSeconds);
        options.dispatchTimeout = toMillis(cfg.dispatchTimeoutSeconds);
        options.requesterId = cfg.requesterId;
        options.judgeInputBudget = cfg.judge.inputBudget;
        options.reference.maxNewTokens = cfg.referenceMaxTokens;
        options.reference.maxInputTokens = cfg.referenceContextSize - cfg.referenceMaxTokens;
        options.reputationFile = cfg.reputationFile;

        node::EvaluatorNode evaluator(referenceModel, judge, transport, reputation, prompts,
                                      reporter.get(), options);
        evaluator.start();

        std::cout << "Evaluator Node started. Press Ctrl+C to exit." << std::endl;

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        std::cout << "Shutting down evaluator node..." << std::endl;
        evaluator.stop();
        std::cout << "Evaluator node terminated." << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
