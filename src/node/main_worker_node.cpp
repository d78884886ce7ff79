#include <iostream>
#include <string>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include "worker_node.hpp"
#include "../config/node_config.hpp"
#include "../llm/llama_wrapper.hpp"

// Global flag for program termination
std::atomic<bool> shouldExit(false);

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    shouldExit = true;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "Starting Worker Node..." << std::endl;

    config::WorkerConfig cfg;
    try {
        if (argc > 1) {
            cfg = config::loadWorkerConfig(argv[1]);
        } else {
            std::cout << "No config file given, using defaults" << std::endl;
            cfg = config::parseWorkerConfig(nlohmann::json::object());
        }
    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    if (cfg.requesters.empty() && !cfg.allowUnregistered) {
        std::cerr << "Warning: no registered requesters, every request will be rejected" << std::endl;
    }

    try {
        llm::LlamaWrapper model;
        std::cout << "Loading model from: " << cfg.model << std::endl;
        if (!model.loadModel(cfg.model, cfg.contextSize, cfg.threads, cfg.useGpu)) {
            // Cache, crisis and template paths still work without a model
            std::cerr << "Failed to load model, generated responses will fall back." << std::endl;
        }

        node::WorkerNode workerNode(model, cfg);
        if (!workerNode.initialize()) {
            return 1;
        }
        workerNode.startListening();

        std::cout << "Worker Node started. Press Ctrl+C to exit." << std::endl;

        while (!shouldExit) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        std::cout << "Shutting down worker node..." << std::endl;
        workerNode.stopListening();
        std::cout << "Worker node terminated." << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
