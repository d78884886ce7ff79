#include "prompt_source.hpp"
#include <iostream>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace reward {

std::vector<std::string> PromptSource::builtinPrompts() {
    return {
        "How can I manage my anxiety?",
        "What should I do if I feel overwhelmed at work?",
        "How do I improve my sleep quality?",
        "I'm feeling sad lately, what can help?",
        "How can I build better relationships?",
        "What are some tips for handling stress?",
        "How do I set healthy boundaries?",
        "What can I do to boost my self-esteem?",
        "How do I cope with loneliness?",
        "What are effective ways to relax?",
    };
}

PromptSource::PromptSource() : PromptSource(builtinPrompts()) {}

PromptSource::PromptSource(std::vector<std::string> prompts)
    : promptList(std::move(prompts)), rng(std::random_device{}()) {
    if (promptList.empty()) {
        throw std::invalid_argument("prompt source needs at least one prompt");
    }
}

bool PromptSource::loadDataset(const std::string &filePath) {
    std::cout << "[PromptSource] Loading prompt dataset from: " << filePath << std::endl;

    try {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            std::cerr << "[PromptSource] Failed to open prompt dataset file: " << filePath << std::endl;
            return false;
        }

        json jsonData;
        file >> jsonData;

        if (!jsonData.is_array()) {
            std::cerr << "[PromptSource] Prompt dataset must be a JSON array" << std::endl;
            return false;
        }

        std::vector<std::string> loaded;
        for (const auto &item : jsonData) {
            if (item.is_string()) {
                loaded.push_back(item.get<std::string>());
            } else if (item.is_object() && item.contains("input") && item["input"].is_string()) {
                loaded.push_back(item["input"].get<std::string>());
            } else {
                std::cerr << "[PromptSource] Item missing required 'input' field" << std::endl;
            }
        }

        if (loaded.empty()) {
            std::cerr << "[PromptSource] Dataset " << filePath << " holds no prompts, keeping current list" << std::endl;
            return false;
        }

        promptList = std::move(loaded);
        std::cout << "[PromptSource] Loaded " << promptList.size() << " prompts" << std::endl;
        return true;
    } catch (const std::exception &e) {
        std::cerr << "[PromptSource] Error loading prompt dataset: " << e.what() << std::endl;
        return false;
    }
}

std::string PromptSource::draw() {
    std::uniform_int_distribution<size_t> dist(0, promptList.size() - 1);
    return promptList[dist(rng)];
}

} // namespace reward
