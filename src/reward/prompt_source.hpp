#ifndef PROMPT_SOURCE_HPP
#define PROMPT_SOURCE_HPP

#include <string>
#include <vector>
#include <random>

namespace reward {

// Prompts the evaluator draws from each round.
class PromptSource {
public:
    PromptSource();
    explicit PromptSource(std::vector<std::string> prompts);

    // Replaces the built-in prompts with a JSON dataset: either an array of
    // strings or an array of {"input": "..."} objects. Returns false and keeps
    // the current prompts if the file is missing or holds no usable prompt.
    bool loadDataset(const std::string &filePath);

    std::string draw();

    const std::vector<std::string> &prompts() const { return promptList; }

    static std::vector<std::string> builtinPrompts();

private:
    std::vector<std::string> promptList;
    std::mt19937 rng;
};

} // namespace reward

#endif // PROMPT_SOURCE_HPP
