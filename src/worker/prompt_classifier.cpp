#include "prompt_classifier.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace worker {

namespace {

const std::vector<std::pair<Category, std::vector<std::string>>> &categoryKeywords() {
    static const std::vector<std::pair<Category, std::vector<std::string>>> keywords = {
        {Category::Anxiety, {"anxiety", "anxious", "worry", "nervous", "panic", "fear", "worried"}},
        {Category::Depression, {"sad", "depressed", "hopeless", "empty", "worthless", "down", "low"}},
        {Category::Stress, {"stress", "overwhelmed", "pressure", "burned out", "exhausted"}},
        {Category::Relationship, {"relationship", "partner", "friends", "family", "conflict", "argument"}},
        {Category::Sleep, {"sleep", "insomnia", "can't sleep", "tired", "rest", "sleeping"}},
    };
    return keywords;
}

} // namespace

const char *categoryName(Category category) {
    switch (category) {
        case Category::Anxiety: return "anxiety";
        case Category::Depression: return "depression";
        case Category::Stress: return "stress";
        case Category::Relationship: return "relationship";
        case Category::Sleep: return "sleep";
        case Category::General: return "general";
    }
    return "general";
}

std::string toLower(const std::string &text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

bool containsAny(const std::string &lowered, const std::vector<std::string> &keywords) {
    for (const auto &keyword : keywords) {
        if (lowered.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

const std::vector<std::string> &crisisKeywords() {
    static const std::vector<std::string> keywords = {
        "suicide", "suicidal", "kill myself", "end it all", "end my life",
        "not worth living", "don't want to live", "do not want to live",
        "want to die", "want it to end", "hurt myself", "hurting myself",
        "self harm", "self-harm", "cutting", "overdose"
    };
    return keywords;
}

bool isCrisis(const std::string &prompt) {
    return containsAny(toLower(prompt), crisisKeywords());
}

Category classifyCategory(const std::string &prompt) {
    std::string lowered = toLower(prompt);
    for (const auto &entry : categoryKeywords()) {
        if (containsAny(lowered, entry.second)) {
            return entry.first;
        }
    }
    return Category::General;
}

PromptClass classifyPrompt(const std::string &prompt) {
    PromptClass result;
    result.crisis = isCrisis(prompt);
    result.category = classifyCategory(prompt);
    return result;
}

} // namespace worker
