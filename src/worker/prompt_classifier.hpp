#ifndef PROMPT_CLASSIFIER_HPP
#define PROMPT_CLASSIFIER_HPP

#include <string>
#include <vector>

namespace worker {

enum class Category {
    Anxiety,
    Depression,
    Stress,
    Relationship,
    Sleep,
    General
};

struct PromptClass {
    Category category = Category::General;
    bool crisis = false;
};

const char *categoryName(Category category);

std::string toLower(const std::string &text);

// Case-insensitive substring match against any keyword.
bool containsAny(const std::string &lowered, const std::vector<std::string> &keywords);

const std::vector<std::string> &crisisKeywords();

bool isCrisis(const std::string &prompt);

// First category whose keywords match, in declaration order; General otherwise.
Category classifyCategory(const std::string &prompt);

PromptClass classifyPrompt(const std::string &prompt);

} // namespace worker

#endif // PROMPT_CLASSIFIER_HPP
