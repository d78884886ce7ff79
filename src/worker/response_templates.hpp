#ifndef RESPONSE_TEMPLATES_HPP
#define RESPONSE_TEMPLATES_HPP

#include <string>
#include <vector>
#include "prompt_classifier.hpp"

namespace worker {

struct ResponseTemplate {
    std::string validation;
    std::vector<std::string> techniques;  // ranked, most useful first
    std::string encouragement;
};

const ResponseTemplate &templateFor(Category category);

// Validation, two ranked techniques, encouragement.
std::string buildTemplateResponse(Category category);

const std::string &crisisResponse();
const std::string &safeFallbackResponse();
const std::string &therapistSystemPrompt();

} // namespace worker

#endif // RESPONSE_TEMPLATES_HPP
