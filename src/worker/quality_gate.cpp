#include "quality_gate.hpp"
#include <sstream>
#include "prompt_classifier.hpp"

namespace worker {

namespace {

const std::vector<std::string> EMPATHY_MARKERS = {"understand", "feel", "hear", "sense"};
const std::vector<std::string> ACTION_MARKERS = {"try", "practice", "consider", "can", "help"};
const std::vector<std::string> DENYLIST = {"stupid", "crazy", "weird", "dumb"};

} // namespace

int QualityReport::passed() const {
    return static_cast<int>(length) + static_cast<int>(empathy) + static_cast<int>(actionable) +
           static_cast<int>(professional) + static_cast<int>(structure);
}

std::vector<std::string> splitWords(const std::string &text) {
    std::istringstream iss(text);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

size_t countWords(const std::string &text) {
    return splitWords(text).size();
}

bool hasEmpathyMarker(const std::string &text) {
    return containsAny(toLower(text), EMPATHY_MARKERS);
}

QualityGate::QualityGate(QualityGateOptions options) : options(options) {}

QualityReport QualityGate::evaluate(const std::string &response) const {
    std::string lowered = toLower(response);
    size_t words = countWords(response);

    QualityReport report;
    report.length = words >= options.minWords && words <= options.maxWords;
    report.empathy = containsAny(lowered, EMPATHY_MARKERS);
    report.actionable = containsAny(lowered, ACTION_MARKERS);
    report.professional = !containsAny(lowered, DENYLIST);
    report.structure = response.find_first_of(".!?") != std::string::npos;
    return report;
}

bool QualityGate::passes(const std::string &response) const {
    if (countWords(response) < options.minWords) {
        return false;
    }
    return evaluate(response).ratio() >= options.threshold;
}

} // namespace worker
