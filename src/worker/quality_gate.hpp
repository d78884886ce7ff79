#ifndef QUALITY_GATE_HPP
#define QUALITY_GATE_HPP

#include <string>
#include <vector>

namespace worker {

struct QualityReport {
    bool length = false;
    bool empathy = false;
    bool actionable = false;
    bool professional = false;
    bool structure = false;

    int passed() const;
    double ratio() const { return passed() / 5.0; }
};

struct QualityGateOptions {
    size_t minWords = 50;
    size_t maxWords = 250;
    double threshold = 0.7;
};

size_t countWords(const std::string &text);
std::vector<std::string> splitWords(const std::string &text);

bool hasEmpathyMarker(const std::string &text);

// Five boolean checks on a candidate response. A response under the minimum
// word count never passes; otherwise it passes when the share of successful
// checks reaches the threshold.
class QualityGate {
public:
    explicit QualityGate(QualityGateOptions options = QualityGateOptions());

    QualityReport evaluate(const std::string &response) const;
    bool passes(const std::string &response) const;

private:
    QualityGateOptions options;
};

} // namespace worker

#endif // QUALITY_GATE_HPP
