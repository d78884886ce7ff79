#ifndef INFERENCE_ENGINE_HPP
#define INFERENCE_ENGINE_HPP

#include <string>
#include <stdexcept>

namespace llm {

struct GenerationParams {
    int maxInputTokens = 512;   // prompt is cut to this many tokens (tail kept)
    int maxNewTokens = 150;
    float temperature = 0.7f;
};

// Drops a multi-byte UTF-8 sequence that was cut off at the end of text,
// as happens when generation stops in the middle of a character.
inline std::string dropIncompleteUtf8Tail(std::string text) {
    const size_t size = text.size();
    size_t lead = size;
    for (size_t back = 1; back <= 4 && back <= size; ++back) {
        unsigned char c = static_cast<unsigned char>(text[size - back]);
        if ((c & 0xC0) != 0x80) {
            lead = size - back;
            break;
        }
    }
    if (lead == size) {
        return text;
    }

    unsigned char c = static_cast<unsigned char>(text[lead]);
    size_t expected = 1;
    if (c >= 0xF0 && c <= 0xF7) {
        expected = 4;
    } else if (c >= 0xE0 && c <= 0xEF) {
        expected = 3;
    } else if (c >= 0xC0 && c <= 0xDF) {
        expected = 2;
    }
    if (size - lead < expected) {
        text.erase(lead);
    }
    return text;
}

class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string &what) : std::runtime_error(what) {}
};

// Text generation backend. Implementations return only the newly generated
// continuation, never the echoed prompt, and throw InferenceError on failure.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    virtual std::string generate(const std::string &prompt, const GenerationParams &params) = 0;
};

} // namespace llm

#endif // INFERENCE_ENGINE_HPP
