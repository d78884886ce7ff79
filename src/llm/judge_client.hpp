#ifndef JUDGE_CLIENT_HPP
#define JUDGE_CLIENT_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "judge_oracle.hpp"

namespace llm {

struct JudgeClientOptions {
    std::string url = "https://api.openai.com/v1/chat/completions";
    std::string model = "gpt-4";
    std::string apiKey;
    long timeoutSeconds = 120;
};

// LLM-as-judge over an OpenAI compatible chat completions endpoint.
class HttpJudgeClient : public JudgeOracle {
public:
    explicit HttpJudgeClient(JudgeClientOptions options);

    std::vector<double> score(const std::string &prompt,
                              const std::string &reference,
                              const std::vector<std::string> &candidates) override;

    // Exposed for tests
    static std::string buildJudgePrompt(const std::string &prompt,
                                        const std::string &reference,
                                        const std::vector<std::string> &candidates);

    // Parses the judge's message content, clamping each score to [0,1].
    // Throws JudgeParseError if the content is not {"scores": [numbers...]}
    // of the expected length.
    static std::vector<double> parseScores(const std::string &content, size_t expected);

    // Extracts choices[0].message.content from a completion response body.
    static std::string extractContent(const std::string &responseBody);

private:
    JudgeClientOptions options;

    std::string httpPost(const std::string &jsonPayload);
};

} // namespace llm

#endif // JUDGE_CLIENT_HPP
