#include "judge_client.hpp"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <curl/curl.h>

using json = nlohmann::json;

namespace llm {

static size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
    size_t totalSize = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);
    response->append(static_cast<char*>(contents), totalSize);
    return totalSize;
}

static const char *JUDGE_SYSTEM_PROMPT = "You are a strict and fair judge for therapy responses.";

HttpJudgeClient::HttpJudgeClient(JudgeClientOptions options) : options(std::move(options)) {
    if (this->options.apiKey.empty()) {
        std::cerr << "[HttpJudgeClient] No API key configured, requests will likely be rejected" << std::endl;
    }
}

std::string HttpJudgeClient::buildJudgePrompt(const std::string &prompt,
                                              const std::string &reference,
                                              const std::vector<std::string> &candidates) {
    std::ostringstream numbered;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (i > 0) {
            numbered << "\n";
        }
        numbered << "Therapist " << (i + 1) << ": " << candidates[i];
    }

    std::ostringstream ss;
    ss << "You are an expert evaluator. Given the following prompt, the base response, and a set of therapist responses, "
       << "score each therapist's response on a scale from 0 to 1. "
       << "A score of 0.7 means the response is as good as the base response. Score higher if the response is better, lower if worse. "
       << "Reply in the following format (JSON):\n"
       << "{\"scores\": [score1, score2, ...]}\n\n"
       << "Prompt: " << prompt << "\n"
       << "Base Response: " << reference << "\n\n"
       << "Therapist Responses:\n" << numbered.str() << "\n\n"
       << "What are the scores for each response? (Output JSON only)";
    return ss.str();
}

std::vector<double> HttpJudgeClient::parseScores(const std::string &content, size_t expected) {
    // Models sometimes wrap the object in a code fence
    size_t begin = content.find('{');
    size_t end = content.rfind('}');
    if (begin == std::string::npos || end == std::string::npos || end < begin) {
        throw JudgeParseError("no JSON object in judge reply");
    }

    json result;
    try {
        result = json::parse(content.substr(begin, end - begin + 1));
    } catch (const json::parse_error &e) {
        throw JudgeParseError(std::string("invalid judge JSON: ") + e.what());
    }

    if (!result.contains("scores") || !result["scores"].is_array()) {
        throw JudgeParseError("judge reply has no 'scores' array");
    }

    const json &scores = result["scores"];
    if (scores.size() != expected) {
        throw JudgeParseError("judge returned " + std::to_string(scores.size()) +
                              " scores for " + std::to_string(expected) + " responses");
    }

    std::vector<double> parsed;
    parsed.reserve(scores.size());
    for (const auto &s : scores) {
        double value = 0.0;
        if (s.is_number()) {
            value = s.get<double>();
        } else if (s.is_string()) {
            try {
                value = std::stod(s.get<std::string>());
            } catch (const std::exception &) {
                throw JudgeParseError("non-numeric score: " + s.dump());
            }
        } else {
            throw JudgeParseError("non-numeric score: " + s.dump());
        }
        if (!(value == value)) {  // NaN
            value = 0.0;
        }
        parsed.push_back(std::max(0.0, std::min(1.0, value)));
    }
    return parsed;
}

std::string HttpJudgeClient::extractContent(const std::string &responseBody) {
    json response;
    try {
        response = json::parse(responseBody);
    } catch (const json::parse_error &e) {
        throw JudgeParseError(std::string("invalid completion response: ") + e.what());
    }

    if (response.contains("error")) {
        throw JudgeError("judge returned error: " + response["error"].dump());
    }

    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        throw JudgeParseError("completion response has no choices");
    }

    const json &message = response["choices"][0]["message"];
    if (!message.is_object() || !message.contains("content") || !message["content"].is_string()) {
        throw JudgeParseError("completion response has no message content");
    }
    return message["content"].get<std::string>();
}

std::vector<double> HttpJudgeClient::score(const std::string &prompt,
                                           const std::string &reference,
                                           const std::vector<std::string> &candidates) {
    if (candidates.empty()) {
        return {};
    }

    json requestData = {
        {"model", options.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", JUDGE_SYSTEM_PROMPT}},
            {{"role", "user"}, {"content", buildJudgePrompt(prompt, reference, candidates)}}
        })}
    };

    std::string responseStr = httpPost(requestData.dump(-1, ' ', false, json::error_handler_t::replace));
    std::string content = extractContent(responseStr);
    return parseScores(content, candidates.size());
}

std::string HttpJudgeClient::httpPost(const std::string &jsonPayload) {
    CURL *curl = curl_easy_init();
    if (!curl) {
        throw JudgeError("Could not initialize CURL");
    }

    std::string responseString;
    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth;
    if (!options.apiKey.empty()) {
        auth = "Authorization: Bearer " + options.apiKey;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, options.url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, jsonPayload.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseString);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, options.timeoutSeconds);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_easy_cleanup(curl);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        std::cerr << "[HttpJudgeClient] curl_easy_perform() failed: " << curl_easy_strerror(res) << std::endl;
        throw JudgeError(std::string("judge request failed: ") + curl_easy_strerror(res));
    }
    if (status >= 400) {
        throw JudgeError("judge HTTP status " + std::to_string(status) + ": " + responseString);
    }

    return responseString;
}

} // namespace llm
