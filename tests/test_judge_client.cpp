#include <gtest/gtest.h>
#include "../src/llm/judge_client.hpp"

using llm::HttpJudgeClient;

TEST(JudgeClientTest, PromptNumbersEveryCandidate) {
    std::string prompt = HttpJudgeClient::buildJudgePrompt("How do I relax?", "Breathe slowly.", {"first", "second"});

    EXPECT_NE(prompt.find("Prompt: How do I relax?"), std::string::npos);
    EXPECT_NE(prompt.find("Base Response: Breathe slowly."), std::string::npos);
    EXPECT_NE(prompt.find("Therapist 1: first\nTherapist 2: second"), std::string::npos);
    EXPECT_NE(prompt.find("{\"scores\": [score1, score2, ...]}"), std::string::npos);
}

TEST(JudgeClientTest, ParsesScoresFromFencedReply) {
    std::vector<double> scores = HttpJudgeClient::parseScores("```json\n{\"scores\": [0.7, 0.25]}\n```", 2);
    ASSERT_EQ(scores.size(), 2u);
    EXPECT_DOUBLE_EQ(scores[0], 0.7);
    EXPECT_DOUBLE_EQ(scores[1], 0.25);
}

TEST(JudgeClientTest, ClampsAndAcceptsNumericStrings) {
    std::vector<double> scores = HttpJudgeClient::parseScores(R"({"scores": [1.5, -1, "0.4"]})", 3);
    EXPECT_DOUBLE_EQ(scores[0], 1.0);
    EXPECT_DOUBLE_EQ(scores[1], 0.0);
    EXPECT_DOUBLE_EQ(scores[2], 0.4);
}

TEST(JudgeClientTest, RejectsUnusableReplies) {
    EXPECT_THROW(HttpJudgeClient::parseScores("I think they are all good", 1), llm::JudgeParseError);
    EXPECT_THROW(HttpJudgeClient::parseScores(R"({"ratings": [0.5]})", 1), llm::JudgeParseError);
    EXPECT_THROW(HttpJudgeClient::parseScores(R"({"scores": [0.5]})", 2), llm::JudgeParseError);
    EXPECT_THROW(HttpJudgeClient::parseScores(R"({"scores": [null]})", 1), llm::JudgeParseError);
    EXPECT_THROW(HttpJudgeClient::parseScores(R"({"scores": ["high"]})", 1), llm::JudgeParseError);
}

TEST(JudgeClientTest, ExtractsMessageContent) {
    std::string body = R"({"choices": [{"message": {"role": "assistant", "content": "{\"scores\": [0.9]}"}}]})";
    EXPECT_EQ(HttpJudgeClient::extractContent(body), "{\"scores\": [0.9]}");
}

TEST(JudgeClientTest, ErrorBodiesThrow) {
    EXPECT_THROW(HttpJudgeClient::extractContent(R"({"error": {"message": "rate limited"}})"), llm::JudgeError);
    EXPECT_THROW(HttpJudgeClient::extractContent(R"({"choices": []})"), llm::JudgeParseError);
    EXPECT_THROW(HttpJudgeClient::extractContent("<html>502</html>"), llm::JudgeParseError);
}
