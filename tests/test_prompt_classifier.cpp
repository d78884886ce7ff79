#include <gtest/gtest.h>
#include "../src/worker/prompt_classifier.hpp"
#include "../src/worker/response_templates.hpp"

using worker::Category;

TEST(PromptClassifierTest, MatchesCategoryKeywords) {
    EXPECT_EQ(worker::classifyCategory("I feel so anxious all the time"), Category::Anxiety);
    EXPECT_EQ(worker::classifyCategory("I've been feeling hopeless"), Category::Depression);
    EXPECT_EQ(worker::classifyCategory("Work leaves me overwhelmed"), Category::Stress);
    EXPECT_EQ(worker::classifyCategory("My partner and I keep arguing"), Category::Relationship);
    EXPECT_EQ(worker::classifyCategory("I have insomnia"), Category::Sleep);
    EXPECT_EQ(worker::classifyCategory("What is mindfulness?"), Category::General);
}

TEST(PromptClassifierTest, MatchingIsCaseInsensitive) {
    EXPECT_EQ(worker::classifyCategory("PANIC attacks"), Category::Anxiety);
    EXPECT_TRUE(worker::isCrisis("I WANT TO DIE"));
}

TEST(PromptClassifierTest, EarlierCategoryWins) {
    EXPECT_EQ(worker::classifyCategory("I'm anxious and I have insomnia"), Category::Anxiety);
}

TEST(PromptClassifierTest, DetectsCrisisPhrases) {
    EXPECT_TRUE(worker::isCrisis("I don't want to live anymore"));
    EXPECT_TRUE(worker::isCrisis("sometimes I think about suicide"));
    EXPECT_TRUE(worker::isCrisis("I keep thinking about self-harm"));
    EXPECT_FALSE(worker::isCrisis("How do I improve my sleep quality?"));
}

TEST(PromptClassifierTest, ClassifyPromptCarriesBothFlags) {
    worker::PromptClass result = worker::classifyPrompt("I'm sad and thinking about suicide");
    EXPECT_TRUE(result.crisis);
    EXPECT_EQ(result.category, Category::Depression);

    result = worker::classifyPrompt("How do I set healthy boundaries?");
    EXPECT_FALSE(result.crisis);
}

TEST(ResponseTemplatesTest, TemplateHasValidationTwoTechniquesAndEncouragement) {
    const worker::ResponseTemplate &tmpl = worker::templateFor(Category::Stress);
    std::string response = worker::buildTemplateResponse(Category::Stress);

    EXPECT_EQ(response.rfind(tmpl.validation, 0), 0u);
    EXPECT_NE(response.find("1. " + tmpl.techniques[0]), std::string::npos);
    EXPECT_NE(response.find("2. " + tmpl.techniques[1]), std::string::npos);
    EXPECT_EQ(response.find("3. "), std::string::npos);
    EXPECT_EQ(response.substr(response.size() - tmpl.encouragement.size()), tmpl.encouragement);
}

TEST(ResponseTemplatesTest, CrisisAndFallbackAreDistinct) {
    EXPECT_NE(worker::crisisResponse(), worker::safeFallbackResponse());
    EXPECT_NE(worker::crisisResponse().find("988"), std::string::npos);
}
