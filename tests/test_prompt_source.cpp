#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include "../src/reward/prompt_source.hpp"

using reward::PromptSource;

namespace {

std::string writeTempFile(const std::string &name, const std::string &content) {
    std::string path = ::testing::TempDir() + name;
    std::ofstream file(path);
    file << content;
    return path;
}

} // namespace

TEST(PromptSourceTest, DrawsFromBuiltinPrompts) {
    PromptSource source;
    ASSERT_EQ(source.prompts().size(), 10u);

    for (int i = 0; i < 50; ++i) {
        std::string prompt = source.draw();
        EXPECT_NE(std::find(source.prompts().begin(), source.prompts().end(), prompt), source.prompts().end());
    }
}

TEST(PromptSourceTest, EmptyListIsRejected) {
    EXPECT_THROW(PromptSource(std::vector<std::string>{}), std::invalid_argument);
}

TEST(PromptSourceTest, LoadsArrayOfStrings) {
    std::string path = writeTempFile("carenet_prompts_strings.json", R"(["one", "two"])");
    PromptSource source;

    ASSERT_TRUE(source.loadDataset(path));
    EXPECT_EQ(source.prompts(), (std::vector<std::string>{"one", "two"}));
    std::remove(path.c_str());
}

TEST(PromptSourceTest, LoadsInputObjectsAndSkipsBadItems) {
    std::string path = writeTempFile("carenet_prompts_objects.json",
                                     R"([{"input": "first"}, {"output": "x"}, 3, {"input": "second"}])");
    PromptSource source;

    ASSERT_TRUE(source.loadDataset(path));
    EXPECT_EQ(source.prompts(), (std::vector<std::string>{"first", "second"}));
    std::remove(path.c_str());
}

TEST(PromptSourceTest, UnusableDatasetKeepsCurrentPrompts) {
    std::string path = writeTempFile("carenet_prompts_empty.json", R"([{"output": "x"}])");
    PromptSource source(std::vector<std::string>{"keep me"});

    EXPECT_FALSE(source.loadDataset(path));
    EXPECT_FALSE(source.loadDataset("/nonexistent/prompts.json"));
    EXPECT_EQ(source.draw(), "keep me");
    std::remove(path.c_str());
}
