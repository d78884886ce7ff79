#include <gtest/gtest.h>
#include "fakes.hpp"
#include "../src/worker/quality_gate.hpp"
#include "../src/worker/response_templates.hpp"

using testing_fakes::repeatWord;
using worker::QualityGate;

TEST(QualityGateTest, TooShortFailsEvenWhenEverythingElsePasses) {
    QualityGate gate;
    std::string response = "I understand you can try this practice today, it helps.";
    ASSERT_EQ(worker::countWords(response), 10u);

    worker::QualityReport report = gate.evaluate(response);
    EXPECT_FALSE(report.length);
    EXPECT_TRUE(report.empathy);
    EXPECT_TRUE(report.actionable);
    EXPECT_TRUE(report.professional);
    EXPECT_TRUE(report.structure);
    EXPECT_FALSE(gate.passes(response));
}

TEST(QualityGateTest, HundredWordsWithAllMarkersPasses) {
    QualityGate gate;
    std::string response = "I understand how you feel. You can try this practice. " + repeatWord("calm", 90) + ".";
    ASSERT_EQ(worker::countWords(response), 100u);

    worker::QualityReport report = gate.evaluate(response);
    EXPECT_EQ(report.passed(), 5);
    EXPECT_DOUBLE_EQ(report.ratio(), 1.0);
    EXPECT_TRUE(gate.passes(response));
}

TEST(QualityGateTest, DenylistedWordFailsProfessionalCheck) {
    QualityGate gate;
    worker::QualityReport report = gate.evaluate("That sounds crazy, but I understand.");
    EXPECT_FALSE(report.professional);
}

TEST(QualityGateTest, FourOfFiveChecksIsEnough) {
    QualityGate gate;
    // No empathy marker
    std::string response = "You can try this practice. " + repeatWord("steady", 60) + ".";
    worker::QualityReport report = gate.evaluate(response);
    EXPECT_FALSE(report.empathy);
    EXPECT_EQ(report.passed(), 4);
    EXPECT_TRUE(gate.passes(response));
}

TEST(QualityGateTest, ThreeOfFiveChecksFails) {
    QualityGate gate;
    // No empathy marker, no sentence terminator
    std::string response = "You can try this practice " + repeatWord("steady", 60);
    EXPECT_EQ(gate.evaluate(response).passed(), 3);
    EXPECT_FALSE(gate.passes(response));
}

TEST(QualityGateTest, TooLongFailsLengthCheck) {
    QualityGate gate;
    std::string response = "I understand. You can try. " + repeatWord("calm", 300) + ".";
    EXPECT_FALSE(gate.evaluate(response).length);
}

TEST(QualityGateTest, EveryCategoryTemplatePassesTheGate) {
    QualityGate gate;
    for (auto category : {worker::Category::Anxiety, worker::Category::Depression, worker::Category::Stress,
                          worker::Category::Relationship, worker::Category::Sleep}) {
        EXPECT_TRUE(gate.passes(worker::buildTemplateResponse(category)))
            << "template for " << worker::categoryName(category);
    }
}

TEST(QualityGateTest, WordCountSplitsOnAnyWhitespace) {
    EXPECT_EQ(worker::countWords(""), 0u);
    EXPECT_EQ(worker::countWords("  one\ttwo\n three  "), 3u);
}
