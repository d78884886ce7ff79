#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <limits>
#include "../src/reward/reputation_tracker.hpp"

using reward::ReputationTracker;

TEST(ReputationTrackerTest, MovingAverageOfNormalizedScores) {
    ReputationTracker tracker(0.1);

    tracker.update({{"a", 100.0}, {"b", 50.0}});
    EXPECT_NEAR(tracker.getReputationScore("a"), 0.1, 1e-12);
    EXPECT_NEAR(tracker.getReputationScore("b"), 0.05, 1e-12);

    tracker.update({{"a", 100.0}});
    EXPECT_NEAR(tracker.getReputationScore("a"), 0.1 + 0.9 * 0.1, 1e-12);
    // Workers missing from a round keep their standing
    EXPECT_NEAR(tracker.getReputationScore("b"), 0.05, 1e-12);
    EXPECT_DOUBLE_EQ(tracker.getReputationScore("unknown"), 0.0);
}

TEST(ReputationTrackerTest, ZeroScoreDecaysStanding) {
    ReputationTracker tracker(0.5);
    tracker.update({{"a", 80.0}});
    tracker.update({{"a", 0.0}});
    EXPECT_NEAR(tracker.getReputationScore("a"), 0.2, 1e-12);
}

TEST(ReputationTrackerTest, NonFiniteScoreCountsAsZero) {
    ReputationTracker tracker(0.5);
    tracker.update({{"a", std::numeric_limits<double>::quiet_NaN()}});
    EXPECT_DOUBLE_EQ(tracker.getReputationScore("a"), 0.0);
}

TEST(ReputationTrackerTest, WeightsSumToOne) {
    ReputationTracker tracker(1.0);
    EXPECT_TRUE(tracker.weights().empty());

    tracker.update({{"a", 30.0}, {"b", 10.0}, {"c", 0.0}});
    auto weights = tracker.weights();
    EXPECT_NEAR(weights["a"], 0.75, 1e-12);
    EXPECT_NEAR(weights["b"], 0.25, 1e-12);
    EXPECT_DOUBLE_EQ(weights["c"], 0.0);
}

TEST(ReputationTrackerTest, AllZeroStandingGivesZeroWeights) {
    ReputationTracker tracker;
    tracker.update({{"a", 0.0}});
    EXPECT_DOUBLE_EQ(tracker.weights()["a"], 0.0);
}

TEST(ReputationTrackerTest, RejectsInvalidAlpha) {
    EXPECT_THROW(ReputationTracker(0.0), std::invalid_argument);
    EXPECT_THROW(ReputationTracker(1.5), std::invalid_argument);
}

TEST(ReputationTrackerTest, SavedStateMergesOnLoad) {
    std::string path = ::testing::TempDir() + "carenet_reputation.json";
    {
        ReputationTracker tracker;
        tracker.update({{"a", 100.0}, {"b", 40.0}});
        ASSERT_TRUE(tracker.save(path));
    }

    ReputationTracker restored;
    restored.update({{"c", 100.0}});
    ASSERT_TRUE(restored.load(path));

    EXPECT_NEAR(restored.getReputationScore("a"), 0.1, 1e-12);
    EXPECT_NEAR(restored.getReputationScore("b"), 0.04, 1e-12);
    EXPECT_NEAR(restored.getReputationScore("c"), 0.1, 1e-12);
    std::remove(path.c_str());
}

TEST(ReputationTrackerTest, MissingFileIsAFreshStart) {
    ReputationTracker tracker;
    EXPECT_TRUE(tracker.load("/nonexistent/carenet_reputation.json"));
    EXPECT_TRUE(tracker.scores().empty());
}

TEST(ReputationTrackerTest, CorruptFileIsReported) {
    std::string path = ::testing::TempDir() + "carenet_reputation_corrupt.json";
    {
        std::ofstream file(path);
        file << "{\"alpha\": 0.1}";
    }
    ReputationTracker tracker;
    EXPECT_FALSE(tracker.load(path));
    std::remove(path.c_str());
}
