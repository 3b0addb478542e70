/**
 * @file test_capability_matcher.cpp
 * @brief Unit tests for CapabilityMatcher scoring and selection.
 */

#include "scheduler/capability_matcher.hpp"

#include <gtest/gtest.h>

using namespace conductor;

static Worker make_worker(const std::string& id, CapabilitySet caps) {
    return Worker{.id = id, .capabilities = std::move(caps)};
}

TEST(CapabilityMatcherTest, FullOverlapScoresOne) {
    CapabilityMatcher matcher;
    EXPECT_DOUBLE_EQ(matcher.match_score({"python", "ml"}, {"python", "ml", "sql"}), 1.0);
}

TEST(CapabilityMatcherTest, PartialOverlapIsFraction) {
    CapabilityMatcher matcher;
    EXPECT_DOUBLE_EQ(matcher.match_score({"python", "ml"}, {"python"}), 0.5);
    EXPECT_DOUBLE_EQ(matcher.match_score({"a", "b", "c", "d"}, {"a"}), 0.25);
}

TEST(CapabilityMatcherTest, NoOverlapScoresZero) {
    CapabilityMatcher matcher;
    EXPECT_DOUBLE_EQ(matcher.match_score({"cuda"}, {"python"}), 0.0);
    EXPECT_DOUBLE_EQ(matcher.match_score({"cuda"}, {}), 0.0);
}

TEST(CapabilityMatcherTest, EmptyRequirementUsesConfiguredScore) {
    CapabilityMatcher defaults;
    EXPECT_DOUBLE_EQ(defaults.match_score({}, {"python"}), 1.0);
    EXPECT_DOUBLE_EQ(defaults.match_score({}, {}), 1.0);

    CapabilityMatcher strict(MatcherConfig{.empty_requirement_score = 0.0});
    EXPECT_DOUBLE_EQ(strict.match_score({}, {"python"}), 0.0);
}

TEST(CapabilityMatcherTest, CaseSensitiveByDefault) {
    CapabilityMatcher matcher;
    EXPECT_DOUBLE_EQ(matcher.match_score({"Python"}, {"python"}), 0.0);

    CapabilityMatcher relaxed(MatcherConfig{.case_insensitive = true});
    EXPECT_DOUBLE_EQ(relaxed.match_score({"Python"}, {"python"}), 1.0);
    // {"ML", "ml"} collapses to a single requirement.
    EXPECT_DOUBLE_EQ(relaxed.match_score({"ML", "ml"}, {"ml"}), 1.0);
}

TEST(CapabilityMatcherTest, BestMatchNullWhenNoOverlap) {
    CapabilityMatcher matcher;
    std::vector<Worker> workers{make_worker("w1", {"python"}), make_worker("w2", {"sql"})};
    EXPECT_FALSE(matcher.find_best_match({"cuda"}, workers).has_value());
}

TEST(CapabilityMatcherTest, BestMatchNullWithoutCandidates) {
    CapabilityMatcher matcher;
    EXPECT_FALSE(matcher.find_best_match({"python"}, {}).has_value());
    EXPECT_FALSE(matcher.find_best_match({}, {}).has_value());
}

TEST(CapabilityMatcherTest, BestMatchPrefersSuperset) {
    CapabilityMatcher matcher;
    std::vector<Worker> workers{
        make_worker("partial", {"python"}),
        make_worker("superset", {"python", "ml", "gpu"}),
    };
    auto best = matcher.find_best_match({"python", "ml"}, workers);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->id, "superset");
}

TEST(CapabilityMatcherTest, PartialMatchStillReturned) {
    CapabilityMatcher matcher;
    std::vector<Worker> workers{make_worker("w1", {"python"})};
    auto best = matcher.find_best_match({"python", "ml"}, workers);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->id, "w1");
}

TEST(CapabilityMatcherTest, TieGoesToFirstCandidate) {
    CapabilityMatcher matcher;
    std::vector<Worker> workers{
        make_worker("second-best", {"python"}),
        make_worker("first", {"python", "ml"}),
        make_worker("also-full", {"ml", "python"}),
    };
    auto best = matcher.find_best_match({"python", "ml"}, workers);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->id, "first");
}

TEST(CapabilityMatcherTest, EmptyRequirementPicksFirstWorker) {
    CapabilityMatcher matcher;
    std::vector<Worker> workers{make_worker("w1", {}), make_worker("w2", {"x"})};
    auto best = matcher.find_best_match({}, workers);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->id, "w1");
}

TEST(CapabilityMatcherTest, RankOrdersByScoreThenInput) {
    CapabilityMatcher matcher;
    std::vector<Worker> workers{
        make_worker("none", {"sql"}),
        make_worker("half-a", {"python"}),
        make_worker("full", {"python", "ml"}),
        make_worker("half-b", {"ml"}),
    };
    auto ranked = matcher.rank({"python", "ml"}, workers);
    ASSERT_EQ(ranked.size(), 4u);
    EXPECT_EQ(ranked[0].worker_id, "full");
    EXPECT_EQ(ranked[1].worker_id, "half-a");
    EXPECT_EQ(ranked[2].worker_id, "half-b");
    EXPECT_EQ(ranked[3].worker_id, "none");
    EXPECT_DOUBLE_EQ(ranked[3].score, 0.0);
}
