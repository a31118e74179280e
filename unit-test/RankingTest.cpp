#include "gtest/gtest.h"
#include "grader/ranking.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;
using json = nlohmann::json;

static analysis_record make_record(const string &solution_id, const string &candidate_id, double composite,
                                   int64_t submitted_at) {
    analysis_record record;
    record.solution_id = solution_id;
    record.test_id = "t1";
    record.candidate_id = candidate_id;
    record.composite = composite;
    record.submitted_at = submitted_at;
    return record;
}

static vector<string> order(const vector<ranking_entry> &rankings) {
    vector<string> ids;
    for (auto &entry : rankings) ids.push_back(entry.solution_id);
    return ids;
}

TEST(RankingTest, HigherCompositeRanksFirst) {
    auto rankings = rank_records({make_record("s1", "alice", 0.5, 100),
                                  make_record("s2", "bob", 0.9, 300),
                                  make_record("s3", "carol", 0.7, 200)});
    EXPECT_EQ(order(rankings), (vector<string>{"s2", "s3", "s1"}));
    for (size_t i = 0; i < rankings.size(); ++i)
        EXPECT_EQ(rankings[i].rank, i + 1);
}

TEST(RankingTest, TiesBrokenByEarlierSubmission) {
    auto rankings = rank_records({make_record("s1", "alice", 0.8, 300),
                                  make_record("s2", "bob", 0.8, 100),
                                  make_record("s3", "carol", 0.8, 200)});
    EXPECT_EQ(order(rankings), (vector<string>{"s2", "s3", "s1"}));
}

TEST(RankingTest, FullTiesBrokenByIdentifiers) {
    auto rankings = rank_records({make_record("s9", "bob", 0.8, 100),
                                  make_record("s2", "alice", 0.8, 100),
                                  make_record("s1", "alice", 0.8, 100)});
    EXPECT_EQ(order(rankings), (vector<string>{"s1", "s2", "s9"}));
    EXPECT_EQ(rankings.back().rank, 3u);
}

TEST(RankingTest, OrderDoesNotDependOnInput) {
    vector<analysis_record> records = {make_record("s1", "alice", 0.6, 100),
                                       make_record("s2", "bob", 0.6, 100),
                                       make_record("s3", "carol", 0.9, 500),
                                       make_record("s4", "dave", 0.1, 50)};
    auto expected = order(rank_records(records));
    reverse(records.begin(), records.end());
    EXPECT_EQ(order(rank_records(records)), expected);
    swap(records[0], records[2]);
    EXPECT_EQ(order(rank_records(records)), expected);
}

TEST(RankingTest, EntryCarriesScores) {
    analysis_record record = make_record("s1", "alice", 0.75, 100);
    record.scores[dimension::CORRECTNESS] = 1.0;
    record.scores[dimension::STYLE] = nullopt;
    record.ai_probability = 0.25;
    auto rankings = rank_records({record});

    ASSERT_EQ(rankings.size(), 1u);
    json j = rankings.front();
    EXPECT_EQ(j["rank"], 1);
    EXPECT_EQ(j["candidate_id"], "alice");
    EXPECT_DOUBLE_EQ(j["composite"].get<double>(), 0.75);
    EXPECT_JSON_EQ(j["scores"], json({{"correctness", 1.0}, {"style", nullptr}}));
    EXPECT_DOUBLE_EQ(j["ai_probability"].get<double>(), 0.25);
    EXPECT_TRUE(j["mcq_score"].is_null());
}

TEST(RankingTest, EmptyRecords) {
    EXPECT_TRUE(rank_records({}).empty());
}
