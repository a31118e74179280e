#include "gtest/gtest.h"
#include "grader/report.hpp"
#include "test/assertions.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;
using json = nlohmann::json;

class ReportTest : public ::testing::Test {
protected:
    static analysis_record make_record(const string &solution_id, const string &candidate_id, double composite) {
        analysis_record record;
        record.solution_id = solution_id;
        record.test_id = "t1";
        record.candidate_id = candidate_id;
        record.composite = composite;
        record.submitted_at = 1000;
        return record;
    }

    assessment test = make_assessment("t1", {make_fibonacci_question()});
};

TEST_F(ReportTest, SummarizesTest) {
    test.title = "Backend screening";
    auto a = make_record("s1", "alice", 0.9);
    a.scores = {{dimension::CORRECTNESS, 1.0}, {dimension::STYLE, nullopt}};
    a.ai_probability = 0.2;
    auto b = make_record("s2", "bob", 0.5);
    b.scores = {{dimension::CORRECTNESS, 0.5}, {dimension::STYLE, 0.8}};
    auto c = make_record("s3", "alice", 0.3);

    test_report report = build_test_report(test, {a, b, c});
    EXPECT_EQ(report.test_id, "t1");
    EXPECT_EQ(report.title, "Backend screening");
    EXPECT_EQ(report.candidate_count, 2u);
    EXPECT_EQ(report.solution_count, 3u);
    EXPECT_NEAR(report.average_score, 1.7 / 3, 1e-9);

    EXPECT_EQ(report.distribution.excellent, 1u);
    EXPECT_EQ(report.distribution.good, 0u);
    EXPECT_EQ(report.distribution.average, 1u);
    EXPECT_EQ(report.distribution.poor, 1u);

    EXPECT_DOUBLE_EQ(*report.dimension_averages.at(dimension::CORRECTNESS), 0.75);
    EXPECT_DOUBLE_EQ(*report.dimension_averages.at(dimension::STYLE), 0.8);
    EXPECT_FALSE(report.dimension_averages.at(dimension::NAMING));
    EXPECT_DOUBLE_EQ(*report.average_ai_probability, 0.2);

    ASSERT_EQ(report.rankings.size(), 3u);
    EXPECT_EQ(report.rankings.front().solution_id, "s1");
    EXPECT_FALSE(report.generated_at.empty());
}

TEST_F(ReportTest, EmptyTestReport) {
    test_report report = build_test_report(test, {});
    EXPECT_EQ(report.solution_count, 0u);
    EXPECT_DOUBLE_EQ(report.average_score, 0);
    EXPECT_FALSE(report.average_ai_probability);

    json j = report;
    EXPECT_TRUE(j["rankings"].empty());
    EXPECT_TRUE(j["average_ai_probability"].is_null());
    EXPECT_JSON_EQ(j["score_distribution"], json({{"excellent", 0}, {"good", 0}, {"average", 0}, {"poor", 0}}));
}

TEST_F(ReportTest, StrengthsAndAreasForImprovement) {
    auto record = make_record("s1", "alice", 0.7);
    record.scores = {{dimension::CORRECTNESS, 1.0},
                     {dimension::QUALITY, 0.3},
                     {dimension::STYLE, 0.6},
                     {dimension::PERFORMANCE, nullopt},
                     {dimension::NAMING, 0.8}};
    record.mcq_score = 0.2;

    solution_report report = build_solution_report(record, {});
    EXPECT_EQ(report.strengths, (vector<string>{"Strong problem-solving skills with high correctness",
                                                "Clear and consistent identifier naming"}));
    EXPECT_EQ(report.areas_for_improvement,
              (vector<string>{"Code quality and maintainability could be improved",
                              "Knowledge gaps identified in multiple-choice questions"}));
    EXPECT_FALSE(report.rank);
    EXPECT_EQ(report.ranked_count, 0u);
}

TEST_F(ReportTest, RecommendationsAreDeduplicated) {
    auto record = make_record("s1", "alice", 0.4);
    record.ai_probability = 0.9;

    question_analysis first;
    first.question_id = "fib";
    first.language = "python";
    first.scores[dimension::CORRECTNESS] = 0.4;
    first.details[dimension::PERFORMANCE] = {{"suggestions", json::array({"Avoid nested loops", "Use a hash map"})}};
    first.details[dimension::STYLE] = {{"issues", json::array({{{"line", 2}, {"message", "trailing whitespace"}}})}};
    question_analysis second;
    second.question_id = "sum";
    second.language = "python";
    second.scores[dimension::CORRECTNESS] = 1.0;
    second.details[dimension::PERFORMANCE] = {{"suggestions", json::array({"Use a hash map"})}};
    record.questions = {first, second};

    solution_report report = build_solution_report(record, {});
    EXPECT_EQ(report.recommendations,
              (vector<string>{"Avoid nested loops", "Use a hash map", "Review failed test cases for question fib",
                              "Candidate should demonstrate more original work in coding solutions"}));

    ASSERT_EQ(report.questions.size(), 2u);
    EXPECT_EQ(report.questions[0].style_issues.size(), 1u);
    EXPECT_TRUE(report.questions[1].style_issues.empty());
    EXPECT_TRUE(report.questions[1].flagged_patterns.empty());
}

TEST_F(ReportTest, IncludesRank) {
    auto a = make_record("s1", "alice", 0.9);
    auto b = make_record("s2", "bob", 0.5);
    auto rankings = rank_records({a, b});

    solution_report report = build_solution_report(b, rankings);
    ASSERT_TRUE(report.rank);
    EXPECT_EQ(*report.rank, 2u);
    EXPECT_EQ(report.ranked_count, 2u);

    json j = report;
    EXPECT_EQ(j["rank"], 2);
    EXPECT_EQ(j["candidate_id"], "bob");
    EXPECT_TRUE(j["coding_score"].is_null());
}

TEST_F(ReportTest, QuestionReasonsUseDimensionNames) {
    auto record = make_record("s1", "alice", 0);
    question_analysis question;
    question.question_id = "fib";
    question.language = "python";
    question.scores[dimension::CORRECTNESS] = 0.0;
    question.reasons[dimension::CORRECTNESS] = "EntryPointNotFound: no function fibonacci";
    record.questions = {question};

    json j = build_solution_report(record, {});
    EXPECT_EQ(j["questions"][0]["reasons"]["correctness"], "EntryPointNotFound: no function fibonacci");
    EXPECT_DOUBLE_EQ(j["questions"][0]["scores"]["correctness"].get<double>(), 0);
}
