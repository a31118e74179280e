#include <cmath>
#include "gtest/gtest.h"
#include "grader/pipeline.hpp"
#include "test/assertions.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        strategy = make_shared<scripted_strategy>(fibonacci_interpreter);
        runner = make_unique<sandbox_runner>(strategy, config.sandbox);
        repo.save_assessment(make_assessment("t1", {make_fibonacci_question()}));
    }

    unique_ptr<analysis_pipeline> make_fixed_pipeline(optional<double> correctness, bool style_throws) {
        vector<unique_ptr<analyzer>> analyzers;
        analyzers.push_back(make_unique<fixed_analyzer>(dimension::QUALITY, 0.5));
        if (style_throws)
            analyzers.push_back(make_unique<throwing_analyzer>(dimension::STYLE));
        else
            analyzers.push_back(make_unique<fixed_analyzer>(dimension::STYLE, 1.0));
        analyzers.push_back(make_unique<fixed_analyzer>(dimension::PERFORMANCE, 0.5));
        analyzers.push_back(make_unique<fixed_analyzer>(dimension::NAMING, 1.0));
        analyzers.push_back(make_unique<fixed_analyzer>(dimension::AI_DETECTION, 0.9));
        return make_unique<analysis_pipeline>(repo, make_unique<fixed_analyzer>(dimension::CORRECTNESS, correctness),
                                              move(analyzers), config);
    }

    grader_config config;
    memory_repository repo;
    shared_ptr<scripted_strategy> strategy;
    unique_ptr<sandbox_runner> runner;
};

TEST_F(PipelineTest, CorrectSolutionPassesEveryTestCase) {
    analysis_pipeline pipeline(repo, *runner, config);
    auto submission = make_solution("s1", "t1", "alice", 1000, {python_answer("fib", FIBONACCI_CORRECT)});
    analysis_record record = pipeline.run(submission);

    ASSERT_EQ(record.questions.size(), 1);
    EXPECT_DOUBLE_EQ(*record.scores.at(dimension::CORRECTNESS), 1.0);
    EXPECT_EQ(record.schema_version, GRADER_SCHEMA_VERSION);
    EXPECT_EQ(strategy->calls(), 5);
    EXPECT_GE(record.composite, 0);
    EXPECT_LE(record.composite, 1);
    for (dimension dim : COMPOSITE_DIMENSIONS) {
        ASSERT_TRUE(record.scores.at(dim)) << get_dimension_name(dim);
        EXPECT_GE(*record.scores.at(dim), 0);
        EXPECT_LE(*record.scores.at(dim), 1);
    }
    ASSERT_TRUE(record.ai_probability);

    auto executions = repo.find_executions("s1");
    ASSERT_EQ(executions.size(), 5);
    for (size_t i = 0; i < executions.size(); ++i) {
        EXPECT_EQ(executions[i].test_index, i);
        EXPECT_EQ(executions[i].result, status::ACCEPTED);
        EXPECT_EQ(executions[i].test_case_id, "test_" + to_string(i));
    }
    ASSERT_TRUE(repo.find_analysis("s1"));
}

TEST_F(PipelineTest, BuggySolutionScoresWeightedPassFraction) {
    analysis_pipeline pipeline(repo, *runner, config);
    auto submission = make_solution("s2", "t1", "bob", 1000, {python_answer("fib", FIBONACCI_BUGGY)});
    analysis_record record = pipeline.run(submission);

    EXPECT_NEAR(*record.scores.at(dimension::CORRECTNESS), 0.4, 1e-9);
    auto &details = record.questions.front().details.at(dimension::CORRECTNESS);
    EXPECT_EQ(details.at("passed_count"), 2);
    EXPECT_EQ(details.at("total_count"), 5);
    EXPECT_EQ(details.at("entry_point"), "fibonacci");
}

TEST_F(PipelineTest, ReanalysisIsDeterministic) {
    analysis_pipeline pipeline(repo, *runner, config);
    auto submission = make_solution("s1", "t1", "alice", 1000, {python_answer("fib", FIBONACCI_BUGGY)});

    nlohmann::json first = pipeline.run(submission);
    nlohmann::json second = pipeline.run(submission);
    first.erase("analyzed_at");
    second.erase("analyzed_at");
    EXPECT_JSON_EQ(first, second);

    // 重新分析覆盖之前的记录
    EXPECT_EQ(repo.find_analyses_by_test("t1").size(), 1);
}

TEST_F(PipelineTest, FailingAnalyzerIsExcludedAndWeightsRenormalized) {
    auto pipeline = make_fixed_pipeline(1.0, true);
    auto submission = make_solution("s1", "t1", "alice", 1000, {python_answer("fib", FIBONACCI_CORRECT)});
    analysis_record record = pipeline->run(submission);

    auto &question = record.questions.front();
    EXPECT_FALSE(question.scores.at(dimension::STYLE));
    ASSERT_TRUE(question.reasons.count(dimension::STYLE));
    EXPECT_EQ(question.reasons.at(dimension::STYLE).rfind("AnalyzerFailure", 0), 0);
    EXPECT_FALSE(record.scores.at(dimension::STYLE));

    // (0.40 * 1 + 0.15 * 0.5 + 0.15 * 0.5 + 0.10 * 1) / 0.80
    EXPECT_NEAR(record.composite, 0.8125, 1e-9);
    EXPECT_NEAR(*record.coding_score, 0.8125, 1e-9);
    EXPECT_DOUBLE_EQ(*record.ai_probability, 0.9);
}

TEST_F(PipelineTest, AIDetectionDoesNotAffectComposite) {
    auto pipeline = make_fixed_pipeline(1.0, false);
    auto submission = make_solution("s1", "t1", "alice", 1000, {python_answer("fib", FIBONACCI_CORRECT)});
    analysis_record record = pipeline->run(submission);

    // 0.40 * 1 + 0.15 * 0.5 + 0.10 * 1 + 0.15 * 0.5 + 0.10 * 1
    EXPECT_NEAR(record.composite, 0.75, 1e-9);
    EXPECT_FALSE(record.scores.count(dimension::AI_DETECTION));
}

TEST_F(PipelineTest, AllNullDimensionsGiveZeroComposite) {
    vector<unique_ptr<analyzer>> analyzers;
    analyzers.push_back(make_unique<throwing_analyzer>(dimension::QUALITY));
    analysis_pipeline pipeline(repo, make_unique<fixed_analyzer>(dimension::CORRECTNESS, nullopt), move(analyzers),
                               config);
    auto submission = make_solution("s1", "t1", "alice", 1000, {python_answer("fib", FIBONACCI_CORRECT)});
    analysis_record record = pipeline.run(submission);

    EXPECT_FALSE(record.coding_score);
    EXPECT_DOUBLE_EQ(record.composite, 0);
    EXPECT_FALSE(isnan(record.composite));
}

TEST_F(PipelineTest, TotalTimeoutFailsAfterPersistingExecutions) {
    analysis_pipeline pipeline(repo, *runner, config);
    auto submission = make_solution("s3", "t1", "carol", 1000, {python_answer("fib", FIBONACCI_LOOPING)});

    try {
        pipeline.run(submission);
        FAIL() << "execution_timeout expected";
    } catch (execution_timeout &ex) {
        EXPECT_EQ(ex.kind(), error_kind::EXECUTION_TIMEOUT);
    }

    auto executions = repo.find_executions("s3");
    ASSERT_EQ(executions.size(), 5);
    for (auto &execution : executions) {
        EXPECT_EQ(execution.result, status::TIME_LIMIT_EXCEEDED);
        EXPECT_EQ(execution.error, error_kind::EXECUTION_TIMEOUT);
    }
    EXPECT_FALSE(repo.find_analysis("s3"));
}

TEST_F(PipelineTest, TotalTimeoutScoresZeroWhenNotFatal) {
    config.orchestrator.fail_on_total_timeout = false;
    analysis_pipeline pipeline(repo, *runner, config);
    auto submission = make_solution("s3", "t1", "carol", 1000, {python_answer("fib", FIBONACCI_LOOPING)});
    analysis_record record = pipeline.run(submission);

    EXPECT_DOUBLE_EQ(*record.scores.at(dimension::CORRECTNESS), 0);
    EXPECT_EQ(record.questions.front().details.at(dimension::CORRECTNESS).at("timed_out_count"), 5);
}

TEST_F(PipelineTest, MissingEntryPointScoresZeroCorrectness) {
    analysis_pipeline pipeline(repo, *runner, config);
    auto submission = make_solution("s4", "t1", "dave", 1000, {python_answer("fib", "print('hello')\n")});
    analysis_record record = pipeline.run(submission);

    auto &question = record.questions.front();
    EXPECT_DOUBLE_EQ(*question.scores.at(dimension::CORRECTNESS), 0);
    EXPECT_EQ(question.reasons.at(dimension::CORRECTNESS).rfind("EntryPointNotFound", 0), 0);
    EXPECT_TRUE(question.scores.at(dimension::STYLE));
    EXPECT_EQ(strategy->calls(), 0);
}

TEST_F(PipelineTest, UnsupportedLanguageLeavesDimensionsNull) {
    analysis_pipeline pipeline(repo, *runner, config);
    coding_answer answer = python_answer("fib", "PROCEDURE DIVISION.");
    answer.language = "cobol";
    analysis_record record = pipeline.run(make_solution("s5", "t1", "erin", 1000, {answer}));

    auto &question = record.questions.front();
    for (dimension dim : COMPOSITE_DIMENSIONS) {
        EXPECT_FALSE(question.scores.at(dim));
        EXPECT_EQ(question.reasons.at(dim).rfind("InvalidArgument", 0), 0);
    }
    EXPECT_DOUBLE_EQ(record.composite, 0);
}

TEST_F(PipelineTest, UnansweredQuestionCountsAsIncorrect) {
    analysis_pipeline pipeline(repo, *runner, config);
    analysis_record record = pipeline.run(make_solution("s6", "t1", "frank", 1000, {}));

    ASSERT_EQ(record.questions.size(), 1);
    EXPECT_DOUBLE_EQ(*record.scores.at(dimension::CORRECTNESS), 0);
    EXPECT_DOUBLE_EQ(record.composite, 0);
}

TEST_F(PipelineTest, UnknownTestIsNotFound) {
    analysis_pipeline pipeline(repo, *runner, config);
    auto submission = make_solution("s1", "missing", "alice", 1000, {python_answer("fib", FIBONACCI_CORRECT)});
    EXPECT_THROW(pipeline.run(submission), not_found_error);
}

TEST_F(PipelineTest, MultipleChoiceMixesWithCodingScore) {
    mcq_question q1{"q1", {"a"}};
    mcq_question q2{"q2", {"b", "c"}};
    repo.save_assessment(make_assessment("t2", {make_fibonacci_question()}, {q1, q2}));

    auto pipeline = make_fixed_pipeline(1.0, false);
    auto submission = make_solution("s1", "t2", "alice", 1000, {python_answer("fib", FIBONACCI_CORRECT)},
                                    {{"q1", {"a"}}, {"q2", {"b"}}});
    analysis_record record = pipeline->run(submission);

    ASSERT_TRUE(record.mcq_score);
    EXPECT_DOUBLE_EQ(*record.mcq_score, 0.75);
    EXPECT_NEAR(*record.coding_score, 0.75, 1e-9);
    EXPECT_NEAR(record.composite, (0.6 * 0.75 + 0.3 * 0.75) / 0.9, 1e-9);
}

TEST(MultipleChoiceTest, ScoresBySetOverlap) {
    mcq_question question{"q", {"a", "c"}};
    mcq_answer exact{"q", {"c", "a"}};
    mcq_answer partial{"q", {"a"}};
    mcq_answer wrong{"q", {"b"}};

    EXPECT_DOUBLE_EQ(score_mcq(question, &exact), 1.0);
    EXPECT_DOUBLE_EQ(score_mcq(question, &partial), 0.5);
    EXPECT_DOUBLE_EQ(score_mcq(question, &wrong), 0.0);
    EXPECT_DOUBLE_EQ(score_mcq(question, nullptr), 0.0);
}
