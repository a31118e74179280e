#include <algorithm>
#include <atomic>
#include <thread>
#include "gtest/gtest.h"
#include "analyzer/correctness.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;

class CorrectnessTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.slots = 4;
    }

    analyzer_result analyze(const string &code, const coding_question &question,
                            scripted_strategy::handler handler = fibonacci_interpreter) {
        strategy = make_shared<scripted_strategy>(move(handler));
        sandbox_runner runner(strategy, options);
        correctness_analyzer analyzer(runner);
        return analyze_code(analyzer, code, language::PYTHON, question);
    }

    sandbox_options options;
    shared_ptr<scripted_strategy> strategy;
};

TEST_F(CorrectnessTest, FunctionHintFromQuestion) {
    coding_question question;
    question.function_name = "two_sum";
    EXPECT_EQ(function_hint(question), "two_sum");

    question.function_name.reset();
    question.description = "Write a function `merge_intervals` that merges overlapping intervals.";
    EXPECT_EQ(function_hint(question), "merge_intervals");

    question.description = "Merge the overlapping intervals.";
    EXPECT_FALSE(function_hint(question));

    // 空的函数名视为没有指定
    question.function_name = "";
    EXPECT_FALSE(function_hint(question));
}

TEST_F(CorrectnessTest, WeightedPassFraction) {
    vector<execution_result> executions(3);
    executions[0].weight = 2;
    executions[0].passed = true;
    EXPECT_DOUBLE_EQ(weighted_pass_fraction(executions), 0.5);

    for (auto &execution : executions) execution.weight = 0;
    EXPECT_DOUBLE_EQ(weighted_pass_fraction(executions), 1.0 / 3);

    EXPECT_DOUBLE_EQ(weighted_pass_fraction({}), 0);
}

TEST_F(CorrectnessTest, ResultsFollowTestCaseOrder) {
    // 参数越小的测试点执行得越慢，完成顺序与测试点顺序相反
    auto result = analyze(FIBONACCI_CORRECT, make_fibonacci_question(), [](const executable_unit &unit) {
        int n = nlohmann::json::parse(unit.files.at("args.json")).at(0).get<int>();
        this_thread::sleep_for(chrono::milliseconds(max(0, 20 - 2 * n)));
        return fibonacci_interpreter(unit);
    });

    ASSERT_EQ(result.executions.size(), 5);
    for (size_t i = 0; i < result.executions.size(); ++i) {
        auto &execution = result.executions[i];
        EXPECT_EQ(execution.test_index, i);
        EXPECT_EQ(execution.test_case_id, "test_" + to_string(i));
        EXPECT_EQ(execution.question_id, "fib");
        EXPECT_EQ(execution.solution_id, "s1");
        EXPECT_TRUE(execution.passed);
    }
    EXPECT_EQ(result.executions[4].actual_output, 55);
    EXPECT_DOUBLE_EQ(*result.score, 1);
    EXPECT_TRUE(result.reason.empty());
}

TEST_F(CorrectnessTest, ConcurrencyIsBoundedBySlots) {
    options.slots = 2;
    atomic<int> running{0}, peak{0};
    auto result = analyze(FIBONACCI_CORRECT, make_fibonacci_question(), [&](const executable_unit &unit) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        this_thread::sleep_for(chrono::milliseconds(10));
        --running;
        return fibonacci_interpreter(unit);
    });

    EXPECT_DOUBLE_EQ(*result.score, 1);
    EXPECT_LE(peak.load(), 2);
    EXPECT_EQ(strategy->calls(), 5);
}

TEST_F(CorrectnessTest, WeightsAffectScore) {
    auto question = make_fibonacci_question();
    question.test_cases[0].weight = 3;
    question.test_cases[1].weight = 3;

    auto result = analyze(FIBONACCI_BUGGY, question);
    // 通过 n = 0, 1，权重 6 / 9
    EXPECT_NEAR(*result.score, 6.0 / 9, 1e-9);
    EXPECT_EQ(result.details.at("passed_count"), 2);
    EXPECT_EQ(result.reason, "3 of 5 test cases failed");
}

TEST_F(CorrectnessTest, TimeoutOnlyAffectsItsOwnTestCase) {
    auto result = analyze(FIBONACCI_CORRECT, make_fibonacci_question(), [](const executable_unit &unit) {
        int n = nlohmann::json::parse(unit.files.at("args.json")).at(0).get<int>();
        return n == 10 ? timed_out() : fibonacci_interpreter(unit);
    });

    EXPECT_NEAR(*result.score, 0.8, 1e-9);
    EXPECT_EQ(result.details.at("timed_out_count"), 1);
    EXPECT_EQ(result.executions[4].result, status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.executions[4].error, error_kind::EXECUTION_TIMEOUT);
    EXPECT_EQ(result.executions[3].result, status::ACCEPTED);
}

TEST_F(CorrectnessTest, MissingHintFallsBackToOnlyFunction) {
    auto question = make_fibonacci_question();
    question.function_name = "fib";

    auto result = analyze(FIBONACCI_CORRECT, question);
    EXPECT_EQ(result.details.at("entry_point"), "fibonacci");
    EXPECT_DOUBLE_EQ(*result.score, 1);
}

TEST_F(CorrectnessTest, MissingEntryPointScoresZero) {
    auto result = analyze("x = 1\n", make_fibonacci_question());
    ASSERT_TRUE(result.score);
    EXPECT_DOUBLE_EQ(*result.score, 0);
    EXPECT_EQ(result.reason.rfind("EntryPointNotFound: ", 0), 0);
    EXPECT_EQ(result.details.at("error_kind"), "EntryPointNotFound");
    EXPECT_EQ(strategy->calls(), 0);
}

TEST_F(CorrectnessTest, QuestionWithoutTestCasesHasNoScore) {
    auto question = make_fibonacci_question();
    question.test_cases.clear();

    auto result = analyze(FIBONACCI_CORRECT, question);
    EXPECT_FALSE(result.score);
    EXPECT_EQ(result.reason, "Question fib has no test cases");
    EXPECT_TRUE(result.executions.empty());
}
