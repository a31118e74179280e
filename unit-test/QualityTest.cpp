#include "gtest/gtest.h"
#include "analyzer/quality.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;

class QualityTest : public ::testing::Test {
protected:
    code_quality_analyzer analyzer;
};

TEST_F(QualityTest, CountsBranchesPerFunction) {
    const char *source = R"(def classify(values):
    result = []
    for v in values:
        if v > 0 and v < 10:
            result.append("small")
        elif v >= 10:
            result.append("large")
    return result
)";
    auto metrics = measure_quality(analyze_structure(source, language::PYTHON));
    EXPECT_EQ(metrics.function_count, 1);
    EXPECT_DOUBLE_EQ(metrics.cyclomatic_complexity, 5);
    EXPECT_EQ(metrics.code_line_count, 8);
    EXPECT_GT(metrics.halstead_volume, 0);
}

TEST_F(QualityTest, KeywordsInStringsAndCommentsAreIgnored) {
    const char *source = R"(def greet(name):
    # if the name is empty or missing
    return "while " + name
)";
    auto metrics = measure_quality(analyze_structure(source, language::PYTHON));
    EXPECT_DOUBLE_EQ(metrics.cyclomatic_complexity, 1);
}

TEST_F(QualityTest, TernaryCountsButOptionalChainingDoesNot) {
    const char *source = R"(function pick(a, b) {
    return a ? a.value ?? b : b?.value;
}
)";
    auto metrics = measure_quality(analyze_structure(source, language::JAVASCRIPT));
    EXPECT_DOUBLE_EQ(metrics.cyclomatic_complexity, 2);
}

TEST_F(QualityTest, CommentRatioUsesNonBlankLines) {
    const char *source = R"(# add two numbers
def add(a, b):

    # sum
    return a + b
)";
    auto metrics = measure_quality(analyze_structure(source, language::PYTHON));
    EXPECT_DOUBLE_EQ(metrics.comment_ratio, 0.5);
    EXPECT_EQ(metrics.line_count, 5);
    EXPECT_EQ(metrics.code_line_count, 2);
}

TEST_F(QualityTest, ScoreIsMaintainabilityIndex) {
    auto result = analyze_code(analyzer, FIBONACCI_CORRECT);
    ASSERT_TRUE(result.score);
    EXPECT_GT(*result.score, 0);
    EXPECT_LE(*result.score, 1);
    EXPECT_DOUBLE_EQ(*result.score, result.details.at("maintainability_index").get<double>() / 100);
    EXPECT_EQ(result.details.at("function_count"), 1);
}

TEST_F(QualityTest, SimplerCodeIsMoreMaintainable) {
    const char *tangled = R"(def fibonacci(n):
    if n < 0 or n > 90:
        return -1
    if n == 0:
        return 0
    if n == 1 or n == 2:
        return 1
    a, b, c = 0, 1, 0
    while c < n and a >= 0:
        if c % 2 == 0 and b > a:
            a, b = b, a + b
        elif c % 3 == 0 or b < 0:
            a, b = b, a + b
        else:
            a, b = b, a + b
        c = c + 1
    return a
)";
    auto simple = analyze_code(analyzer, FIBONACCI_CORRECT);
    auto complex = analyze_code(analyzer, tangled);
    EXPECT_GT(*simple.score, *complex.score);
    EXPECT_GT(complex.details.at("cyclomatic_complexity").get<double>(),
              simple.details.at("cyclomatic_complexity").get<double>());
}

TEST_F(QualityTest, EmptySourceHasNoScore) {
    auto result = analyze_code(analyzer, "# nothing here\n\n");
    EXPECT_FALSE(result.score);
    EXPECT_EQ(result.reason, "Source code is empty");
}
