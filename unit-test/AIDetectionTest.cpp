#include <algorithm>
#include "gtest/gtest.h"
#include "analyzer/ai_detection.hpp"
#include "test/fixtures.hpp"

using namespace std;
using namespace grader;

class AIDetectionTest : public ::testing::Test {
protected:
    static bool flagged(const analyzer_result &result, const string &pattern) {
        auto &patterns = result.details.at("flagged_patterns");
        return find(patterns.begin(), patterns.end(), pattern) != patterns.end();
    }

    ai_detection_analyzer analyzer;
};

TEST_F(AIDetectionTest, PlainSolutionIsNotFlagged) {
    auto result = analyze_code(analyzer, FIBONACCI_CORRECT);
    ASSERT_TRUE(result.score);
    EXPECT_DOUBLE_EQ(*result.score, 0);
    EXPECT_TRUE(result.details.at("flagged_patterns").empty());
    EXPECT_EQ(result.details.at("detection_method"), AI_DETECTION_METHOD);
}

TEST_F(AIDetectionTest, TypicalGeneratedSolutionIsFlagged) {
    const char *source = R"(from typing import List


def fibonacci(n: int) -> int:
    """
    Calculate the n-th Fibonacci number.

    Args:
        n: The index of the Fibonacci number.

    Returns:
        The n-th Fibonacci number.
    """
    # Edge case: negative input
    if n < 0:
        raise ValueError("n must be non-negative")
    # Step 1: initialize the first two numbers
    a, b = 0, 1
    # Step 2: iterate n times
    for _ in range(n):
        a, b = b, a + b
    return a


# Example usage
if __name__ == "__main__":
    print(fibonacci(10))
)";
    auto result = analyze_code(analyzer, source);
    ASSERT_TRUE(result.score);
    EXPECT_GE(*result.score, 0.8);
    EXPECT_LE(*result.score, 1);
    EXPECT_DOUBLE_EQ(result.details.at("probability").get<double>(), *result.score);
    for (auto pattern : {"docstring-sections", "example-usage-comment", "main-guard", "step-comments",
                         "edge-case-comments", "exhaustive-validation", "uniform-type-hints"})
        EXPECT_TRUE(flagged(result, pattern)) << pattern;
}

TEST_F(AIDetectionTest, DocumentedFunctionsInJavaScript) {
    const char *source = R"(/**
 * Adds two numbers.
 */
function add(a, b) {
    return a + b;
}

// Multiplies two numbers.
function multiply(a, b) {
    return a * b;
}
)";
    auto result = analyze_code(analyzer, source, language::JAVASCRIPT);
    EXPECT_TRUE(flagged(result, "documented-every-function"));
    EXPECT_TRUE(flagged(result, "high-comment-density"));
    EXPECT_NEAR(*result.score, 0.25, 1e-9);
}

TEST_F(AIDetectionTest, PhrasesInsideStringsAreIgnored) {
    const char *source = R"(def describe():
    return "Here is the answer, step 1: this function"
)";
    auto result = analyze_code(analyzer, source);
    EXPECT_DOUBLE_EQ(*result.score, 0);

    auto commented = analyze_code(analyzer, "# Here is the solution\ndef describe():\n    return 1\n");
    EXPECT_TRUE(flagged(commented, "assistant-phrasing"));
    EXPECT_NEAR(*commented.score, 0.25, 1e-9);
}

TEST_F(AIDetectionTest, ProbabilityIsCapped) {
    const char *source = R"(# Here is the solution. Time complexity: O(n), space complexity: O(1).
# Step 1: handle the base case. Example usage is shown below.
def first(values: list) -> int:
    """Returns: the first value."""
    if not isinstance(values, list):
        raise TypeError("values must be a list")
    return values[0]


def second(values: list) -> int:
    """Returns: the second value."""
    return values[1]


if __name__ == "__main__":
    print(first([1, 2]))
)";
    auto result = analyze_code(analyzer, source);
    EXPECT_DOUBLE_EQ(*result.score, 1);
}
