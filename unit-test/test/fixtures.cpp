#include "test/fixtures.hpp"
#include <signal.h>
#include <stdexcept>
#include "language/harness.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

scripted_strategy::scripted_strategy(handler fn) : fn(move(fn)) {}

string scripted_strategy::name() const {
    return "scripted";
}

bool scripted_strategy::isolated() const {
    return false;
}

process_result scripted_strategy::execute(const executable_unit &unit, const filesystem::path &,
                                          const execution_limits &) {
    ++call_count;
    return fn(unit);
}

size_t scripted_strategy::calls() const {
    return call_count;
}

process_result returns(const json &value) {
    process_result result;
    result.exit_code = 0;
    result.stdout_text = string(RESULT_MARKER) + " " + value.dump() + "\n";
    result.wall_time = 3;
    return result;
}

process_result timed_out() {
    process_result result;
    result.timed_out = true;
    result.signal = SIGKILL;
    result.exit_code = 128 + SIGKILL;
    result.wall_time = 10000;
    return result;
}

process_result fibonacci_interpreter(const executable_unit &unit) {
    const string &source = unit.files.at("solution.py");
    if (source.find("while True") != string::npos) return timed_out();

    json arguments = json::parse(unit.files.at("args.json"));
    int64_t n = arguments.at(0).get<int64_t>();
    if (source.find("a, b = b, a + b") == string::npos) return returns(n);

    int64_t a = 0, b = 1;
    for (int64_t i = 0; i < n; ++i) {
        int64_t next = a + b;
        a = b;
        b = next;
    }
    return returns(a);
}

const char *const FIBONACCI_CORRECT = R"(def fibonacci(n):
    a, b = 0, 1
    for _ in range(n):
        a, b = b, a + b
    return a
)";

const char *const FIBONACCI_BUGGY = R"(def fibonacci(n):
    return n
)";

const char *const FIBONACCI_LOOPING = R"(def fibonacci(n):
    while True:
        n += 1
    return n
)";

coding_question make_fibonacci_question(const string &question_id) {
    coding_question question;
    question.question_id = question_id;
    question.title = "Fibonacci";
    question.description = "Implement the function fibonacci(n) returning the n-th Fibonacci number.";
    question.function_name = "fibonacci";
    question.time_complexity = "O(n)";
    question.space_complexity = "O(1)";
    vector<pair<string, string>> cases = {{"0", "0"}, {"1", "1"}, {"2", "1"}, {"3", "2"}, {"10", "55"}};
    for (auto &[input, expected] : cases) {
        test_case testcase;
        testcase.input = input;
        testcase.expected_output = expected;
        question.test_cases.push_back(testcase);
    }
    return question;
}

assessment make_assessment(const string &test_id, vector<coding_question> coding, vector<mcq_question> mcq) {
    assessment test;
    test.test_id = test_id;
    test.title = "Assessment " + test_id;
    test.coding_questions = move(coding);
    test.mcq_questions = move(mcq);
    return test;
}

solution make_solution(const string &solution_id, const string &test_id, const string &candidate_id,
                       int64_t submitted_at, vector<coding_answer> coding, vector<mcq_answer> mcq) {
    solution submission;
    submission.solution_id = solution_id;
    submission.test_id = test_id;
    submission.candidate_id = candidate_id;
    submission.submitted_at = submitted_at;
    submission.coding_answers = move(coding);
    submission.mcq_answers = move(mcq);
    return submission;
}

coding_answer python_answer(const string &question_id, const string &code) {
    coding_answer answer;
    answer.question_id = question_id;
    answer.language = "python";
    answer.code = code;
    return answer;
}

analyzer_result analyze_code(const analyzer &target, const string &code, language lang,
                             const coding_question &question, const vector<execution_result> &executions) {
    coding_answer answer;
    answer.question_id = question.question_id;
    answer.language = get_language_name(lang);
    answer.code = code;
    solution submission = make_solution("s1", "t1", "alice", 1000, {answer});
    analysis_context context{submission, question, submission.coding_answers.front(), get_harness(lang), executions};
    return target.analyze(context);
}

fixed_analyzer::fixed_analyzer(dimension dim, optional<double> score) : dim(dim), score(score) {}

dimension fixed_analyzer::type() const {
    return dim;
}

analyzer_result fixed_analyzer::analyze(const analysis_context &) const {
    analyzer_result result;
    result.type = dim;
    result.score = score;
    return result;
}

throwing_analyzer::throwing_analyzer(dimension dim) : dim(dim) {}

dimension throwing_analyzer::type() const {
    return dim;
}

analyzer_result throwing_analyzer::analyze(const analysis_context &) const {
    throw runtime_error("analyzer exploded");
}

}  // namespace grader
