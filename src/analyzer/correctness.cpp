#include "analyzer/correctness.hpp"
#include <fmt/format.h>
#include <glog/logging.h>
#include <algorithm>
#include <atomic>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/thread/latch.hpp>
#include <regex>
#include <thread>
#include "common/defer.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

correctness_analyzer::correctness_analyzer(sandbox_runner &runner) : runner(runner) {}

dimension correctness_analyzer::type() const {
    return dimension::CORRECTNESS;
}

optional<string> function_hint(const coding_question &question) {
    if (question.function_name && !question.function_name->empty())
        return question.function_name;

    static const regex description_regex(R"(\bfunction\s+`?([A-Za-z_]\w*)`?)");
    smatch match;
    if (regex_search(question.description, match, description_regex))
        return match[1].str();
    return nullopt;
}

double weighted_pass_fraction(const vector<execution_result> &executions) {
    if (executions.empty()) return 0;
    double passed = 0, total = 0;
    for (auto &execution : executions) {
        total += execution.weight;
        if (execution.passed) passed += execution.weight;
    }
    if (total <= 0) {
        size_t count = count_if(executions.begin(), executions.end(), [](auto &e) { return e.passed; });
        return (double)count / executions.size();
    }
    return clamp(passed / total, 0.0, 1.0);
}

analyzer_result correctness_analyzer::analyze(const analysis_context &context) const {
    analyzer_result result;
    result.type = dimension::CORRECTNESS;

    auto &question = context.question;
    auto &source = context.answer.code;

    auto hint = function_hint(question);
    entry_point entry;
    try {
        entry = context.harness.prepare(source, hint);
    } catch (entry_point_not_found &ex) {
        // 找不到入口函数时正确性为 0，其他维度照常分析
        result.score = 0.0;
        result.reason = fmt::format("{}: {}", get_kind_name(ex.kind()), ex.what());
        result.details = {{"error_kind", get_kind_name(ex.kind())}, {"passed_count", 0},
                          {"total_count", question.test_cases.size()}};
        return result;
    }
    if (hint && entry.name != *hint)
        LOG(WARNING) << "Function " << *hint << " not found in solution " << context.submission.solution_id
                     << ", testing " << entry.name << " instead";

    if (question.test_cases.empty()) {
        result.reason = fmt::format("Question {} has no test cases", question.question_id);
        result.details = {{"entry_point", entry.name}, {"passed_count", 0}, {"total_count", 0}};
        return result;
    }

    // 结果按测试点下标存放，因此与执行完成的先后顺序无关
    size_t count = question.test_cases.size();
    vector<execution_result> executions(count);
    atomic<size_t> next_index{0};
    size_t concurrency = min(count, runner.slots().capacity());
    boost::latch finished(concurrency);
    auto run_cases = [&]() {
        defer { finished.count_down(); };
        for (size_t i = next_index++; i < count; i = next_index++) {
            auto &testcase = question.test_cases[i];
            execution_result &execution = executions[i];
            try {
                execution = runner.execute(context.harness, source, entry, testcase);
            } catch (std::exception &ex) {
                LOG(ERROR) << "Test case " << i << " of question " << question.question_id << " crashed, "
                           << boost::diagnostic_information(ex);
                execution.result = status::SYSTEM_ERROR;
                execution.error = error_kind::INTERNAL_ERROR;
                execution.error_message = ex.what();
            }
            execution.solution_id = context.submission.solution_id;
            execution.question_id = question.question_id;
            execution.test_index = i;
            if (execution.test_case_id.empty()) execution.test_case_id = fmt::format("test_{}", i);
        }
    };

    vector<thread> workers;
    for (size_t i = 0; i < concurrency; ++i)
        workers.emplace_back(run_cases);
    finished.wait();
    for (auto &worker : workers) worker.join();

    size_t passed = 0, timed_out = 0;
    json cases = json::array();
    for (auto &execution : executions) {
        if (execution.passed) ++passed;
        if (execution.result == status::TIME_LIMIT_EXCEEDED) ++timed_out;
        json row = {{"test_case_id", execution.test_case_id},
                    {"status", get_status_name(execution.result)},
                    {"passed", execution.passed},
                    {"weight", execution.weight}};
        if (execution.error) row["error_kind"] = get_kind_name(*execution.error);
        cases.push_back(row);
    }

    result.score = weighted_pass_fraction(executions);
    result.details = {{"entry_point", entry.name},
                      {"passed_count", passed},
                      {"total_count", count},
                      {"timed_out_count", timed_out},
                      {"test_cases", cases}};
    if (passed < count)
        result.reason = fmt::format("{} of {} test cases failed", count - passed, count);
    result.executions = move(executions);
    return result;
}

}  // namespace grader
