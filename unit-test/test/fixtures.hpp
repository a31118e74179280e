#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "analyzer/analyzer.hpp"
#include "grader/models.hpp"
#include "sandbox/strategy.hpp"

namespace grader {

/**
 * @brief 不启动任何进程的沙箱，由回调根据可执行单元给出进程的执行结果
 * 用于在没有解释器和容器运行时的机器上测试流水线与作业编排
 */
struct scripted_strategy : public sandbox_strategy {
    using handler = std::function<process_result(const executable_unit &)>;

    explicit scripted_strategy(handler fn);

    std::string name() const override;
    bool isolated() const override;
    process_result execute(const executable_unit &unit, const std::filesystem::path &workspace,
                           const execution_limits &limits) override;

    size_t calls() const;

private:
    handler fn;
    std::atomic<size_t> call_count{0};
};

/**
 * @brief 运行器正常结束并打印了返回值
 */
process_result returns(const nlohmann::json &value);

/**
 * @brief 进程超过墙钟时间限制被终止
 */
process_result timed_out();

/**
 * @brief 模拟 Python 解释器执行斐波那契题目的运行器
 * 代码中包含 "while True" 时超时；包含迭代实现时返回正确结果；否则原样返回参数
 */
process_result fibonacci_interpreter(const executable_unit &unit);

extern const char *const FIBONACCI_CORRECT;
extern const char *const FIBONACCI_BUGGY;
extern const char *const FIBONACCI_LOOPING;

/**
 * @brief 斐波那契题目，5 个测试点：n = 0, 1, 2, 3, 10
 * 原样返回参数的错误实现只能通过 n = 0, 1 两个测试点
 */
coding_question make_fibonacci_question(const std::string &question_id = "fib");

assessment make_assessment(const std::string &test_id, std::vector<coding_question> coding,
                           std::vector<mcq_question> mcq = {});

solution make_solution(const std::string &solution_id, const std::string &test_id, const std::string &candidate_id,
                       int64_t submitted_at, std::vector<coding_answer> coding, std::vector<mcq_answer> mcq = {});

coding_answer python_answer(const std::string &question_id, const std::string &code);

/**
 * @brief 单独运行一个分析器，作答的语言由 lang 决定
 */
analyzer_result analyze_code(const analyzer &target, const std::string &code, language lang = language::PYTHON,
                             const coding_question &question = make_fibonacci_question(),
                             const std::vector<execution_result> &executions = {});

/**
 * @brief 给出固定分数的分析器
 */
struct fixed_analyzer : public analyzer {
    fixed_analyzer(dimension dim, std::optional<double> score);

    dimension type() const override;
    analyzer_result analyze(const analysis_context &context) const override;

private:
    dimension dim;
    std::optional<double> score;
};

/**
 * @brief 总是抛出异常的分析器
 */
struct throwing_analyzer : public analyzer {
    explicit throwing_analyzer(dimension dim);

    dimension type() const override;
    analyzer_result analyze(const analysis_context &context) const override;

private:
    dimension dim;
};

}  // namespace grader
