#pragma once

#include "analyzer/analyzer.hpp"
#include "sandbox/runner.hpp"

namespace grader {

/**
 * @brief 正确性分析器，在沙箱中运行所有测试点
 * 分数为通过测试点的权重之和除以总权重，与测试点的执行顺序无关。
 * 测试点并发执行，并发度受沙箱槽位数限制；单个测试点超时不影响其他测试点。
 */
struct correctness_analyzer : public analyzer {
    explicit correctness_analyzer(sandbox_runner &runner);

    dimension type() const override;

    analyzer_result analyze(const analysis_context &context) const override;

private:
    sandbox_runner &runner;
};

/**
 * @brief 题目中指定的入口函数名
 * 优先使用 function_name，否则尝试从题目描述中找出 "function xxx" 形式的函数名
 */
std::optional<std::string> function_hint(const coding_question &question);

/**
 * @brief 按权重计算通过率
 * 总权重不为正时按测试点个数计算
 */
double weighted_pass_fraction(const std::vector<execution_result> &executions);

}  // namespace grader
