#pragma once

#include <string>
#include "analyzer/analyzer.hpp"
#include "analyzer/structure.hpp"

namespace grader {

/**
 * @brief 复杂度等级，按增长速度排列
 */
enum class complexity_class {
    CONSTANT = 1,      // O(1)
    LOGARITHMIC,       // O(log n)
    LINEAR,            // O(n)
    LINEARITHMIC,      // O(n log n)
    QUADRATIC,         // O(n^2)
    CUBIC,             // O(n^3)
    EXPONENTIAL,       // O(2^n)
    FACTORIAL          // O(n!)
};

const char *get_complexity_name(complexity_class value);

/**
 * @brief 解析复杂度表达式，忽略大小写和空白，如 "O(n log n)"、"o(N^2)"、"O(n*n)"
 * 无法识别时视为 O(n)
 */
complexity_class parse_complexity(const std::string &text);

/**
 * @brief 复杂度估计结果
 */
struct complexity_estimate {
    complexity_class time = complexity_class::CONSTANT;
    complexity_class space = complexity_class::CONSTANT;

    /**
     * @brief 循环的最大嵌套层数
     */
    size_t loop_depth = 0;

    bool sorts_in_loop = false;
    bool exponential_recursion = false;
    bool memoized = false;
};

complexity_estimate estimate_complexity(const code_structure &structure);

/**
 * @brief 按复杂度等级的差距评分
 * 不超过期望时为 1，否则每超出一级扣 0.25
 */
double complexity_score(complexity_class estimated, complexity_class expected);

/**
 * @brief 性能分析器，静态估计时间和空间复杂度并与题目期望的复杂度比较
 */
struct performance_analyzer : public analyzer {
    dimension type() const override;

    analyzer_result analyze(const analysis_context &context) const override;
};

}  // namespace grader
