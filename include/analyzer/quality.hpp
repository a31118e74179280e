#pragma once

#include "analyzer/analyzer.hpp"
#include "analyzer/structure.hpp"

namespace grader {

/**
 * @brief 代码质量指标
 */
struct quality_metrics {
    /**
     * @brief 平均每个函数的圈复杂度
     */
    double cyclomatic_complexity = 1;

    /**
     * @brief 可维护性指数，在 [0, 100] 内
     */
    double maintainability_index = 0;

    /**
     * @brief 注释行占非空行的比例
     */
    double comment_ratio = 0;

    double halstead_volume = 0;

    size_t function_count = 0;
    size_t line_count = 0;
    size_t code_line_count = 0;
};

quality_metrics measure_quality(const code_structure &structure);

/**
 * @brief 代码质量分析器，分数为可维护性指数除以 100
 */
struct code_quality_analyzer : public analyzer {
    dimension type() const override;

    analyzer_result analyze(const analysis_context &context) const override;
};

}  // namespace grader
