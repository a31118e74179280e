#pragma once

#include "analyzer/analyzer.hpp"
#include "analyzer/structure.hpp"

namespace grader {

/**
 * @brief 超过此长度的行记为 line-too-long
 */
constexpr size_t MAX_LINE_LENGTH = 100;

/**
 * @brief 按语言的代码规范检查代码
 * 所有语言：line-too-long, trailing-whitespace, mixed-indentation
 * Python：bad-indentation, unexpected-indentation, missing-whitespace
 * JavaScript：missing-semicolon
 * Java, C++：missing-braces
 */
std::vector<code_issue> check_style(const code_structure &structure);

/**
 * @brief 代码风格分析器
 * 分数为 max(0, 1 - min(2 * 问题数 / 非空行数, 1))
 */
struct style_analyzer : public analyzer {
    dimension type() const override;

    analyzer_result analyze(const analysis_context &context) const override;
};

}  // namespace grader
