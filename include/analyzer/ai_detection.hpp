#pragma once

#include <string>
#include <vector>
#include "analyzer/analyzer.hpp"
#include "analyzer/structure.hpp"

namespace grader {

/**
 * @brief 分析方法的名称，写入分析记录
 */
extern const char *const AI_DETECTION_METHOD;

/**
 * @brief 一种 AI 生成代码的特征
 */
struct ai_signature {
    std::string name;
    double weight;
};

/**
 * @brief 找出代码中出现的 AI 生成代码特征
 */
std::vector<ai_signature> match_ai_signatures(const code_structure &structure);

/**
 * @brief AI 生成检测分析器
 * 概率为匹配到的特征权重之和，最大为 1；该维度只作为参考，不参与综合分数
 */
struct ai_detection_analyzer : public analyzer {
    dimension type() const override;

    analyzer_result analyze(const analysis_context &context) const override;
};

}  // namespace grader
