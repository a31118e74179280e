#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"

namespace grader {

/**
 * @brief 分析维度
 * AI_DETECTION 只作为参考信息，不参与综合分数
 */
enum class dimension {
    CORRECTNESS,
    QUALITY,
    STYLE,
    PERFORMANCE,
    NAMING,
    AI_DETECTION
};

/**
 * @brief 参与综合分数的维度，按固定顺序排列
 */
extern const std::vector<dimension> COMPOSITE_DIMENSIONS;

const char *get_dimension_name(dimension dim);

dimension parse_dimension(const std::string &name);

/**
 * @brief 维度在综合分数中的默认权重
 */
double get_weight(const composite_weights &weights, dimension dim);

using dimension_scores = std::map<dimension, std::optional<double>>;

/**
 * @brief 按权重合并维度分数
 * 值为空的维度不参与计算，其余维度的权重重新归一化；所有维度都为空时返回空。
 * 结果是维度分数的纯函数，保证在 [0, 1] 内。
 */
std::optional<double> compute_composite(const dimension_scores &scores, const composite_weights &weights);

/**
 * @brief 一道编程题的分析结果
 */
struct question_analysis {
    std::string question_id;
    std::string language;

    dimension_scores scores;

    /**
     * @brief 维度分数为空或为 0 的原因，如 "EntryPointNotFound: ..."
     */
    std::map<dimension, std::string> reasons;

    /**
     * @brief 各分析器输出的原始指标
     */
    std::map<dimension, nlohmann::json> details;

    std::optional<double> ai_probability;

    std::optional<double> composite;
};

/**
 * @brief 一次分析流水线对一个提交的分析结果
 * 除 analyzed_at 外，相同输入总是得到完全相同的分析记录
 */
struct analysis_record {
    /**
     * @brief 分析记录的格式版本，权重等计算方式改变时递增，避免重新解释历史记录
     */
    int schema_version = GRADER_SCHEMA_VERSION;

    std::string solution_id;
    std::string test_id;
    std::string candidate_id;
    int64_t submitted_at = 0;

    /**
     * @brief 各维度在所有编程题上的平均分
     */
    dimension_scores scores;

    std::optional<double> ai_probability;

    /**
     * @brief 编程题部分的综合分数
     */
    std::optional<double> coding_score;

    /**
     * @brief 选择题部分的得分，没有选择题时为空
     */
    std::optional<double> mcq_score;

    /**
     * @brief 最终综合分数，在 [0, 1] 内
     */
    double composite = 0;

    std::vector<question_analysis> questions;

    std::string analyzed_at;
};

void to_json(nlohmann::json &j, const dimension_scores &scores);
void from_json(const nlohmann::json &j, dimension_scores &scores);
void to_json(nlohmann::json &j, const question_analysis &value);
void from_json(const nlohmann::json &j, question_analysis &value);
void to_json(nlohmann::json &j, const analysis_record &value);
void from_json(const nlohmann::json &j, analysis_record &value);

}  // namespace grader
