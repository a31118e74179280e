#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "grader/analysis.hpp"

namespace grader {

/**
 * @brief 排名表中的一行
 */
struct ranking_entry {
    /**
     * @brief 名次，从 1 开始，不会并列
     */
    size_t rank = 0;

    std::string solution_id;
    std::string candidate_id;
    int64_t submitted_at = 0;
    double composite = 0;
    dimension_scores scores;
    std::optional<double> ai_probability;
    std::optional<double> mcq_score;
};

/**
 * @brief 排名的全序关系
 * 综合分数高者在前；分数相同时提交时间早者在前；仍相同时按考生编号、提交编号升序
 */
bool ranks_before(const analysis_record &a, const analysis_record &b);

/**
 * @brief 按 ranks_before 对分析记录排序并编号
 */
std::vector<ranking_entry> rank_records(std::vector<analysis_record> records);

void to_json(nlohmann::json &j, const ranking_entry &value);

}  // namespace grader
