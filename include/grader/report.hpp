#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "grader/analysis.hpp"
#include "grader/models.hpp"
#include "grader/ranking.hpp"

namespace grader {

/**
 * @brief 报告中"优势"与"待改进"的分数阈值
 */
constexpr double STRENGTH_THRESHOLD = 0.8;
constexpr double IMPROVEMENT_THRESHOLD = 0.5;

/**
 * @brief 综合分数分布
 * excellent >= 0.8, good >= 0.6, average >= 0.4, poor < 0.4
 */
struct score_distribution {
    size_t excellent = 0;
    size_t good = 0;
    size_t average = 0;
    size_t poor = 0;
};

/**
 * @brief 一场测试的对比报告
 * 重新生成时覆盖上一次的报告
 */
struct test_report {
    std::string test_id;
    std::string title;

    size_t candidate_count = 0;
    size_t solution_count = 0;

    double average_score = 0;
    score_distribution distribution;

    /**
     * @brief 各维度在所有提交上的平均分，没有任何提交给出该维度分数时为空
     */
    dimension_scores dimension_averages;
    std::optional<double> average_ai_probability;

    std::vector<ranking_entry> rankings;

    std::string generated_at;
};

/**
 * @brief 一道编程题的分析明细
 */
struct question_report {
    std::string question_id;
    std::string language;
    dimension_scores scores;
    std::map<dimension, std::string> reasons;
    nlohmann::json style_issues = nlohmann::json::array();
    nlohmann::json suggestions = nlohmann::json::array();
    nlohmann::json flagged_patterns = nlohmann::json::array();
};

/**
 * @brief 一个提交的个人报告
 */
struct solution_report {
    std::string solution_id;
    std::string test_id;
    std::string candidate_id;

    double composite = 0;
    std::optional<double> coding_score;
    std::optional<double> mcq_score;
    dimension_scores scores;
    std::optional<double> ai_probability;

    std::vector<question_report> questions;

    std::vector<std::string> strengths;
    std::vector<std::string> areas_for_improvement;
    std::vector<std::string> recommendations;

    /**
     * @brief 在测试中的名次，还没有生成排名时为空
     */
    std::optional<size_t> rank;
    size_t ranked_count = 0;

    std::string generated_at;
};

/**
 * @brief 根据已有的分析记录生成测试的对比报告，不会等待还没有完成的分析
 */
test_report build_test_report(const assessment &test, const std::vector<analysis_record> &records);

/**
 * @brief 生成个人报告
 * @param rankings 该提交所属测试的排名，为空时报告中没有名次
 */
solution_report build_solution_report(const analysis_record &record, const std::vector<ranking_entry> &rankings);

void to_json(nlohmann::json &j, const score_distribution &value);
void to_json(nlohmann::json &j, const test_report &value);
void to_json(nlohmann::json &j, const question_report &value);
void to_json(nlohmann::json &j, const solution_report &value);

}  // namespace grader
