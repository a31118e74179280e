#pragma once

#include <memory>
#include <vector>
#include "analyzer/analyzer.hpp"
#include "config.hpp"
#include "grader/analysis.hpp"
#include "grader/models.hpp"
#include "sandbox/runner.hpp"
#include "storage/repository.hpp"

namespace grader {

/**
 * @brief 选择题得分
 * 选项集合与标准答案完全一致得 1 分，否则按选中的正确选项占正确选项的比例给分；未作答得 0 分
 */
double score_mcq(const mcq_question &question, const mcq_answer *answer);

/**
 * @brief 分析流水线，对一个提交运行所有分析器并合并为分析记录
 * 先运行正确性分析（唯一需要执行代码的分析器），保存执行结果后再运行静态分析器。
 * 单个分析器失败只会使该维度为空，不会使整个流水线失败。
 */
struct analysis_pipeline {
    /**
     * @brief 使用默认的分析器
     */
    analysis_pipeline(repository &repo, sandbox_runner &runner, const grader_config &config);

    /**
     * @param correctness 正确性分析器，为空时正确性维度总是为空
     * @param analyzers 静态分析器
     */
    analysis_pipeline(repository &repo, std::unique_ptr<analyzer> correctness,
                      std::vector<std::unique_ptr<analyzer>> analyzers, const grader_config &config);

    /**
     * @brief 分析一个提交，保存并返回分析记录，覆盖该提交之前的分析记录
     * @throw not_found_error 提交所属的测试不存在
     * @throw execution_timeout 某道题的所有测试点都超时（orchestrator_options::fail_on_total_timeout）
     */
    analysis_record run(const solution &submission);

    analysis_record run(const solution &submission, const assessment &test);

private:
    question_analysis analyze_question(const solution &submission, const coding_question &question,
                                       const coding_answer &answer);

    repository &repo;
    std::unique_ptr<analyzer> correctness;
    std::vector<std::unique_ptr<analyzer>> analyzers;
    composite_weights weights;
    bool fail_on_total_timeout;
};

}  // namespace grader
