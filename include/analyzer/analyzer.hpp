#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "grader/analysis.hpp"
#include "grader/models.hpp"
#include "language/harness.hpp"

namespace grader {

/**
 * @brief 分析器的输入：一道编程题的作答
 */
struct analysis_context {
    const solution &submission;
    const coding_question &question;
    const coding_answer &answer;
    const language_harness &harness;

    /**
     * @brief 正确性分析产生的执行结果，静态分析器可以参考
     * 正确性分析本身运行时为空
     */
    const std::vector<execution_result> &executions;
};

/**
 * @brief 单个分析器对一道题的分析结果
 */
struct analyzer_result {
    dimension type;

    /**
     * @brief [0, 1] 内的分数，无法给出分数时为空
     */
    std::optional<double> score;

    /**
     * @brief 分数为空或为 0 的原因
     */
    std::string reason;

    /**
     * @brief 原始指标，写入分析记录
     * 这里的内容必须只取决于输入，不能包含执行时间等每次运行都不同的数据
     */
    nlohmann::json details = nlohmann::json::object();

    /**
     * @brief 正确性分析的测试点执行结果
     */
    std::vector<execution_result> executions;
};

/**
 * @brief 一个分析维度的分析逻辑
 * 分析器可能被多个线程并发调用，实现必须是无状态的
 */
struct analyzer {
    virtual ~analyzer() = default;

    virtual dimension type() const = 0;

    /**
     * @brief 分析一道编程题的作答
     * 抛出的异常会被分析流水线捕获，该维度记为空分数
     */
    virtual analyzer_result analyze(const analysis_context &context) const = 0;
};

/**
 * @brief 代码静态分析中识别出的一个问题
 */
struct code_issue {
    std::string issue_type;
    size_t line_number = 0;
    std::string message;
    std::string severity;
};

void to_json(nlohmann::json &j, const code_issue &issue);

/**
 * @brief 默认的静态分析器：代码质量、AI 生成检测、代码风格、性能、命名
 */
std::vector<std::unique_ptr<analyzer>> make_static_analyzers();

}  // namespace grader
