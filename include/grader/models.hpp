#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "common/status.hpp"

namespace grader {

/**
 * @brief 编程题的一个测试点
 */
struct test_case {
    /**
     * @brief 测试点编号，为空时使用 "test_{下标}"
     */
    std::string id;

    /**
     * @brief 测试输入，通常为 json 字面量，数组会根据入口函数的参数个数展开
     */
    std::string input;

    std::string expected_output;

    /**
     * @brief 测试点权重，正确性分数为通过测试点的权重之和除以总权重
     */
    double weight = 1.0;

    /**
     * @brief 隐藏测试点，报告中不展示输入输出
     */
    bool hidden = false;
};

/**
 * @brief 编程题
 */
struct coding_question {
    std::string question_id;
    std::string title;
    std::string description;

    /**
     * @brief 题目指定的入口函数名
     */
    std::optional<std::string> function_name;

    std::vector<test_case> test_cases;

    /**
     * @brief 期望的时间复杂度，如 "O(n)"
     */
    std::string time_complexity = "O(n)";

    /**
     * @brief 期望的空间复杂度
     */
    std::string space_complexity = "O(n)";
};

/**
 * @brief 选择题，可以有多个正确选项
 */
struct mcq_question {
    std::string question_id;
    std::vector<std::string> correct_answers;
};

/**
 * @brief 一场测试（试卷）
 */
struct assessment {
    std::string test_id;
    std::string title;
    std::vector<coding_question> coding_questions;
    std::vector<mcq_question> mcq_questions;

    /**
     * @throw not_found_error
     */
    const coding_question &find_coding_question(const std::string &question_id) const;
};

struct coding_answer {
    std::string question_id;
    std::string language;
    std::string code;

    /**
     * @brief 提交时间，Unix 毫秒时间戳
     */
    int64_t submitted_at = 0;
};

struct mcq_answer {
    std::string question_id;
    std::vector<std::string> selected;
};

/**
 * @brief 考生的一次提交，包含所有题目的作答
 */
struct solution {
    std::string solution_id;
    std::string test_id;
    std::string candidate_id;

    /**
     * @brief 提交时间，Unix 毫秒时间戳，排名时用于打破平局
     */
    int64_t submitted_at = 0;

    std::vector<coding_answer> coding_answers;
    std::vector<mcq_answer> mcq_answers;
};

/**
 * @brief 一个测试点在沙箱中的执行结果
 * 无论由容器还是本地进程执行，结果的结构都相同
 */
struct execution_result {
    std::string solution_id;
    std::string question_id;

    size_t test_index = 0;
    std::string test_case_id;

    status result = status::SYSTEM_ERROR;
    bool passed = false;

    /**
     * @brief 错误类型，仅在执行失败时存在
     */
    std::optional<error_kind> error;
    std::string error_message;

    /**
     * @brief 规范化后的实际返回值，运行器没有给出返回值时为 null
     */
    nlohmann::json actual_output;
    nlohmann::json expected_output;

    std::string stdout_text;
    std::string stderr_text;

    int exit_code = -1;
    int signal = 0;

    /**
     * @brief 执行时间，单位为毫秒
     */
    int64_t execution_time = 0;

    /**
     * @brief 峰值内存，单位为 KB，容器执行时为 0
     */
    int64_t memory_usage = 0;

    double weight = 1.0;
};

void to_json(nlohmann::json &j, const test_case &value);
void from_json(const nlohmann::json &j, test_case &value);
void to_json(nlohmann::json &j, const coding_question &value);
void from_json(const nlohmann::json &j, coding_question &value);
void to_json(nlohmann::json &j, const mcq_question &value);
void from_json(const nlohmann::json &j, mcq_question &value);
void to_json(nlohmann::json &j, const assessment &value);
void from_json(const nlohmann::json &j, assessment &value);
void to_json(nlohmann::json &j, const coding_answer &value);
void from_json(const nlohmann::json &j, coding_answer &value);
void to_json(nlohmann::json &j, const mcq_answer &value);
void from_json(const nlohmann::json &j, mcq_answer &value);
void to_json(nlohmann::json &j, const solution &value);
void from_json(const nlohmann::json &j, solution &value);
void to_json(nlohmann::json &j, const execution_result &value);
void from_json(const nlohmann::json &j, execution_result &value);

}  // namespace grader
