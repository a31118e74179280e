#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "common/status.hpp"

namespace grader {

/**
 * @brief 分析作业的范围
 */
enum class job_scope {
    /**
     * @brief 分析一个提交
     */
    SOLUTION,

    /**
     * @brief 分析一场测试的所有提交
     */
    TEST,

    /**
     * @brief 分析所有还没有分析记录的提交
     */
    ALL
};

const char *get_scope_name(job_scope scope);

/**
 * @throw invalid_argument_error
 */
job_scope parse_scope(const std::string &name);

struct job_log_entry {
    std::string timestamp;
    std::string message;
};

/**
 * @brief 批量作业中一个提交的分析情况
 */
struct job_item {
    std::string solution_id;
    item_status state = item_status::PENDING;
    std::optional<error_kind> error;
    std::string error_message;
};

struct job_summary {
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t pending = 0;
};

/**
 * @brief 分析作业
 * 状态转移：QUEUED -> RUNNING -> {SUCCEEDED, PARTIAL, FAILED}，进入终止状态后不再改变
 */
struct job {
    std::string job_id;
    job_scope scope = job_scope::SOLUTION;

    /**
     * @brief 提交编号或测试编号，ALL 范围时为空
     */
    std::string target_id;

    job_status state = job_status::QUEUED;

    std::string created_at;
    std::string started_at;
    std::string finished_at;

    /**
     * @brief 只追加的作业日志
     */
    std::vector<job_log_entry> logs;

    std::vector<job_item> items;

    /**
     * @brief 作业整体失败（FAILED）或部分失败（PARTIAL）的原因
     */
    std::optional<error_kind> error;
    std::string error_message;

    job_summary summary() const;
};

void to_json(nlohmann::json &j, const job_log_entry &value);
void from_json(const nlohmann::json &j, job_log_entry &value);
void to_json(nlohmann::json &j, const job_item &value);
void from_json(const nlohmann::json &j, job_item &value);
void to_json(nlohmann::json &j, const job_summary &value);
void to_json(nlohmann::json &j, const job &value);
void from_json(const nlohmann::json &j, job &value);

}  // namespace grader
