#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "grader/analysis.hpp"
#include "grader/job.hpp"
#include "grader/models.hpp"
#include "grader/report.hpp"

namespace grader {

/**
 * @brief 持久化存储的接口
 * 由嵌入方实现（如数据库），所有方法都可能被多个工作线程并发调用
 */
struct repository {
    virtual ~repository() = default;

    virtual void save_assessment(const assessment &test) = 0;
    virtual std::optional<assessment> find_assessment(const std::string &test_id) const = 0;

    /**
     * @brief 所有测试的编号，按编号排序
     */
    virtual std::vector<std::string> list_assessment_ids() const = 0;

    virtual void save_solution(const solution &submission) = 0;
    virtual std::optional<solution> find_solution(const std::string &solution_id) const = 0;
    virtual std::vector<solution> find_solutions_by_test(const std::string &test_id) const = 0;

    /**
     * @brief 还没有分析记录的提交
     */
    virtual std::vector<solution> find_unanalyzed_solutions() const = 0;

    /**
     * @brief 保存一道题的测试点执行结果，覆盖该提交这道题之前的执行结果
     */
    virtual void save_executions(const std::string &solution_id, const std::string &question_id,
                                 const std::vector<execution_result> &executions) = 0;
    virtual std::vector<execution_result> find_executions(const std::string &solution_id) const = 0;

    /**
     * @brief 保存分析记录，覆盖该提交之前的分析记录
     */
    virtual void save_analysis(const analysis_record &record) = 0;
    virtual std::optional<analysis_record> find_analysis(const std::string &solution_id) const = 0;
    virtual std::vector<analysis_record> find_analyses_by_test(const std::string &test_id) const = 0;

    virtual void save_job(const job &value) = 0;
    virtual std::optional<job> find_job(const std::string &job_id) const = 0;

    /**
     * @brief 保存测试报告，覆盖该测试之前的报告
     */
    virtual void save_report(const test_report &report) = 0;
    virtual std::optional<test_report> find_report(const std::string &test_id) const = 0;
};

/**
 * @brief 内存中的存储实现，用于测试和单进程部署
 */
struct memory_repository : public repository {
    void save_assessment(const assessment &test) override;
    std::optional<assessment> find_assessment(const std::string &test_id) const override;
    std::vector<std::string> list_assessment_ids() const override;

    void save_solution(const solution &submission) override;
    std::optional<solution> find_solution(const std::string &solution_id) const override;
    std::vector<solution> find_solutions_by_test(const std::string &test_id) const override;
    std::vector<solution> find_unanalyzed_solutions() const override;

    void save_executions(const std::string &solution_id, const std::string &question_id,
                         const std::vector<execution_result> &executions) override;
    std::vector<execution_result> find_executions(const std::string &solution_id) const override;

    void save_analysis(const analysis_record &record) override;
    std::optional<analysis_record> find_analysis(const std::string &solution_id) const override;
    std::vector<analysis_record> find_analyses_by_test(const std::string &test_id) const override;

    void save_job(const job &value) override;
    std::optional<job> find_job(const std::string &job_id) const override;

    void save_report(const test_report &report) override;
    std::optional<test_report> find_report(const std::string &test_id) const override;

private:
    mutable std::mutex mut;
    std::map<std::string, assessment> assessments;
    std::map<std::string, solution> solutions;
    std::map<std::string, std::map<std::string, std::vector<execution_result>>> executions;
    std::map<std::string, analysis_record> analyses;
    std::map<std::string, job> jobs;
    std::map<std::string, test_report> reports;
};

}  // namespace grader
