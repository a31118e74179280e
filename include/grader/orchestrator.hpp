#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "config.hpp"
#include "grader/job.hpp"
#include "grader/pipeline.hpp"
#include "grader/report.hpp"
#include "sandbox/runner.hpp"
#include "storage/repository.hpp"
#include "worker.hpp"

namespace grader {

/**
 * @brief 作业编排器，对外提供的异步分析接口
 * 作业提交后立即返回作业编号，分析在 worker_pool 中进行。
 * 作业表只能通过本类的接口访问，每次状态变化都会写入存储。
 *
 * 作业状态：
 * QUEUED -> RUNNING -> SUCCEEDED  所有提交都分析成功（或没有需要分析的提交）
 *                   -> PARTIAL    批量作业中有提交分析失败，错误记录在对应的 job_item 中
 *                   -> FAILED     前置条件不满足（如测试不存在），或单个提交的作业分析失败
 */
struct job_orchestrator {
    /**
     * @brief 探测容器运行时以确定沙箱执行策略
     */
    job_orchestrator(repository &repo, const grader_config &config);

    /**
     * @brief 使用指定的沙箱执行策略
     */
    job_orchestrator(repository &repo, const grader_config &config, std::shared_ptr<sandbox_strategy> strategy);

    /**
     * @brief 等待所有作业结束后停止 worker
     */
    ~job_orchestrator();

    job_orchestrator(const job_orchestrator &) = delete;
    job_orchestrator &operator=(const job_orchestrator &) = delete;

    /**
     * @brief 提交分析作业
     * @param scope 作业范围
     * @param target_id SOLUTION 范围为提交编号，TEST 范围为测试编号，ALL 范围忽略
     * @return 作业编号
     * @throw invalid_argument_error SOLUTION 或 TEST 范围没有给出 target_id
     */
    std::string submit_job(job_scope scope, const std::string &target_id);

    /**
     * @brief 作业的快照
     * @throw not_found_error
     */
    job get_job(const std::string &job_id) const;

    /**
     * @brief 作业日志，按追加顺序，作业运行中也可以获取
     * @throw not_found_error
     */
    std::vector<job_log_entry> get_job_logs(const std::string &job_id) const;

    /**
     * @brief 本编排器创建的所有作业的快照，按创建顺序
     */
    std::vector<job> list_jobs() const;

    /**
     * @brief 等待作业进入终止状态
     * @return 作业快照，超时时作业可能仍未结束
     * @throw not_found_error
     */
    job wait_for_job(const std::string &job_id, std::chrono::milliseconds timeout) const;

    /**
     * @throw not_found_error 提交还没有分析记录
     */
    analysis_record get_analysis(const std::string &solution_id) const;

    /**
     * @brief 生成测试报告并保存，覆盖之前的报告
     * 只使用生成时已经存在的分析记录
     * @param test_id 测试编号，为 "all" 时为每个已有分析记录的测试生成报告
     * @throw not_found_error 测试不存在
     */
    std::vector<test_report> generate_report(const std::string &test_id);

    /**
     * @brief 生成单个提交的报告，包括其在所属测试中的排名
     * @throw not_found_error 提交还没有分析记录
     */
    solution_report get_solution_report(const std::string &solution_id) const;

    const sandbox_strategy &strategy() const;

private:
    struct job_entry {
        job value;

        /**
         * @brief 尚未结束的提交数
         */
        size_t remaining = 0;
    };

    job_entry &find_entry(const std::string &job_id);
    const job_entry &find_entry(const std::string &job_id) const;

    void append_log(job_entry &entry, const std::string &message);
    void finish(job_entry &entry, job_status state);

    void start_job(const std::string &job_id);
    void run_item(const std::string &job_id, size_t index, const solution &submission,
                  const std::shared_ptr<const assessment> &test);

    repository &repo;
    orchestrator_options options;
    std::shared_ptr<sandbox_strategy> strategy_;
    sandbox_runner runner;
    analysis_pipeline pipeline;

    mutable std::mutex mut;
    mutable std::condition_variable cond;
    std::map<std::string, job_entry> jobs;
    std::vector<std::string> job_order;

    // 最后构造，最先析构
    worker_pool workers;
};

}  // namespace grader
