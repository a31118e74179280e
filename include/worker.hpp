#pragma once

#include <functional>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"

/**
 * 作业执行相关函数
 * 作业编排器把一个作业拆分为若干个提交的分析任务，投递到 worker_pool 的任务队列中，
 * 所有作业共享同一组 worker，因此同时运行的分析数量不超过 worker 数量。
 * 每个分析任务内部还会并发执行测试点，并发度由沙箱槽位限制。
 */
namespace grader {

struct worker_pool {
    using task = std::function<void()>;

    /**
     * @brief 启动 workers 个 worker 线程，至少启动一个
     */
    explicit worker_pool(size_t workers);

    /**
     * @brief 停止所有 worker，已经投递的任务会先执行完
     */
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 投递一个任务
     * 任务抛出的异常会被 worker 记录到日志，不会终止 worker。
     * 需要向调用方报告错误的任务应自行捕获异常。
     */
    void submit(task value);

    /**
     * @brief 停止所有 worker 并等待其退出
     * 调用后再投递的任务不会被执行
     */
    void stop();

    size_t size() const;

private:
    concurrent_queue<task> task_queue;
    std::vector<std::thread> threads;
};

}  // namespace grader
