#pragma once

#include <atomic>
#include <boost/interprocess/sync/interprocess_semaphore.hpp>
#include <memory>
#include <optional>
#include <string>
#include "config.hpp"
#include "grader/models.hpp"
#include "language/harness.hpp"
#include "sandbox/strategy.hpp"

namespace grader {

/**
 * @brief 沙箱执行槽位池，限制同时执行的沙箱数量
 * 这是所有作业共享的唯一可变资源
 */
struct slot_pool {
    explicit slot_pool(size_t capacity);

    void acquire();
    void release();

    size_t available() const;
    size_t capacity() const;

private:
    size_t total;
    std::atomic<size_t> free_slots;
    boost::interprocess::interprocess_semaphore semaphore;
};

/**
 * @brief 在作用域内持有一个执行槽位
 */
struct slot_guard {
    explicit slot_guard(slot_pool &pool);
    slot_guard(const slot_guard &) = delete;
    ~slot_guard();

private:
    slot_pool &pool;
};

/**
 * @brief 执行 (代码, 测试点) 对的沙箱
 * 每次执行都会占用一个槽位并创建独立的临时工作目录，执行结束后释放槽位并删除工作目录
 */
struct sandbox_runner {
    sandbox_runner(std::shared_ptr<sandbox_strategy> strategy, const sandbox_options &options);

    /**
     * @brief 执行一个测试点
     * 不会抛出异常：超时、运行错误、编译错误、沙箱启动失败都记录在返回值中
     * @param harness 语言适配器
     * @param source 选手代码
     * @param entry 入口函数
     * @param testcase 测试点
     * @param limits 资源限制
     */
    execution_result execute(const language_harness &harness, const std::string &source, const entry_point &entry,
                             const test_case &testcase, const execution_limits &limits);

    /**
     * @brief 使用默认资源限制执行一个测试点
     */
    execution_result execute(const language_harness &harness, const std::string &source, const entry_point &entry,
                             const test_case &testcase);

    const sandbox_strategy &strategy() const;

    const execution_limits &default_limits() const;

    slot_pool &slots();

private:
    std::shared_ptr<sandbox_strategy> strategy_;
    execution_limits defaults;
    slot_pool pool;
};

/**
 * @brief 根据进程的执行情况和返回值确定测试点的结果
 */
void classify_result(execution_result &result, const process_result &process,
                     const std::optional<nlohmann::json> &actual, bool isolated);

}  // namespace grader
