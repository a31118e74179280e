#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"
#include "language/harness.hpp"
#include "sandbox/process.hpp"

namespace grader {

/**
 * @brief 沙箱执行策略
 * 在作业编排器构造时确定使用容器隔离还是本地进程，之后调用方不关心具体实现
 */
struct sandbox_strategy {
    virtual ~sandbox_strategy() = default;

    virtual std::string name() const = 0;

    /**
     * @brief 是否提供容器级别的隔离
     */
    virtual bool isolated() const = 0;

    /**
     * @brief 在工作目录中执行可执行单元
     * @param unit 语言适配器生成的可执行单元，文件已经写入 workspace
     * @param workspace 本次执行独占的工作目录
     * @param limits 资源限制
     * @throw std::system_error 无法启动进程
     */
    virtual process_result execute(const executable_unit &unit, const std::filesystem::path &workspace,
                                   const execution_limits &limits) = 0;
};

/**
 * @brief 在一次性容器中执行，工作目录挂载到容器内的 /app
 */
struct container_strategy : public sandbox_strategy {
    explicit container_strategy(sandbox_options options);

    std::string name() const override;
    bool isolated() const override;
    process_result execute(const executable_unit &unit, const std::filesystem::path &workspace,
                           const execution_limits &limits) override;

    /**
     * @brief 生成容器运行命令
     * @param container_name 容器名，超时后通过容器名终止容器
     */
    std::vector<std::string> build_command(const executable_unit &unit, const std::filesystem::path &workspace,
                                           const execution_limits &limits, const std::string &container_name) const;

private:
    sandbox_options options;
};

/**
 * @brief 本地进程执行，隔离程度较低
 * 通过 rlimit 限制资源，在独立的进程组中运行，环境变量只保留 PATH
 */
struct local_process_strategy : public sandbox_strategy {
    std::string name() const override;
    bool isolated() const override;
    process_result execute(const executable_unit &unit, const std::filesystem::path &workspace,
                           const execution_limits &limits) override;

    /**
     * @brief 生成本地进程的启动参数
     */
    process_options build_options(const executable_unit &unit, const std::filesystem::path &workspace,
                                  const execution_limits &limits) const;
};

/**
 * @brief 检测容器运行时是否可用（执行 `<container_binary> version`）
 */
bool probe_container_runtime(const sandbox_options &options);

/**
 * @brief 确定沙箱执行策略，容器运行时不可用时退回本地进程并记录警告
 */
std::shared_ptr<sandbox_strategy> resolve_strategy(const sandbox_options &options);

}  // namespace grader
