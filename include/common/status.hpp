#pragma once

#include <string>

namespace grader {

/**
 * @brief 表示单个测试点的执行结果
 */
enum class status {
    /**
     * @brief 程序正常结束且返回值与期望输出一致
     */
    ACCEPTED = 0,

    /**
     * @brief 程序正常结束但返回值与期望输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 程序抛出异常、非零退出或被信号终止
     * 入口函数不存在也归为运行时错误，此时 error_kind 为 EntryPointNotFound
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 编译型语言（Java、C++）在沙箱内编译失败
     */
    COMPILATION_ERROR = 3,

    /**
     * @brief 墙钟时间超出限制，整个进程组已被终止
     */
    TIME_LIMIT_EXCEEDED = 4,

    /**
     * @brief 内存超出限制
     * 本地进程通过 RLIMIT_AS 限制，超限时通常表现为分配失败；
     * 容器内存超限时容器会被 OOM killer 以 SIGKILL 终止（退出码 137）。
     */
    MEMORY_LIMIT_EXCEEDED = 5,

    /**
     * @brief 标准输出或标准错误超出长度限制
     */
    OUTPUT_LIMIT_EXCEEDED = 6,

    /**
     * @brief 评测系统内部错误，比如沙箱无法启动
     */
    SYSTEM_ERROR = 7
};

/**
 * @brief 作业状态
 * QUEUED -> RUNNING -> {SUCCEEDED, PARTIAL, FAILED}，终态不会再改变
 */
enum class job_status {
    QUEUED = 0,
    RUNNING = 1,
    SUCCEEDED = 2,
    PARTIAL = 3,
    FAILED = 4
};

/**
 * @brief 批量作业中单个提交的处理状态
 */
enum class item_status {
    PENDING = 0,
    SUCCEEDED = 1,
    FAILED = 2
};

const char *get_display_message(status);

const char *get_status_name(status);
const char *get_status_name(job_status);
const char *get_status_name(item_status);

status parse_status(const std::string &name);
job_status parse_job_status(const std::string &name);
item_status parse_item_status(const std::string &name);

bool is_terminal(job_status);

}  // namespace grader
