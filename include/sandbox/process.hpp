#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 子进程的启动参数与资源限制
 */
struct process_options {
    /**
     * @brief 命令与参数，argv[0] 通过 PATH 查找
     */
    std::vector<std::string> argv;

    /**
     * @brief 工作目录，为空时继承父进程的工作目录
     */
    std::filesystem::path working_directory;

    /**
     * @brief 子进程的完整环境变量，不继承父进程的环境变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 墙钟时间限制，超时后整个进程组会被终止
     */
    std::chrono::milliseconds wall_time_limit{10000};

    /**
     * @brief 地址空间限制，单位为 KB，小于等于 0 表示不限制
     */
    int64_t memory_limit = 0;

    /**
     * @brief CPU 时间限制，单位为秒，小于等于 0 表示不限制
     */
    int cpu_time_limit = 0;

    /**
     * @brief 文件写入大小限制，单位为字节，小于等于 0 表示不限制
     */
    int64_t file_limit = 0;

    /**
     * @brief 进程数限制，小于等于 0 表示不限制
     */
    int process_limit = 0;

    /**
     * @brief 标准输出和标准错误各自最多保留的字节数，超出后终止进程
     */
    size_t output_limit = 1 << 20;
};

struct process_result {
    /**
     * @brief 退出码，被信号终止时为 128 + 信号值
     */
    int exit_code = -1;

    /**
     * @brief 终止子进程的信号，正常退出时为 0
     */
    int signal = 0;

    bool timed_out = false;

    bool output_limit_exceeded = false;

    std::string stdout_text;

    std::string stderr_text;

    /**
     * @brief 墙钟时间，单位为毫秒
     */
    int64_t wall_time = 0;

    /**
     * @brief 峰值常驻内存，单位为 KB，无法测量时为 0
     */
    int64_t peak_memory = 0;
};

/**
 * @brief 在新的会话（进程组）中运行外部程序并等待其结束
 * 子进程的标准输入为 /dev/null，标准输出和标准错误通过管道读取。
 * 超时或输出超限时先向整个进程组发送 SIGTERM，等待 0.1 秒后再发送 SIGKILL。
 * 本函数可以被多个线程并发调用。
 * @throw std::system_error 无法创建管道或 fork 失败
 */
process_result run_process(const process_options &options);

/**
 * @brief 构造只包含 PATH（以及 HOME、LANG）的最小环境变量
 */
std::map<std::string, std::string> minimal_environment();

}  // namespace grader
