#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

#define GRADER_SCHEMA_VERSION 1

namespace grader {

/**
 * @brief 沙箱工作目录的根目录，每次执行都会在此目录下创建独立的工作目录，执行结束后删除
 * 若将这个文件夹放进内存盘，可以加速选手程序的 IO 性能。
 * @defaultValue 系统临时目录下的 grader 文件夹
 *
 * WORK_DIR
 * ├── 3f1c...  // 随机生成的 uuid，一次执行一个目录
 * │   ├── solution.py  // 选手代码
 * │   ├── runner.py  // 语言适配器生成的调用程序
 * │   └── args.json  // 测试点输入参数
 * └── ...
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 调试模式，执行结束后保留工作目录
 */
extern bool DEBUG;

/**
 * @brief 单次执行的资源限制
 */
struct execution_limits {
    /**
     * @brief 墙钟时间限制，单位为秒
     * 包括编译型语言的编译时间，容器启动时间也计入其中
     */
    double time_limit = 10;

    /**
     * @brief 内存限制，单位为 KB
     */
    int64_t memory_limit = 256 * 1024;

    /**
     * @brief 标准输出和标准错误各自的最大字节数
     */
    size_t output_limit = 1 << 20;

    /**
     * @brief 最大文件写入大小，单位为字节，仅本地进程沙箱生效
     */
    int64_t file_limit = 16 << 20;

    /**
     * @brief 进程数限制，小于等于 0 表示不限制
     * 本地进程沙箱通过 RLIMIT_NPROC 限制，而 RLIMIT_NPROC 按用户计数，
     * 因此默认不在本地进程沙箱上启用；容器沙箱通过 --pids-limit 限制。
     */
    int process_limit = 0;
};

struct sandbox_options {
    /**
     * @brief 容器运行时的可执行文件，通过 PATH 查找
     */
    std::string container_binary = "docker";

    /**
     * @brief 各语言使用的容器镜像，键为语言名称 (python, javascript, java, cpp)
     */
    std::map<std::string, std::string> images = {
        {"python", "python:3.9-slim"},
        {"javascript", "node:16-alpine"},
        {"java", "openjdk:11-jdk-slim"},
        {"cpp", "gcc:latest"}};

    /**
     * @brief 允许同时执行的沙箱数量
     */
    size_t slots = 4;

    /**
     * @brief 容器内是否禁用网络
     */
    bool disable_network = true;

    /**
     * @brief 容器内的进程数限制
     */
    int container_pids_limit = 64;

    /**
     * @brief 测试点执行的默认资源限制
     */
    execution_limits limits;

    /**
     * @brief 即使容器运行时可用也使用本地进程执行
     */
    bool force_local = false;
};

/**
 * @brief 综合分数各维度的权重
 * 未能给出分数的维度不参与加权，剩余维度的权重重新归一化
 */
struct composite_weights {
    double correctness = 0.40;
    double quality = 0.15;
    double style = 0.10;
    double performance = 0.15;
    double naming = 0.10;

    // 不同题型在总分中的占比，同样按存在的题型归一化
    double coding = 0.6;
    double mcq = 0.3;
};

struct orchestrator_options {
    /**
     * @brief 工作线程数，所有作业共享
     */
    size_t workers = 4;

    /**
     * @brief 某个提交的所有测试点都超时时，认为该提交分析失败
     */
    bool fail_on_total_timeout = true;
};

struct grader_config {
    sandbox_options sandbox;
    composite_weights weights;
    orchestrator_options orchestrator;
};

void from_json(const nlohmann::json &j, execution_limits &limits);
void to_json(nlohmann::json &j, const execution_limits &limits);
void from_json(const nlohmann::json &j, sandbox_options &options);
void from_json(const nlohmann::json &j, composite_weights &weights);
void from_json(const nlohmann::json &j, orchestrator_options &options);
void from_json(const nlohmann::json &j, grader_config &config);

/**
 * @brief 从 json 配置文件读取配置，缺少的配置项保留默认值
 * 配置文件中的 work_dir 和 debug 会写入全局变量 WORK_DIR 和 DEBUG
 * @throw invalid_argument_error 配置文件不存在或格式错误
 */
grader_config load_config(const std::filesystem::path &path);

/**
 * @brief 使用环境变量覆盖配置
 * GRADER_WORK_DIR, GRADER_WORKERS, GRADER_SANDBOX_SLOTS, GRADER_CONTAINER_BINARY, GRADER_DEBUG
 */
void apply_env_overrides(grader_config &config);

}  // namespace grader
