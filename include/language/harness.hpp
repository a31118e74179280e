#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/source_scan.hpp"
#include "config.hpp"

namespace grader {

/**
 * @brief 支持的编程语言
 * 新增语言时实现一个 language_harness 并在 get_harness 中注册
 */
enum class language {
    PYTHON,
    JAVASCRIPT,
    JAVA,
    CPP
};

/**
 * @brief 解析语言名称，支持常见别名（py, python3, js, node, c++, cxx）
 * @throw invalid_argument_error 无法识别的语言
 */
language parse_language(const std::string &name);

/**
 * @brief 语言的规范名称，同时用作 sandbox_options::images 的键
 */
const char *get_language_name(language lang);

/**
 * @brief 运行器打印返回值时使用的行前缀
 * 选手代码自己的输出不会被当作返回值
 */
extern const char *const RESULT_MARKER;

/**
 * @brief 运行器找不到入口函数时在标准错误中打印的标记
 */
extern const char *const ENTRY_NOT_FOUND_MARKER;

/**
 * @brief 编译型语言编译失败时运行脚本的退出码
 */
constexpr int COMPILE_FAILURE_EXIT_CODE = 86;

struct parameter {
    std::string name;

    /**
     * @brief 参数类型，动态类型语言为空
     */
    std::string type;
};

/**
 * @brief 选手代码中被测试的函数
 */
struct entry_point {
    std::string name;
    std::vector<parameter> parameters;

    /**
     * @brief 函数接收可变参数（如 Python 的 *args）
     */
    bool variadic = false;

    /**
     * @brief 返回值类型，动态类型语言为空，void 表示没有返回值
     */
    std::string return_type;

    /**
     * @brief 若函数是某个类的成员函数，则为类名，运行器会先构造该类的实例
     */
    std::string class_name;

    /**
     * @brief 成员函数是否为静态函数
     */
    bool is_static = false;
};

/**
 * @brief 可以放进沙箱执行的单元
 */
struct executable_unit {
    language lang;

    /**
     * @brief 需要写入工作目录的文件，键为文件名
     */
    std::map<std::string, std::string> files;

    /**
     * @brief 在工作目录下执行的命令
     */
    std::vector<std::string> command;

    /**
     * @brief 运行时是否能在地址空间限制下启动
     * JVM 会预留大量虚拟地址空间，因此 Java 通过 -Xmx 限制堆大小而不设置 RLIMIT_AS
     */
    bool limit_address_space = true;
};

/**
 * @brief 语言适配器
 * 负责从源代码中找出入口函数、生成调用入口函数的运行器、以及解析运行器的输出
 */
struct language_harness {
    virtual ~language_harness() = default;

    virtual language type() const = 0;

    virtual comment_style comments() const = 0;

    /**
     * @brief 通过静态分析找到入口函数及其参数
     * @param source 选手代码
     * @param function_hint 题目指定的函数名，为空时自动选择
     * @throw entry_point_not_found 代码中没有可调用的函数
     */
    virtual entry_point prepare(const std::string &source, const std::optional<std::string> &function_hint) const = 0;

    /**
     * @brief 生成调用入口函数的运行器
     * @param source 选手代码
     * @param entry prepare 返回的入口函数
     * @param arguments 绑定好的实参列表，见 bind_arguments
     * @param limits 资源限制，部分运行时需要通过命令行参数限制内存
     * @throw invalid_argument_error 静态类型语言无法将实参转换为参数类型
     */
    virtual executable_unit build_invocation(const std::string &source, const entry_point &entry,
                                             const nlohmann::json &arguments,
                                             const execution_limits &limits) const = 0;

    /**
     * @brief 从运行器的标准输出中取出返回值并规范化
     * @return 返回值，若运行器没有打印返回值则为空
     */
    std::optional<nlohmann::json> parse_output(const std::string &raw_output) const;

    /**
     * @brief 根据入口函数的参数个数将测试输入绑定为实参列表
     * 测试输入为 json 数组时，若函数恰好有一个参数，则整个数组作为唯一实参；
     * 否则数组元素依次作为各个实参。非数组输入作为唯一实参。
     * @return json 数组，每个元素是一个实参
     */
    nlohmann::json bind_arguments(const std::string &input, const entry_point &entry) const;
};

/**
 * @brief 获取语言对应的适配器，适配器是无状态的，可以并发使用
 */
const language_harness &get_harness(language lang);

/**
 * @brief 将文本规范化为 json 值以便进行类型宽松的比较
 * 去除首尾空白；能解析为 json 的按 json 解析；Python 字面量（True、False、None、
 * 单引号字符串、元组）转换为对应的 json 值；其余情况作为字符串。
 */
nlohmann::json normalize_value(const std::string &text);

/**
 * @brief 比较两个规范化后的值
 * 数值按值比较（55 与 55.0 相等，浮点数允许 1e-9 的相对误差），字符串忽略首尾空白
 */
bool values_equal(const nlohmann::json &actual, const nlohmann::json &expected);

/**
 * @brief 按函数名选择入口函数
 * 若给出了 hint 且存在同名函数则选择它；否则若只有一个候选则选择它；否则选择第一个
 * @throw entry_point_not_found 候选列表为空
 */
entry_point select_entry_point(std::vector<entry_point> candidates, const std::optional<std::string> &function_hint);

}  // namespace grader
