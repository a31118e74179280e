#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace grader {

/**
 * @brief 错误分类，同时作为作业日志和结构化错误中的类型名
 */
enum class error_kind {
    SANDBOX_UNAVAILABLE,
    EXECUTION_TIMEOUT,
    ENTRY_POINT_NOT_FOUND,
    ANALYZER_FAILURE,
    JOB_PARTIAL_FAILURE,
    CLEANUP_ERROR,
    NOT_FOUND,
    INVALID_ARGUMENT,
    INTERNAL_ERROR
};

/**
 * @brief 返回错误类型的对外名称，如 "ExecutionTimeout"
 */
const char *get_kind_name(error_kind kind);

/**
 * @brief 由名称解析错误类型，无法识别时返回 INTERNAL_ERROR
 */
error_kind parse_error_kind(const std::string &name);

struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);
    grader_exception(error_kind kind, const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    template <typename T>
    grader_exception operator<<(const T &t) const {
        return grader_exception(error_code, message + boost::lexical_cast<std::string>(t));
    }

    error_kind kind() const noexcept;

    const char *what() const noexcept override;

private:
    error_kind error_code;
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误，通常是程序自身的问题
 */
struct internal_error : public grader_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 沙箱无法使用，本地进程和容器均无法启动
 */
struct sandbox_unavailable : public grader_exception {
    explicit sandbox_unavailable(const std::string &message);
};

/**
 * @brief 执行超时
 * 单个测试点超时只会记录到该测试点的执行结果中，
 * 只有某个提交的所有测试点都超时时才会以异常的形式抛出
 */
struct execution_timeout : public grader_exception {
    explicit execution_timeout(const std::string &message);
};

/**
 * @brief 无法在选手代码中找到可调用的入口函数
 */
struct entry_point_not_found : public grader_exception {
    explicit entry_point_not_found(const std::string &message);
};

struct analyzer_failure : public grader_exception {
    explicit analyzer_failure(const std::string &message);
};

struct cleanup_error : public grader_exception {
    explicit cleanup_error(const std::string &message);
};

/**
 * @brief 请求的对象（作业、提交、测试、分析记录）不存在
 */
struct not_found_error : public grader_exception {
    explicit not_found_error(const std::string &message);
};

struct invalid_argument_error : public grader_exception {
    explicit invalid_argument_error(const std::string &message);
};

}  // namespace grader
