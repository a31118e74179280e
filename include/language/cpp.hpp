#pragma once

#include "language/harness.hpp"

namespace grader {

/**
 * @brief C++ 适配器
 * 入口函数可以是自由函数，也可以是类（如 class Solution）的成员函数。
 * 运行器 main.cpp 通过 #include 引入选手代码，选手代码中的 main 会被改名。
 */
struct cpp_harness : public language_harness {
    language type() const override;
    comment_style comments() const override;
    entry_point prepare(const std::string &source, const std::optional<std::string> &function_hint) const override;
    executable_unit build_invocation(const std::string &source, const entry_point &entry,
                                     const nlohmann::json &arguments,
                                     const execution_limits &limits) const override;

    /**
     * @brief 将 json 值渲染为指定 C++ 类型的表达式
     * @throw invalid_argument_error 值与类型不匹配
     */
    static std::string render_literal(const nlohmann::json &value, const std::string &type);
};

}  // namespace grader
