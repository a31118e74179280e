#pragma once

#include "language/harness.hpp"

namespace grader {

/**
 * @brief Python 3 适配器
 * 入口函数可以是模块顶层函数，也可以是类的成员函数（如 LeetCode 风格的 class Solution）
 * 运行器从 args.json 读取实参，以 json 格式打印返回值
 */
struct python_harness : public language_harness {
    language type() const override;
    comment_style comments() const override;
    entry_point prepare(const std::string &source, const std::optional<std::string> &function_hint) const override;
    executable_unit build_invocation(const std::string &source, const entry_point &entry,
                                     const nlohmann::json &arguments,
                                     const execution_limits &limits) const override;
};

}  // namespace grader
