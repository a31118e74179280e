#pragma once

#include "language/harness.hpp"

namespace grader {

/**
 * @brief JavaScript (Node.js) 适配器
 * 支持函数声明、赋值给 const/let/var 的函数表达式与箭头函数、以及类方法
 */
struct javascript_harness : public language_harness {
    language type() const override;
    comment_style comments() const override;
    entry_point prepare(const std::string &source, const std::optional<std::string> &function_hint) const override;
    executable_unit build_invocation(const std::string &source, const entry_point &entry,
                                     const nlohmann::json &arguments,
                                     const execution_limits &limits) const override;
};

}  // namespace grader
