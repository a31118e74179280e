#pragma once

#include "language/harness.hpp"

namespace grader {

/**
 * @brief Java 适配器
 * 入口函数为类中的方法，运行器 GraderMain 按参数类型生成字面量并调用该方法，
 * 编译和运行都在沙箱内完成
 */
struct java_harness : public language_harness {
    language type() const override;
    comment_style comments() const override;
    entry_point prepare(const std::string &source, const std::optional<std::string> &function_hint) const override;
    executable_unit build_invocation(const std::string &source, const entry_point &entry,
                                     const nlohmann::json &arguments,
                                     const execution_limits &limits) const override;

    /**
     * @brief 将 json 值渲染为指定 Java 类型的字面量表达式
     * @throw invalid_argument_error 值与类型不匹配
     */
    static std::string render_literal(const nlohmann::json &value, const std::string &type);
};

}  // namespace grader
