#pragma once

#include <string>
#include <vector>
#include "analyzer/analyzer.hpp"
#include "analyzer/structure.hpp"

namespace grader {

enum class identifier_kind { FUNCTION, VARIABLE, PARAMETER, CLASS, CONSTANT };

const char *get_identifier_kind_name(identifier_kind kind);

/**
 * @brief 代码中声明的标识符
 */
struct identifier {
    std::string name;
    identifier_kind kind;
    size_t line_number = 0;
};

/**
 * @brief 按出现顺序列出代码中声明的函数、类、变量和参数，重复的声明只保留第一次
 */
std::vector<identifier> collect_identifiers(const code_structure &structure);

/**
 * @brief 判断标识符是否符合语言的命名规范
 * @param expected 不符合时写入期望的命名风格
 */
bool follows_convention(const identifier &id, language lang, std::string &expected);

/**
 * @brief 命名规范分析器，分数为符合规范的标识符所占比例
 * 允许 i、j、k、n、m、x、y、z 这样的单字母名称
 */
struct naming_analyzer : public analyzer {
    dimension type() const override;

    analyzer_result analyze(const analysis_context &context) const override;
};

}  // namespace grader
