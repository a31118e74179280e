#pragma once

#include <string>
#include <utility>
#include <vector>
#include "common/source_scan.hpp"
#include "language/harness.hpp"

namespace grader {

/**
 * @brief 源代码中的一个函数（或方法）
 */
struct function_span {
    std::string name;
    std::vector<std::string> parameters;

    /**
     * @brief 函数头所在行的下标（从 0 开始）
     */
    size_t line = 0;

    /**
     * @brief 函数体最后一行的下一行的下标
     */
    size_t end = 0;
};

/**
 * @brief 静态分析器共用的代码结构
 * 只做轻量的词法级分析：按缩进（Python）或花括号深度（C 风格语言）划分代码块
 */
struct code_structure {
    language lang;
    std::vector<source_line> lines;

    /**
     * @brief 每行行首所在代码块的层级
     * Python 为缩进宽度，其他语言为行首的花括号深度
     */
    std::vector<int> levels;

    std::vector<function_span> functions;

    /**
     * @brief 类（结构体、接口、枚举）的名称及其所在行的下标
     */
    std::vector<std::pair<std::string, size_t>> classes;

    /**
     * @brief 以第 index 行开头的语句（如循环、函数）所控制的代码块的结束位置
     * @return 代码块最后一行的下一行的下标
     */
    size_t block_end(size_t index) const;

    /**
     * @brief 第 begin 行到第 end 行（不含）的代码，以换行连接
     */
    std::string code_between(size_t begin, size_t end) const;

    /**
     * @brief 非空且不只有注释的行数
     */
    size_t code_line_count() const;

    /**
     * @brief 只有注释的行数，加上带行尾注释的行数
     */
    size_t comment_line_count() const;

    /**
     * @brief 非空行数
     */
    size_t non_blank_line_count() const;

    /**
     * @brief 包含第 index 行的函数，有多个时返回最内层的；不在任何函数中时返回 nullptr
     */
    const function_span *function_at(size_t index) const;
};

code_structure analyze_structure(const std::string &source, language lang);

/**
 * @brief 判断标识符是否为语言关键字或常见的控制结构
 */
bool is_keyword(const std::string &word, language lang);

}  // namespace grader
