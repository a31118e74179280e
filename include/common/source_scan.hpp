#pragma once

#include <string>
#include <vector>

namespace grader {

/**
 * @brief 注释语法
 * HASH: Python 风格，# 行注释，'/" 以及三引号字符串
 * C_STYLE: C/C++/Java/JavaScript 风格，// 与 /* *\/ 注释，'/"/` 字符串
 */
enum class comment_style { HASH, C_STYLE };

/**
 * @brief 源代码中的一行
 */
struct source_line {
    /**
     * @brief 行号，从 1 开始
     */
    size_t number = 0;

    /**
     * @brief 原始文本，不含换行符
     */
    std::string text;

    /**
     * @brief 去掉注释并清空字符串字面量内容后的代码（保留引号）
     * 静态分析只在这个字段上做模式匹配，避免注释和字符串里的关键字造成误判
     */
    std::string code;

    /**
     * @brief 注释文本（不含注释符号），多段注释以空格连接
     */
    std::string comment;

    bool has_comment = false;

    bool is_blank() const;

    /**
     * @brief 本行只有注释，或者是多行字符串（文档字符串）的一部分
     */
    bool is_comment() const;

    /**
     * @brief 行首缩进的宽度，制表符按 4 计算
     */
    size_t indent() const;
};

std::vector<source_line> scan_source(const std::string &source, comment_style style);

/**
 * @brief 去掉注释并清空字符串内容后的完整代码，行结构保持不变
 */
std::string strip_comments(const std::string &source, comment_style style);

/**
 * @brief 从 open 位置的括号开始查找匹配的右括号
 * @param code 已经去除注释和字符串内容的代码
 * @return 右括号位置，找不到时返回 npos
 */
size_t find_matching(const std::string &code, size_t open);

/**
 * @brief 按顶层逗号切分参数列表，忽略尖括号、方括号、圆括号和花括号内部的逗号
 */
std::vector<std::string> split_top_level(const std::string &list);

}  // namespace grader
