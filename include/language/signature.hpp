#pragma once

#include <string>
#include <vector>
#include "language/harness.hpp"

namespace grader {

/**
 * @brief 顶层的类（或结构体、接口）及其类体的范围
 */
struct class_region {
    std::string name;
    size_t open = 0;   // 类体左花括号位置
    size_t close = 0;  // 类体右花括号位置
    bool is_public = false;
};

/**
 * @brief C 风格语言的声明扫描结果，供 Java 和 C++ 适配器查找方法签名
 */
struct declaration_scan {
    /**
     * @brief 去掉注释和字符串内容后的代码
     */
    std::string code;

    /**
     * @brief 每个位置的花括号深度
     */
    std::vector<int> depths;

    /**
     * @brief 每行在 code 中的起始位置
     */
    std::vector<size_t> line_offsets;

    std::vector<class_region> classes;

    /**
     * @brief position 所在的顶层类，不在任何类中时返回 nullptr
     */
    const class_region *class_at(size_t position) const;

    std::string line(size_t index) const;
};

declaration_scan scan_declarations(const std::string &source);

/**
 * @brief 判断右括号 close 之后是否紧跟函数体
 * 允许中间出现 const、noexcept、override、final、throws 子句和尾置返回类型
 */
bool has_body_after(const std::string &code, size_t close);

/**
 * @brief 解析带类型的参数声明，如 "const std::vector<int> &nums = {}"
 */
parameter parse_typed_parameter(const std::string &raw);

/**
 * @brief 去掉类型中的 const、final、引用符号和多余空白
 */
std::string simplify_type(std::string type);

}  // namespace grader
