#pragma once

#include <string>

namespace grader {

template <typename ContainerT>
void append(ContainerT &a, const ContainerT &b) {
    a.insert(a.end(), b.begin(), b.end());
}

/**
 * @brief 将字符串截断到至多 limit 字节，截断时在末尾追加标记
 * 用于限制写入执行结果和日志的错误信息长度
 */
std::string truncate_string(const std::string &s, size_t limit);

}  // namespace grader
