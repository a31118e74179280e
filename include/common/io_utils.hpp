#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 * @throw std::system_error 文件无法打开
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 写入文本文件，文件存在时覆盖
 * @throw std::system_error 文件无法写入
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 断言 subpath 不会逃逸出所在目录
 * 语言适配器生成的文件名会拼接到沙箱工作目录下，
 * 如果文件名包含 "../" 或是绝对路径，那么可能覆盖工作目录外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

/**
 * @brief 递归删除目录，遇到权限问题时先放开权限再重试
 * @return 删除失败时的错误描述，成功时为空
 */
std::string remove_directory(const std::filesystem::path &dir);

}  // namespace grader
