#pragma once

#include <filesystem>
#include <string>

namespace solbuild {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 覆盖写入文本文件
 * @throw std::system_error 若文件无法打开
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 向文本文件末尾追加一行，文件不存在时创建
 * @throw std::system_error 若文件无法打开
 */
void append_line(const std::filesystem::path &path, const std::string &line);

/**
 * @brief 为文件添加所有用户的可执行权限，相当于 chmod +x
 */
void add_exec_permission(const std::filesystem::path &path);

/**
 * @brief 检查文件是否是当前用户可执行的普通文件
 */
bool is_executable_file(const std::filesystem::path &path);

}  // namespace solbuild
