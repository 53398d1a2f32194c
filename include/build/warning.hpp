#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace solbuild {

/**
 * @brief 检查编译输出中是否出现警告文本
 * 若配置了 warn_file 且 pattern 非空，并且 compile_outputs 中有一行匹配 pattern，
 * 则向 warn_file 追加一行记录。pattern 与 grep 一样按基本正则表达式逐行匹配。
 * pattern 不合法或写入失败只记录日志，不会使构建失败。
 * @param pattern 当前语言的警告文本
 * @param compile_outputs 本次构建的编译输出记录
 * @param warn_file 警告记录文件
 * @return true 若追加了一行记录
 */
bool scan_warnings(const std::string &pattern,
                   const std::filesystem::path &compile_outputs,
                   const std::optional<std::filesystem::path> &warn_file);

}  // namespace solbuild
