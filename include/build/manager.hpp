#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "build/grader.hpp"
#include "build/sandbox.hpp"
#include "common/process.hpp"
#include "config.hpp"

namespace solbuild {

/**
 * @brief 交互题 manager 的构建
 * manager 通过 manager 目录下的 Makefile 构建，构建结果为 manager.exe。
 * Makefile 可以提供 compile_outputs_list 目标，列出构建时产生的输出文件，
 * 构建完成后会打印这些文件的内容以便排查问题。
 */
struct manager_builder {
    /**
     * @brief Makefile 中列出构建输出文件的目标名
     */
    static const std::string COMPILE_OUTPUTS_LIST_TARGET;

    manager_builder(const std::filesystem::path &manager_dir, process_runner &runner);

    /**
     * @brief 只有题目需要 manager 且使用评测 grader 时才构建 manager
     */
    static bool required(const task_config &task, const grader_spec &grader);

    /**
     * @brief 构建 manager 并复制到沙箱中
     * @throw manager_build_error 若 make 失败或没有生成 manager.exe
     */
    void build(const sandbox &box);

    /**
     * @brief 查询 Makefile 中声明的构建输出文件
     * @param outputs 输出文件名列表
     * @return false 若 Makefile 没有 compile_outputs_list 目标
     */
    bool compile_outputs_list(std::vector<std::string> &outputs);

private:
    std::filesystem::path manager_dir;
    process_runner &runner;
};

}  // namespace solbuild
