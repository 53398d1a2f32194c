#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace solbuild {

enum error_codes {
    E_SUCCESS = 0,

    /**
     * @brief 配置错误、语言或 grader 不受支持、找不到解释器或模板
     */
    E_CONFIGURATION_ERROR = 1,

    /**
     * @brief 命令行参数错误
     */
    E_ARGUMENT_ERROR = 2,

    E_ILLEGAL_STATE = 5
};

/**
 * @brief 题目的描述信息，来自环境变量或 problem.json
 */
struct task_config {
    /**
     * @brief 题目名，决定沙箱中的文件名，比如 aplusb.cpp、aplusb.exe
     */
    std::string problem_name;

    /**
     * @brief 题目类型，可选 Batch, OutputOnly, Communication, TwoSteps
     */
    std::string problem_type;

    bool has_grader = false;

    /**
     * @brief 是否需要编译交互题的 manager
     */
    bool has_manager = false;
};

/**
 * @brief 构建时涉及的所有路径
 *
 * BASE_DIR
 * ├── sandbox // 构建的沙箱目录，每次构建前清空
 * ├── grader // 评测用 grader，每种语言一个子目录，同时存放 manager 的 Makefile
 * │   ├── cpp // <problem>.h, grader.cpp
 * │   ├── pas // grader.pas, (graderlib.pas)
 * │   ├── java // grader.java
 * │   └── py // grader.py
 * ├── public // 公开给选手的 grader，结构与 grader 相同
 * └── scripts
 *     ├── templates // exec.<lang>.sh, run.<type>.sh, pre_compile.sh, post_compile.sh
 *     └── internal // win_rte_dialog_disabler.cpp
 */
struct locations {
    std::filesystem::path sandbox;
    std::filesystem::path templates;
    std::filesystem::path internals;
    std::filesystem::path grader_dir;
    std::filesystem::path public_dir;
    std::filesystem::path manager_dir;
    std::filesystem::path pre_compile;
    std::filesystem::path post_compile;
};

/**
 * @brief 可以覆盖的编译器参数，未设置时使用各语言的默认值
 */
struct tool_options {
    std::optional<std::string> cpp_std_opt;
    std::optional<std::string> cpp_warning_opts;
    std::optional<std::string> cpp_opts;
    std::optional<std::string> pas_opts;
    std::optional<std::string> javac_warning_opts;
    std::optional<std::string> javac_opts;

    /**
     * @brief 指定 Python 解释器命令
     */
    std::optional<std::string> python;
};

/**
 * @brief 编译警告检测的配置
 * 若编译输出中出现了对应语言的文本，则向 warn_file 追加一行记录
 */
struct warning_config {
    std::optional<std::filesystem::path> warn_file;
    std::string cpp_pattern;
    std::string pas_pattern;
    std::string java_pattern;
    std::string py_pattern;
};

/**
 * @brief 一次构建的全部配置
 * 在程序启动时构造一次，之后只以 const 引用的方式传递给各个组件
 */
struct build_config {
    locations dirs;
    task_config task;
    tool_options tools;
    warning_config warnings;

    /**
     * @brief 在 Windows 上需要额外编译 win_rte_dialog_disabler.cpp 来禁止运行时错误对话框
     */
    bool on_windows = false;

    /**
     * @brief 编译器是否输出彩色诊断信息，取决于 stderr 是否是终端
     */
    bool color_diagnostics = false;
};

}  // namespace solbuild
