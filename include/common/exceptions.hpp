#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>
#include "config.hpp"

namespace solbuild {

/**
 * @brief 所有构建错误的基类
 * 每种错误都对应一个进程退出码，main 函数捕获后直接返回该退出码。
 */
struct build_exception : std::exception {
    build_exception();
    explicit build_exception(const std::string &message, int exit_code = E_CONFIGURATION_ERROR);

    friend std::ostream &operator<<(std::ostream &os, const build_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 该错误导致的进程退出码
     */
    int exit_code() const noexcept;

private:
    std::string message;
    int code;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 命令行参数错误，比如没有给出源代码路径
 */
struct argument_error : public build_exception {
    explicit argument_error(const std::string &message);
};

/**
 * @brief 环境变量或 problem.json 中的配置缺失或不合法
 */
struct configuration_error : public build_exception {
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 无法识别的源代码扩展名
 */
struct unsupported_language_error : public build_exception {
    explicit unsupported_language_error(const std::string &extension);
};

/**
 * @brief 题目没有 grader 时要求使用 public grader
 */
struct unsupported_grader_error : public build_exception {
    explicit unsupported_grader_error(const std::string &message);
};

/**
 * @brief 表示编译器或解释器返回了非零值
 * 退出码即为编译器的返回值，编译输出保存在 error_log 中
 */
struct compilation_error : public build_exception {
    const std::string error_log;

    compilation_error(const std::string &what, int tool_exit_code, const std::string &error_log);
};

/**
 * @brief 编译器返回 0 但是没有产生可执行文件
 * 通常是 Pascal 源文件是 UNIT 而不是 PROGRAM
 */
struct artifact_not_produced : public build_exception {
    explicit artifact_not_produced(const std::string &message);
};

struct interpreter_not_found : public build_exception {
    explicit interpreter_not_found(const std::string &message);
};

struct template_not_found : public build_exception {
    explicit template_not_found(const std::string &message);
};

/**
 * @brief 沙箱目录操作失败（删除、创建、复制文件）
 */
struct io_error : public build_exception {
    explicit io_error(const std::string &message);
};

struct manager_build_error : public build_exception {
    manager_build_error(const std::string &message, int exit_code);
};

/**
 * @brief 编译前后的钩子脚本执行失败
 */
struct hook_error : public build_exception {
    hook_error(const std::string &message, int exit_code);
};

/**
 * @brief 不应该到达的内部状态
 */
struct illegal_state_error : public build_exception {
    explicit illegal_state_error(const std::string &message);
};

/**
 * @brief 将外部程序的返回值转换为退出码
 * 外部程序因信号崩溃时返回值为 -1，此时退出码为 1
 */
int tool_exit_code(int ret) noexcept;

}  // namespace solbuild
