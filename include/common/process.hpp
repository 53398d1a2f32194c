#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace solbuild {

/**
 * @brief 执行外部程序的接口
 * 编译器、解释器、jar、make 以及钩子脚本都通过这个接口调用，
 * 外部程序在当前进程的工作目录下运行。
 * 单元测试中使用 mock_process_runner 替换真实的进程执行。
 */
struct process_runner {
    virtual ~process_runner() = default;

    /**
     * @brief 执行外部程序并等待其结束
     * 外部程序的 stdout 和 stderr 被合并，实时转发到本进程的 stderr，
     * 同时追加到 log 文件中（log 为空时不记录）。
     * @param argv 外部程序的路径 (argv[0]) 和参数
     * @param env 额外的环境变量，覆盖继承下来的同名变量
     * @param log 追加外部程序输出的文件
     * @return 外部程序的返回值，如果外部程序因为信号崩溃而没有返回码，则返回 -1
     */
    virtual int run(const std::vector<std::string> &argv,
                    const std::map<std::string, std::string> &env,
                    const std::filesystem::path &log) = 0;

    /**
     * @brief 执行外部程序并收集其 stdout，stderr 被丢弃
     * @param argv 外部程序的路径 (argv[0]) 和参数
     * @param output 收集到的 stdout 内容
     * @return 外部程序的返回值，因信号崩溃时返回 -1
     */
    virtual int capture(const std::vector<std::string> &argv, std::string &output) = 0;

    /**
     * @brief 检查命令是否存在
     * 包含 '/' 的命令视为路径，否则在 PATH 中查找
     */
    virtual bool command_exists(const std::string &command) = 0;
};

/**
 * @brief 使用 fork/execvp 实现的进程执行
 */
struct system_process_runner : public process_runner {
    int run(const std::vector<std::string> &argv,
            const std::map<std::string, std::string> &env,
            const std::filesystem::path &log) override;

    int capture(const std::vector<std::string> &argv, std::string &output) override;

    bool command_exists(const std::string &command) override;
};

}  // namespace solbuild
