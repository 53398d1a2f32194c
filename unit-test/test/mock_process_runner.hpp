#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "common/process.hpp"

/**
 * 测试用的进程执行
 * 不启动任何外部程序，只记录每次调用，并按命令名调用注册的处理函数。
 * 处理函数可以在当前工作目录下创建文件来模拟编译器的产物。
 * 用法：
 * 1. mock_process_runner runner;
 * 2. runner.on("g++", [](auto &call) { touch("aplusb.exe"); return 0; });
 * 3. 执行构建，检查 runner.calls
 */
namespace solbuild::mock {

struct process_call {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::filesystem::path log;

    /**
     * @brief 调用时进程的工作目录
     */
    std::filesystem::path cwd;

    /**
     * @brief 是否通过 capture 调用
     */
    bool captured = false;
};

struct mock_process_runner : public solbuild::process_runner {
    typedef std::function<int(const process_call &)> handler;

    std::vector<process_call> calls;

    /**
     * @brief command_exists 返回 true 的命令
     */
    std::set<std::string> available_commands;

    /**
     * @brief capture 调用时返回的 stdout，键为命令名
     */
    std::map<std::string, std::string> captured_outputs;

    /**
     * @brief 注册命令的处理函数，未注册的命令直接返回 0
     */
    void on(const std::string &command, handler fn);

    /**
     * @brief 命令执行时向 log 写入的内容，模拟编译器输出
     */
    void output(const std::string &command, const std::string &text);

    int run(const std::vector<std::string> &argv,
            const std::map<std::string, std::string> &env,
            const std::filesystem::path &log) override;

    int capture(const std::vector<std::string> &argv, std::string &output) override;

    bool command_exists(const std::string &command) override;

    /**
     * @brief 所有调用的 argv[0]，按调用顺序
     */
    std::vector<std::string> commands() const;

private:
    std::map<std::string, handler> handlers;
    std::map<std::string, std::string> outputs;
};

/**
 * @brief 创建一个文件，可选地加上可执行权限
 */
void touch(const std::filesystem::path &path, const std::string &content = "", bool executable = false);

}  // namespace solbuild::mock
