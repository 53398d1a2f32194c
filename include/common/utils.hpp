#pragma once

#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "common/process.hpp"

namespace solbuild {

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::string> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::string &element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<const char *> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const char *element) {
        cont.push_back(element);
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 组装命令行
 * @code{.cpp}
 *     std::vector<std::string> opts = {"-O2", "-DEVAL"};
 *     // {"g++", "-O2", "-DEVAL", "aplusb.cpp", "-o", "aplusb.exe"}
 *     auto argv = command_line("g++", opts, "aplusb.cpp", "-o", "aplusb.exe");
 * @endcode
 */
template <typename... Args>
std::vector<std::string> command_line(Args &&... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return list;
}

/**
 * @brief 调用外部程序，输出转发到 stderr 并追加到 log
 * @note 与 system(cmd) 的区别是，这个函数避免了转义导致的安全问题
 * @param runner 实际执行外部程序的对象
 * @param env 额外的环境变量
 * @param log 外部程序输出的记录文件，为空则不记录
 * @param args 转送给应用程序的参数列表，比如可以传入 filesystem::path 给 args[0] 来表示应用程序路径
 * @return 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则返回 -1
 */
template <typename... Args>
int call_process_env(process_runner &runner, const std::map<std::string, std::string> &env,
                     const std::filesystem::path &log, Args &&... args) {
    std::vector<std::string> list = command_line(args...);
    LOG(INFO) << "RUN: " << boost::algorithm::join(list, " ");
    return runner.run(list, env, log);
}

template <typename... Args>
int call_process(process_runner &runner, const std::filesystem::path &log, Args &&... args) {
    return call_process_env(runner, {}, log, args...);
}

/**
 * @brief 将编译选项字符串按空白字符拆分，相当于 shell 中不加引号展开变量
 * @param options 比如 "-DEVAL --std=gnu++14 -O2"
 * @return 拆分后的参数，不包含空字符串
 */
std::vector<std::string> split_arguments(const std::string &options);

}  // namespace solbuild
