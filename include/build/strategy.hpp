#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "build/grader.hpp"
#include "build/language.hpp"
#include "build/sandbox.hpp"
#include "common/process.hpp"
#include "config.hpp"

/**
 * 这个头文件包含每种语言的构建策略
 * 1. native_cpp_strategy: C++ 先单独编译 grader.cpp 为 grader.o，再与选手程序链接为 <problem>.exe
 * 2. native_pascal_strategy: Pascal 的 grader.pas 通过 uses 引用选手程序，直接编译 grader.pas
 * 3. java_strategy: 编译后打包为 <problem>.jar，入口类为 grader 或 <problem>
 * 4. python_strategy: 只做语法检查，产物就是源代码本身
 * 所有策略都在沙箱目录下执行，编译器的输出同时写入 stderr 和 compile.outputs。
 */
namespace solbuild {

/**
 * @brief 构建产物
 */
struct artifact {
    /**
     * @brief 产物在沙箱内的文件名，比如 aplusb.exe, aplusb.jar, grader.py
     */
    std::string file;

    /**
     * @brief 产物的入口，有 grader 时为 grader，否则为题目名
     * Java 中即为 jar 的入口类名，Python 中即为主模块名
     */
    std::string entry_point;

    /**
     * @brief 产物为生成脚本提供的额外替换值，键为占位符去掉 _PLACE_HOLDER 后的名字
     * 比如 Python 提供 MAIN_FILE_NAME 和 PYTHON_CMD
     */
    std::map<std::string, std::string> tokens;
};

/**
 * @brief 构建策略执行时需要的上下文
 */
struct build_context {
    const build_config &config;
    const grader_spec &grader;
    const sandbox &box;
    process_runner &runner;

    /**
     * @brief 沙箱内选手程序的文件名 <problem>.<source extension>
     */
    std::string solution_file;
};

/**
 * @brief 一种语言的构建方式
 */
struct build_strategy {
    virtual ~build_strategy() = default;

    virtual language lang() const = 0;

    /**
     * @brief 在沙箱内编译选手程序（以及 grader）
     * 调用方保证当前工作目录为沙箱目录，且选手程序已经复制进沙箱
     * @param ctx 构建上下文
     * @return 构建产物
     * @throw compilation_error 若编译器返回非零值
     */
    virtual artifact build(const build_context &ctx) = 0;

    /**
     * @brief 该语言的编译警告文本，为空表示不检测
     */
    virtual std::string warning_pattern(const warning_config &warnings) const = 0;

protected:
    /**
     * @brief 执行一次编译命令，输出追加到 compile.outputs
     * @throw compilation_error 若命令返回非零值
     */
    void compile(const build_context &ctx, const std::vector<std::string> &argv) const;
};

struct native_cpp_strategy : public build_strategy {
    language lang() const override;
    artifact build(const build_context &ctx) override;
    std::string warning_pattern(const warning_config &warnings) const override;

    /**
     * @brief 最终的 g++ 编译选项
     * CPP_OPTS 若未设置则为 -DEVAL ${CPP_STD_OPT} ${CPP_WARNING_OPTS} -O2
     */
    static std::vector<std::string> compile_options(const tool_options &tools);
};

struct native_pascal_strategy : public build_strategy {
    language lang() const override;
    artifact build(const build_context &ctx) override;
    std::string warning_pattern(const warning_config &warnings) const override;

    static std::vector<std::string> compile_options(const tool_options &tools);
};

struct java_strategy : public build_strategy {
    language lang() const override;
    artifact build(const build_context &ctx) override;
    std::string warning_pattern(const warning_config &warnings) const override;

    static std::vector<std::string> compile_options(const tool_options &tools);
};

struct python_strategy : public build_strategy {
    /**
     * @param version language::PY 或 language::PY2
     */
    explicit python_strategy(language version);

    language lang() const override;
    artifact build(const build_context &ctx) override;
    std::string warning_pattern(const warning_config &warnings) const override;

    /**
     * @brief 按优先级确定解释器命令：PYTHON 环境变量、python3/python2、python
     * @throw interpreter_not_found 若所有候选命令都不存在
     */
    std::string resolve_interpreter(const tool_options &tools, process_runner &runner) const;

private:
    language version;
};

/**
 * @brief 为语言创建对应的构建策略
 */
std::unique_ptr<build_strategy> make_build_strategy(language lang);

}  // namespace solbuild
