#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "build/grader.hpp"
#include "build/language.hpp"
#include "build/strategy.hpp"
#include "common/process.hpp"
#include "config.hpp"

namespace solbuild {

/**
 * @brief 一次构建请求，来自命令行
 */
struct build_request {
    /**
     * @brief 选手程序的路径
     */
    std::filesystem::path solution;

    bool verbose = false;

    /**
     * @brief 是否使用 public grader 编译
     */
    bool use_public_grader = false;
};

/**
 * @brief 构建完成后的结果，沙箱内的文件已经全部就绪
 */
struct build_result {
    language lang;
    grader_spec grader;
    artifact output;

    /**
     * @brief 是否向 WARN_FILE 记录了编译警告
     */
    bool warning_reported = false;

    /**
     * @brief 是否构建了 manager
     */
    bool manager_built = false;
};

/**
 * @brief 组织一次完整的构建过程
 * 1. 识别语言，确定 grader
 * 2. 重建沙箱，复制选手程序
 * 3. 在沙箱中执行编译前钩子，按语言编译，检查编译警告
 * 4. 由模板生成 exec.sh 和 run.sh
 * 5. 按需构建 manager
 * 6. 执行编译后钩子
 * 任何一步失败都会抛出 build_exception 并中止构建。
 */
struct orchestrator {
    /**
     * @param config 构建配置，生命周期需长于 orchestrator
     * @param runner 执行外部程序的对象
     */
    orchestrator(const build_config &config, process_runner &runner);

    build_result build(const build_request &request);

    /**
     * @brief 导出给钩子脚本的环境变量
     */
    std::map<std::string, std::string> hook_exports(const build_request &request, const grader_spec &grader) const;

private:
    const build_config &config;
    process_runner &runner;
};

}  // namespace solbuild
