#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "common/process.hpp"

namespace solbuild {

/**
 * @brief 编译前后执行的钩子脚本
 * 脚本的内容对构建过程是透明的，只在文件存在时通过 bash 执行。
 */
struct hook {
    /**
     * @brief 用于日志的名字，比如 pre-compilation
     */
    std::string name;

    std::filesystem::path script;

    hook(const std::string &name, const std::filesystem::path &script);

    bool present() const;

    /**
     * @brief 若脚本存在则执行
     * @param runner 执行脚本的对象
     * @param exports 导出给脚本的环境变量
     * @return true 若脚本存在并执行成功
     * @throw hook_error 若脚本返回非零值
     */
    bool run(process_runner &runner, const std::map<std::string, std::string> &exports) const;
};

}  // namespace solbuild
