#pragma once

#include <filesystem>
#include <string>
#include "build/language.hpp"
#include "config.hpp"

namespace solbuild {

/**
 * @brief grader 的种类
 * JUDGE 为评测使用的 grader，PUBLIC 为发给选手的 grader
 */
enum class grader_variant {
    JUDGE,
    PUBLIC
};

/**
 * @brief 表示本次构建使用的 grader
 */
struct grader_spec {
    /**
     * @brief 是否需要将 grader 和选手程序一起编译
     */
    bool required = false;

    /**
     * @brief grader 种类，仅在 required 时决定 grader 目录；
     * 不需要 grader 时仍为 JUDGE，用于选择 run 脚本模板
     */
    grader_variant variant = grader_variant::JUDGE;

    /**
     * @brief 所选 grader 种类的根目录
     */
    std::filesystem::path base_dir;

    /**
     * @brief 当前语言的 grader 目录，即 base_dir/<language tag>
     */
    std::filesystem::path language_dir;
};

/**
 * @brief 确定本次构建使用的 grader
 * @param has_grader 题目是否有 grader
 * @param use_public 命令行是否要求使用 public grader
 * @param lang 源文件语言
 * @param dirs grader 目录所在位置
 * @throw unsupported_grader_error 若题目没有 grader 却要求使用 public grader
 */
grader_spec resolve_grader(bool has_grader, bool use_public, language lang, const locations &dirs);

/**
 * @return judge 或 public
 */
std::string to_string(grader_variant variant);

}  // namespace solbuild
