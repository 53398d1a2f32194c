#pragma once

#include <filesystem>
#include <string>

namespace solbuild {

/**
 * @brief 支持的源代码语言
 * 语言只由扩展名决定，不支持的扩展名直接报错
 */
enum class language {
    /**
     * @brief C++，扩展名 .cpp 或 .cc，先编译 grader 再链接
     */
    CPP,

    /**
     * @brief Pascal，扩展名 .pas，直接编译 grader.pas
     */
    PAS,

    /**
     * @brief Java，扩展名 .java，打包为 jar
     */
    JAVA,

    /**
     * @brief Python 3，扩展名 .py
     */
    PY,

    /**
     * @brief Python 2，扩展名 .py2
     */
    PY2
};

/**
 * @brief 根据源文件扩展名确定语言
 * @param solution 源文件路径
 * @throw unsupported_language_error 若扩展名不受支持
 */
language resolve_language(const std::filesystem::path &solution);

/**
 * @brief 语言的标识，用作 exec 模板后缀和 grader 子目录名
 * @return cpp, pas, java, py, py2
 */
std::string language_tag(language lang);

/**
 * @brief 沙箱内选手程序的扩展名
 * 与 language_tag 相同，只有 Python 2 使用 py，保证主模块能以 <problem>.py 被导入
 */
std::string source_extension(language lang);

/**
 * @brief 用于日志的语言名称
 */
std::string language_name(language lang);

}  // namespace solbuild
