#pragma once

#include <filesystem>
#include <map>
#include <string>
#include "build/grader.hpp"
#include "build/language.hpp"

namespace solbuild {

/**
 * @brief 模板替换表，键为占位符名（不含 _PLACE_HOLDER 后缀），比如 PROBLEM_NAME
 */
typedef std::map<std::string, std::string> token_map;

/**
 * @brief 将 body 中所有的 <KEY>_PLACE_HOLDER 替换为对应的值
 */
std::string replace_tokens(std::string body, const token_map &tokens);

/**
 * @brief 由模板生成脚本
 * 读取模板，替换占位符后写入 target，并添加可执行权限
 * @param source 模板文件
 * @param target 生成的脚本
 * @param tokens 替换表
 * @throw template_not_found 若模板文件不存在
 * @throw io_error 若写入失败
 */
void instantiate_template(const std::filesystem::path &source,
                          const std::filesystem::path &target,
                          const token_map &tokens);

/**
 * @brief 题目类型对应的运行方式
 * Batch, OutputOnly -> batch
 * Communication -> communication
 * TwoSteps -> two-steps
 * 其他 -> other
 */
std::string runner_kind(const std::string &problem_type);

/**
 * @return templates/exec.<language tag>.sh
 */
std::filesystem::path exec_template(const std::filesystem::path &templates, language lang);

/**
 * @brief 选择 run 脚本模板
 * 评测 grader 根据题目类型选择 run.judge.<runner kind>.sh，
 * public grader 不区分题目类型，总是使用 run.public.sh
 */
std::filesystem::path run_template(const std::filesystem::path &templates, grader_variant variant, const std::string &problem_type);

}  // namespace solbuild
