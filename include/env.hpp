#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include "config.hpp"

namespace solbuild {

/**
 * @brief 环境变量表，键为变量名
 */
typedef std::map<std::string, std::string> environment;

/**
 * @brief 获得当前进程的全部环境变量
 */
environment current_environment();

/**
 * @brief 从环境变量构造构建配置
 * 未设置的路径根据 BASE_DIR 和 SCRIPTS 推导；未设置的题目信息从
 * BASE_DIR/problem.json 读取。
 * @param env 环境变量表
 * @return 构建配置
 * @throw configuration_error 若必要的配置缺失或取值不合法
 */
build_config load_config(const environment &env);

/**
 * @brief 解析 problem.json 中与编译相关的字段
 * name, type, has_grader, has_manager 均为可选字段
 */
void from_json(const nlohmann::json &j, task_config &task);

}  // namespace solbuild
