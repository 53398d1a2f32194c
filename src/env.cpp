#include "env.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <filesystem>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

extern char **environ;

namespace solbuild {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

environment current_environment() {
    environment env;
    for (char **entry = environ; entry && *entry; ++entry) {
        string line(*entry);
        auto idx = line.find('=');
        if (idx == string::npos) continue;
        env[line.substr(0, idx)] = line.substr(idx + 1);
    }
    return env;
}

void from_json(const json &j, task_config &task) {
    if (j.count("name"))
        j.at("name").get_to(task.problem_name);
    if (j.count("type"))
        j.at("type").get_to(task.problem_type);
    if (j.count("has_grader"))
        j.at("has_grader").get_to(task.has_grader);
    if (j.count("has_manager"))
        j.at("has_manager").get_to(task.has_manager);
}

static optional<string> lookup(const environment &env, const string &key) {
    auto it = env.find(key);
    if (it == env.end()) return nullopt;
    return it->second;
}

static bool parse_bool(const string &key, const string &value) {
    if (value == "true") return true;
    if (value == "false") return false;
    throw configuration_error(fmt::format("Invalid value for variable {}: {}", key, value));
}

/**
 * @brief 路径优先取环境变量，否则使用推导出的默认值
 * 默认值的基准目录不存在时，该路径保持为空
 */
static fs::path location(const environment &env, const string &key, const fs::path &base, const fs::path &sub) {
    if (auto value = lookup(env, key)) return fs::absolute(*value);
    if (base.empty()) return {};
    return base / sub;
}

static task_config read_problem_json(const fs::path &problem_json) {
    task_config task;
    if (!fs::is_regular_file(problem_json)) return task;
    LOG(INFO) << "Reading task metadata from " << problem_json;
    try {
        json j = json::parse(read_file_content(problem_json));
        j.get_to(task);
    } catch (json::exception &e) {
        throw configuration_error(fmt::format("File {} is malformed: {}", problem_json.string(), e.what()));
    }
    return task;
}

build_config load_config(const environment &env) {
    build_config config;

    fs::path base_dir;
    if (auto value = lookup(env, "BASE_DIR")) base_dir = fs::absolute(*value);
    fs::path scripts = location(env, "SCRIPTS", base_dir, "scripts");

    auto &dirs = config.dirs;
    dirs.sandbox = location(env, "SANDBOX", base_dir, "sandbox");
    dirs.templates = location(env, "TEMPLATES", scripts, "templates");
    dirs.internals = location(env, "INTERNALS", scripts, "internal");
    dirs.grader_dir = location(env, "GRADER_DIR", base_dir, "grader");
    dirs.public_dir = location(env, "PUBLIC_DIR", base_dir, "public");
    if (auto value = lookup(env, "MANAGER_DIR"))
        dirs.manager_dir = fs::absolute(*value);
    else
        dirs.manager_dir = dirs.grader_dir;
    dirs.pre_compile = location(env, "PRE_COMPILE", dirs.templates, "pre_compile.sh");
    dirs.post_compile = location(env, "POST_COMPILE", dirs.templates, "post_compile.sh");

    if (dirs.sandbox.empty())
        throw configuration_error("Neither SANDBOX nor BASE_DIR is set");
    if (dirs.templates.empty())
        throw configuration_error("Neither TEMPLATES nor SCRIPTS nor BASE_DIR is set");

    if (!base_dir.empty())
        config.task = read_problem_json(base_dir / "problem.json");

    auto &task = config.task;
    if (auto value = lookup(env, "PROBLEM_NAME")) task.problem_name = *value;
    if (auto value = lookup(env, "PROBLEM_TYPE")) task.problem_type = *value;
    if (auto value = lookup(env, "HAS_GRADER")) task.has_grader = parse_bool("HAS_GRADER", *value);
    if (auto value = lookup(env, "HAS_MANAGER")) task.has_manager = parse_bool("HAS_MANAGER", *value);

    if (task.problem_name.empty())
        throw configuration_error("Problem name is not specified (PROBLEM_NAME)");
    if (task.problem_name.find('/') != string::npos)
        throw configuration_error("Invalid problem name: " + task.problem_name);

    auto &tools = config.tools;
    tools.cpp_std_opt = lookup(env, "CPP_STD_OPT");
    tools.cpp_warning_opts = lookup(env, "CPP_WARNING_OPTS");
    tools.cpp_opts = lookup(env, "CPP_OPTS");
    tools.pas_opts = lookup(env, "PAS_OPTS");
    tools.javac_warning_opts = lookup(env, "JAVAC_WARNING_OPTS");
    tools.javac_opts = lookup(env, "JAVAC_OPTS");
    tools.python = lookup(env, "PYTHON");

    auto &warnings = config.warnings;
    if (auto value = lookup(env, "WARN_FILE")) warnings.warn_file = fs::absolute(*value);
    warnings.cpp_pattern = lookup(env, "WARNING_TEXT_PATTERN_FOR_CPP").value_or("");
    warnings.pas_pattern = lookup(env, "WARNING_TEXT_PATTERN_FOR_PAS").value_or("");
    warnings.java_pattern = lookup(env, "WARNING_TEXT_PATTERN_FOR_JAVA").value_or("");
    warnings.py_pattern = lookup(env, "WARNING_TEXT_PATTERN_FOR_PY").value_or("");

#if defined(_WIN32) || defined(__CYGWIN__)
    config.on_windows = true;
#endif

    return config;
}

}  // namespace solbuild
