#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <filesystem>
#include "build/strategy.hpp"
#include "common/utils.hpp"

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

language java_strategy::lang() const {
    return language::JAVA;
}

string java_strategy::warning_pattern(const warning_config &warnings) const {
    return warnings.java_pattern;
}

vector<string> java_strategy::compile_options(const tool_options &tools) {
    string warning_opts = tools.javac_warning_opts.value_or("-Xlint:all");
    LOG(INFO) << "JAVAC_WARNING_OPTS='" << warning_opts << "'";
    string opts = tools.javac_opts.value_or(warning_opts);
    LOG(INFO) << "JAVAC_OPTS='" << opts << "'";
    return split_arguments(opts);
}

/**
 * @brief 沙箱内所有的 .class 文件，按文件名排序
 */
static vector<string> class_files(const fs::path &dir) {
    vector<string> files;
    for (auto &entry : fs::directory_iterator(dir))
        if (entry.is_regular_file() && entry.path().extension() == ".class")
            files.push_back(entry.path().filename().string());
    sort(files.begin(), files.end());
    return files;
}

artifact java_strategy::build(const build_context &ctx) {
    const string &problem = ctx.config.task.problem_name;
    vector<string> opts = compile_options(ctx.config.tools);

    vector<string> files_to_compile = {ctx.solution_file};
    string main_class;
    if (ctx.grader.required) {
        ctx.box.copy_in(ctx.grader.language_dir / "grader.java");
        files_to_compile.push_back("grader.java");
        main_class = "grader";
    } else {
        main_class = problem;
    }
    LOG(INFO) << "files_to_compile: " << boost::algorithm::join(files_to_compile, " ");

    LOG(INFO) << "Compiling java sources...";
    compile(ctx, command_line("javac", opts, files_to_compile));

    string jar_file = problem + ".jar";
    LOG(INFO) << "Creating the jar file...";
    vector<string> classes = class_files(ctx.box.path());
    compile(ctx, command_line("jar", "cfe", jar_file, main_class, classes));

    LOG(INFO) << "Removing *.class files...";
    for (auto &class_file : classes)
        ctx.box.remove(class_file);

    artifact result;
    result.file = jar_file;
    result.entry_point = main_class;
    return result;
}

}  // namespace solbuild
