#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include "build/strategy.hpp"
#include "common/utils.hpp"

namespace solbuild {
using namespace std;

language native_cpp_strategy::lang() const {
    return language::CPP;
}

string native_cpp_strategy::warning_pattern(const warning_config &warnings) const {
    return warnings.cpp_pattern;
}

vector<string> native_cpp_strategy::compile_options(const tool_options &tools) {
    string std_opt = tools.cpp_std_opt.value_or("--std=gnu++14");
    LOG(INFO) << "CPP_STD_OPT='" << std_opt << "'";
    string warning_opts = tools.cpp_warning_opts.value_or("-Wall -Wextra -Wshadow");
    LOG(INFO) << "CPP_WARNING_OPTS='" << warning_opts << "'";
    string opts = tools.cpp_opts.value_or("-DEVAL " + std_opt + " " + warning_opts + " -O2");
    LOG(INFO) << "CPP_OPTS='" << opts << "'";
    return split_arguments(opts);
}

artifact native_cpp_strategy::build(const build_context &ctx) {
    const string &problem = ctx.config.task.problem_name;
    vector<string> opts = compile_options(ctx.config.tools);
    string coloring_flag = ctx.config.color_diagnostics ? "-fdiagnostics-color=always" : "-fdiagnostics-color=never";

    vector<string> files_to_compile = {ctx.solution_file};
    if (ctx.config.on_windows) {
        LOG(INFO) << "It is Windows. Needed disabling runtime error dialog.";
        ctx.box.copy_in(ctx.config.dirs.internals / "win_rte_dialog_disabler.cpp");
        files_to_compile.push_back("win_rte_dialog_disabler.cpp");
    }

    if (ctx.grader.required) {
        string grader_header = problem + ".h";
        string grader_cpp = "grader.cpp";
        ctx.box.copy_in(ctx.grader.language_dir / grader_header);
        ctx.box.copy_in(ctx.grader.language_dir / grader_cpp);
        LOG(INFO) << "Compiling grader...";
        compile(ctx, command_line("g++", opts, "-c", grader_cpp, "-o", "grader.o", coloring_flag));
        LOG(INFO) << "Removing grader source...";
        ctx.box.remove(grader_cpp);
        files_to_compile.push_back("grader.o");
        LOG(INFO) << "Added grader object file to the list of files to compile.";
    }

    LOG(INFO) << "files_to_compile: " << boost::algorithm::join(files_to_compile, " ");
    string exe_file = problem + ".exe";
    LOG(INFO) << "Compiling and linking...";
    compile(ctx, command_line("g++", opts, files_to_compile, "-o", exe_file, coloring_flag));

    artifact result;
    result.file = exe_file;
    result.entry_point = ctx.grader.required ? "grader" : problem;
    return result;
}

}  // namespace solbuild
