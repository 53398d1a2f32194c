#include <glog/logging.h>
#include <fmt/core.h>
#include <filesystem>
#include "build/strategy.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

language native_pascal_strategy::lang() const {
    return language::PAS;
}

string native_pascal_strategy::warning_pattern(const warning_config &warnings) const {
    return warnings.pas_pattern;
}

vector<string> native_pascal_strategy::compile_options(const tool_options &tools) {
    string opts = tools.pas_opts.value_or("-dEVAL -XS -O2");
    LOG(INFO) << "PAS_OPTS='" << opts << "'";
    return split_arguments(opts);
}

artifact native_pascal_strategy::build(const build_context &ctx) {
    const string &problem = ctx.config.task.problem_name;
    vector<string> opts = compile_options(ctx.config.tools);

    string main_source;
    if (ctx.grader.required) {
        // grader.pas 通过 uses <problem> 引用选手程序
        main_source = "grader.pas";
        ctx.box.copy_in(ctx.grader.language_dir / main_source);
        fs::path graderlib = ctx.grader.language_dir / "graderlib.pas";
        if (fs::is_regular_file(graderlib))
            ctx.box.copy_in(graderlib);
    } else {
        main_source = ctx.solution_file;
    }
    LOG(INFO) << "files_to_compile: " << main_source;

    string exe_file = problem + ".exe";
    LOG(INFO) << "Compiling and linking...";
    compile(ctx, command_line("fpc", opts, main_source, "-o" + exe_file));

    if (!is_executable_file(ctx.box.path() / exe_file)) {
        throw artifact_not_produced(fmt::format(
            "Executable {} is not created by the compiler.\n"
            "The source file was probably a UNIT instead of a PROGRAM.",
            exe_file));
    }

    artifact result;
    result.file = exe_file;
    result.entry_point = ctx.grader.required ? "grader" : problem;
    return result;
}

}  // namespace solbuild
