#include "build/orchestrator.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include "build/hooks.hpp"
#include "build/manager.hpp"
#include "build/sandbox.hpp"
#include "build/templater.hpp"
#include "build/warning.hpp"
#include "common/exceptions.hpp"

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

orchestrator::orchestrator(const build_config &config, process_runner &runner)
    : config(config), runner(runner) {}

map<string, string> orchestrator::hook_exports(const build_request &request, const grader_spec &grader) const {
    map<string, string> exports;
    exports["SOLUTION"] = request.solution.string();
    exports["PROBLEM_NAME"] = config.task.problem_name;
    exports["SANDBOX"] = config.dirs.sandbox.string();
    exports["GRADER_TYPE"] = to_string(grader.variant);
    if (grader.required) {
        exports["USED_GRADER_DIR"] = grader.base_dir.string();
        exports["GRADER_LANG_DIR"] = grader.language_dir.string();
    }
    return exports;
}

build_result orchestrator::build(const build_request &request) {
    if (!fs::is_regular_file(request.solution))
        throw argument_error(fmt::format("Solution file '{}' not found.", request.solution.string()));
    fs::path solution = fs::absolute(request.solution);
    LOG(INFO) << "Compiling solution '" << request.solution.string() << "'.";

    build_result result;
    result.lang = resolve_language(solution);
    LOG(INFO) << "Detected language: " << language_name(result.lang);

    result.grader = resolve_grader(config.task.has_grader, request.use_public_grader, result.lang, config.dirs);
    auto strategy = make_build_strategy(result.lang);

    sandbox box(config.dirs.sandbox);
    box.recreate();
    string solution_file = config.task.problem_name + "." + source_extension(result.lang);
    box.place_solution(solution, solution_file);

    auto exports = hook_exports(request, result.grader);
    exports["SOLUTION"] = solution.string();

    build_context ctx{config, result.grader, box, runner, solution_file};
    box.scoped([&] {
        hook("pre-compilation", config.dirs.pre_compile).run(runner, exports);
        result.output = strategy->build(ctx);
        result.warning_reported = scan_warnings(strategy->warning_pattern(config.warnings),
                                                box.compile_outputs(),
                                                config.warnings.warn_file);
    });

    token_map tokens = result.output.tokens;
    tokens["PROBLEM_NAME"] = config.task.problem_name;
    instantiate_template(exec_template(config.dirs.templates, result.lang), box.path() / "exec.sh", tokens);
    instantiate_template(run_template(config.dirs.templates, result.grader.variant, config.task.problem_type),
                         box.path() / "run.sh", tokens);

    if (manager_builder::required(config.task, result.grader)) {
        manager_builder(config.dirs.manager_dir, runner).build(box);
        result.manager_built = true;
    }

    hook("post-compilation", config.dirs.post_compile).run(runner, exports);
    return result;
}

}  // namespace solbuild
