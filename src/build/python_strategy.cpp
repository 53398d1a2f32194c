#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include "build/strategy.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace solbuild {
using namespace std;

python_strategy::python_strategy(language version) : version(version) {
    if (version != language::PY && version != language::PY2)
        throw illegal_state_error("unhandled python language: " + language_tag(version));
}

language python_strategy::lang() const {
    return version;
}

string python_strategy::warning_pattern(const warning_config &warnings) const {
    return warnings.py_pattern;
}

string python_strategy::resolve_interpreter(const tool_options &tools, process_runner &runner) const {
    if (tools.python) {
        LOG(INFO) << "Environment variable PYTHON is set to '" << *tools.python << "'.";
        if (!runner.command_exists(*tools.python))
            throw interpreter_not_found("Python command '" + *tools.python + "' does not exist.");
        LOG(INFO) << "Python command '" << *tools.python << "' exists and is being used.";
        return *tools.python;
    }

    string versioned = version == language::PY ? "python3" : "python2";
    for (const string &command : {versioned, string("python")}) {
        if (runner.command_exists(command)) {
            LOG(INFO) << "Python command '" << command << "' exists and is being used.";
            return command;
        }
        LOG(INFO) << "Python command '" << command << "' does not exist.";
    }
    throw interpreter_not_found("Neither of python commands '" + versioned + "' nor 'python' exists.");
}

artifact python_strategy::build(const build_context &ctx) {
    const string &problem = ctx.config.task.problem_name;
    string python_cmd = resolve_interpreter(ctx.config.tools, ctx.runner);

    vector<string> files = {ctx.solution_file};
    string main_file_name;
    if (ctx.grader.required) {
        // grader.py 以 import <problem> 的方式引用选手程序
        ctx.box.copy_in(ctx.grader.language_dir / "grader.py");
        files.push_back("grader.py");
        main_file_name = "grader";
    } else {
        main_file_name = problem;
    }
    LOG(INFO) << "files_to_compile: " << boost::algorithm::join(files, " ");

    LOG(INFO) << "Compiling python sources...";
    compile(ctx, command_line(python_cmd, "-m", "py_compile", main_file_name + ".py"));

    artifact result;
    result.file = main_file_name + ".py";
    result.entry_point = main_file_name;
    result.tokens["MAIN_FILE_NAME"] = main_file_name;
    result.tokens["PYTHON_CMD"] = python_cmd;
    return result;
}

}  // namespace solbuild
