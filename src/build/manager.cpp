#include "build/manager.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

const string manager_builder::COMPILE_OUTPUTS_LIST_TARGET = "compile_outputs_list";

manager_builder::manager_builder(const fs::path &manager_dir, process_runner &runner)
    : manager_dir(manager_dir), runner(runner) {}

bool manager_builder::required(const task_config &task, const grader_spec &grader) {
    LOG(INFO) << "HAS_MANAGER=" << (task.has_manager ? "true" : "false");
    if (!task.has_manager) return false;
    if (grader.variant != grader_variant::JUDGE) {
        LOG(INFO) << "Manager is not needed when grader type is " << to_string(grader.variant) << ".";
        return false;
    }
    return true;
}

bool manager_builder::compile_outputs_list(vector<string> &outputs) {
    string stdout_text;
    auto argv = command_line("make", "-s", "-C", manager_dir, COMPILE_OUTPUTS_LIST_TARGET);
    LOG(INFO) << "RUN: " << boost::algorithm::join(argv, " ");
    if (runner.capture(argv, stdout_text) != 0)
        return false;
    outputs.clear();
    boost::split(outputs, stdout_text, boost::is_any_of(" \t\n"), boost::token_compress_on);
    outputs.erase(remove(outputs.begin(), outputs.end(), ""), outputs.end());
    return true;
}

void manager_builder::build(const sandbox &box) {
    LOG(INFO) << "Compiling manager as needed when grader type is judge...";
    if (auto ret = call_process(runner, {}, "make", "-C", manager_dir); ret != 0)
        throw manager_build_error(fmt::format("Unable to build manager in {}", manager_dir.string()), tool_exit_code(ret));

    vector<string> outputs;
    if (compile_outputs_list(outputs)) {
        for (auto &compile_output : outputs) {
            LOG(INFO) << "Content of '" << (manager_dir / compile_output).string() << "':";
            cerr << read_file_content(manager_dir / compile_output, "");
        }
    } else {
        LOG(INFO) << "Makefile in '" << manager_dir.string() << "' does not have target '" << COMPILE_OUTPUTS_LIST_TARGET << "'.";
    }

    fs::path manager_exe = manager_dir / "manager.exe";
    if (!fs::is_regular_file(manager_exe))
        throw manager_build_error(fmt::format("Manager executable {} is not created", manager_exe.string()), E_CONFIGURATION_ERROR);
    LOG(INFO) << "Copying manager executable binary to sandbox...";
    try {
        box.copy_in(manager_exe);
    } catch (io_error &e) {
        throw manager_build_error(e.what(), E_CONFIGURATION_ERROR);
    }
}

}  // namespace solbuild
