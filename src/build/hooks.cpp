#include "build/hooks.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace solbuild {
using namespace std;

hook::hook(const string &name, const filesystem::path &script)
    : name(name), script(script) {}

bool hook::present() const {
    return !script.empty() && filesystem::is_regular_file(script);
}

bool hook::run(process_runner &runner, const map<string, string> &exports) const {
    if (!present()) {
        LOG(INFO) << "The " << name << " hook file '" << script.string() << "' is not present. Nothing to do.";
        return false;
    }
    LOG(INFO) << "Running " << name << " hook file " << script.string() << "...";
    if (auto ret = call_process_env(runner, exports, {}, "bash", script); ret != 0)
        throw hook_error(fmt::format("The {} hook {} failed with exit code {}", name, script.string(), ret), tool_exit_code(ret));
    return true;
}

}  // namespace solbuild
