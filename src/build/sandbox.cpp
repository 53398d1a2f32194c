#include "build/sandbox.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

sandbox::sandbox(const fs::path &dir) : dir(fs::absolute(dir)) {}

const fs::path &sandbox::path() const {
    return dir;
}

void sandbox::recreate() const {
    LOG(INFO) << "Cleaning the sandbox...";
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        throw io_error(fmt::format("Unable to remove sandbox {}: {}", dir.string(), ec.message()));
    fs::create_directories(dir, ec);
    if (ec)
        throw io_error(fmt::format("Unable to create sandbox {}: {}", dir.string(), ec.message()));
    // 编译输出记录从空文件开始
    try {
        write_file_content(compile_outputs(), "");
    } catch (system_error &e) {
        throw io_error(e.what());
    }
}

fs::path sandbox::place_solution(const fs::path &solution, const string &canonical_name) const {
    fs::path target = dir / canonical_name;
    LOG(INFO) << "Copying solution '" << solution.string() << "' to sandbox as '" << canonical_name << "'...";
    error_code ec;
    fs::copy_file(solution, target, fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw io_error(fmt::format("Unable to copy {} to {}: {}", solution.string(), target.string(), ec.message()));
    return target;
}

void sandbox::copy_in(const fs::path &file) const {
    LOG(INFO) << "Copying '" << file.filename().string() << "' to sandbox...";
    error_code ec;
    fs::copy_file(file, dir / file.filename(), fs::copy_options::overwrite_existing, ec);
    if (ec)
        throw io_error(fmt::format("Unable to copy {} to sandbox: {}", file.string(), ec.message()));
}

void sandbox::remove(const string &name) const {
    error_code ec;
    fs::remove(dir / name, ec);
    if (ec)
        throw io_error(fmt::format("Unable to remove {}: {}", (dir / name).string(), ec.message()));
}

fs::path sandbox::compile_outputs() const {
    return dir / "compile.outputs";
}

sandbox::working_directory_guard::working_directory_guard(const fs::path &dir)
    : previous(fs::current_path()) {
    LOG(INFO) << "Entering the sandbox.";
    error_code ec;
    fs::current_path(dir, ec);
    if (ec)
        throw io_error(fmt::format("Unable to enter sandbox {}: {}", dir.string(), ec.message()));
}

sandbox::working_directory_guard::~working_directory_guard() {
    LOG(INFO) << "Exiting the sandbox.";
    error_code ec;
    fs::current_path(previous, ec);
    if (ec)
        LOG(ERROR) << "Unable to restore working directory " << previous << ": " << ec.message();
}

}  // namespace solbuild
