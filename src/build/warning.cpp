#include "build/warning.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <regex>
#include <sstream>
#include <system_error>
#include "common/io_utils.hpp"

namespace solbuild {
using namespace std;

/**
 * @brief 逐行匹配编译输出，与 grep 一样使用基本正则表达式
 * @throw std::regex_error 若 pattern 不是合法的正则表达式
 */
static bool pattern_found(const string &pattern, const filesystem::path &compile_outputs) {
    regex matcher(pattern, regex::grep);
    istringstream outputs(read_file_content(compile_outputs, ""));
    string line;
    while (getline(outputs, line))
        if (regex_search(line, matcher))
            return true;
    return false;
}

bool scan_warnings(const string &pattern, const filesystem::path &compile_outputs, const optional<filesystem::path> &warn_file) {
    if (!warn_file) {
        LOG(INFO) << "variable WARN_FILE is not defined.";
        return false;
    }
    LOG(INFO) << "WARN_FILE='" << warn_file->string() << "'";
    if (pattern.empty()) {
        LOG(INFO) << "No warning text pattern is defined for this language.";
        return false;
    }

    bool found;
    try {
        found = pattern_found(pattern, compile_outputs);
    } catch (regex_error &e) {
        LOG(WARNING) << "Invalid warning text pattern '" << pattern << "': " << e.what();
        return false;
    }
    if (!found) {
        LOG(INFO) << "Text pattern '" << pattern << "' not found in compiler outputs.";
        return false;
    }

    string message = fmt::format("Text pattern '{}' found in compiler outputs.", pattern);
    LOG(INFO) << message;
    try {
        append_line(*warn_file, message);
    } catch (system_error &e) {
        LOG(WARNING) << "Unable to record compile warning: " << e.what();
        return false;
    }
    return true;
}

}  // namespace solbuild
