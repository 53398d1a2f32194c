#include "build/templater.hpp"
#include <glog/logging.h>
#include <fmt/core.h>
#include <boost/algorithm/string/replace.hpp>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace solbuild {
using namespace std;
namespace fs = std::filesystem;

string replace_tokens(string body, const token_map &tokens) {
    for (auto &[key, value] : tokens)
        boost::algorithm::replace_all(body, key + "_PLACE_HOLDER", value);
    return body;
}

void instantiate_template(const fs::path &source, const fs::path &target, const token_map &tokens) {
    if (!fs::is_regular_file(source))
        throw template_not_found(fmt::format("Template file '{}' does not exist.", source.string()));

    LOG(INFO) << "Creating '" << target.filename().string() << "' in sandbox from '" << source.string() << "'...";
    try {
        write_file_content(target, replace_tokens(read_file_content(source), tokens));
        add_exec_permission(target);
    } catch (system_error &e) {
        throw io_error(fmt::format("Unable to create {}: {}", target.string(), e.what()));
    }
}

string runner_kind(const string &problem_type) {
    if (problem_type == "Batch" || problem_type == "OutputOnly")
        return "batch";
    else if (problem_type == "Communication")
        return "communication";
    else if (problem_type == "TwoSteps")
        return "two-steps";
    else
        return "other";
}

fs::path exec_template(const fs::path &templates, language lang) {
    return templates / fmt::format("exec.{}.sh", language_tag(lang));
}

fs::path run_template(const fs::path &templates, grader_variant variant, const string &problem_type) {
    switch (variant) {
        case grader_variant::JUDGE:
            return templates / fmt::format("run.judge.{}.sh", runner_kind(problem_type));
        case grader_variant::PUBLIC:
            return templates / "run.public.sh";
    }
    throw illegal_state_error("unknown grader type");
}

}  // namespace solbuild
