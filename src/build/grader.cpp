#include "build/grader.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace solbuild {
using namespace std;

grader_spec resolve_grader(bool has_grader, bool use_public, language lang, const locations &dirs) {
    grader_spec spec;
    if (!has_grader) {
        if (use_public)
            throw unsupported_grader_error("Grader is not supported.");
        LOG(INFO) << "The task does not have grader.";
        return spec;
    }

    spec.required = true;
    if (use_public) {
        spec.variant = grader_variant::PUBLIC;
        spec.base_dir = dirs.public_dir;
    } else {
        spec.variant = grader_variant::JUDGE;
        spec.base_dir = dirs.grader_dir;
    }
    spec.language_dir = spec.base_dir / language_tag(lang);

    LOG(INFO) << "The task has grader.";
    LOG(INFO) << "GRADER_TYPE='" << to_string(spec.variant) << "'";
    LOG(INFO) << "USED_GRADER_DIR='" << spec.base_dir.string() << "'";
    LOG(INFO) << "GRADER_LANG_DIR='" << spec.language_dir.string() << "'";
    return spec;
}

string to_string(grader_variant variant) {
    switch (variant) {
        case grader_variant::JUDGE: return "judge";
        case grader_variant::PUBLIC: return "public";
    }
    throw illegal_state_error("unknown grader type");
}

}  // namespace solbuild
