#include "build/strategy.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace solbuild {
using namespace std;

void build_strategy::compile(const build_context &ctx, const vector<string> &argv) const {
    if (auto ret = call_process(ctx.runner, ctx.box.compile_outputs(), argv); ret != 0) {
        throw compilation_error(fmt::format("{} exited with code {}", argv.front(), ret),
                                tool_exit_code(ret),
                                read_file_content(ctx.box.compile_outputs(), "No compilation information"));
    }
}

unique_ptr<build_strategy> make_build_strategy(language lang) {
    switch (lang) {
        case language::CPP:
            return make_unique<native_cpp_strategy>();
        case language::PAS:
            return make_unique<native_pascal_strategy>();
        case language::JAVA:
            return make_unique<java_strategy>();
        case language::PY:
        case language::PY2:
            return make_unique<python_strategy>(lang);
    }
    throw illegal_state_error("unknown language");
}

}  // namespace solbuild
