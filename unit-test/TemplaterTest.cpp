#include <sys/stat.h>
#include "build/templater.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/mock_process_runner.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace solbuild;
using namespace solbuild::mock;
namespace fs = std::filesystem;

TEST(TemplaterTest, ReplaceAllOccurrences) {
    token_map tokens = {{"PROBLEM_NAME", "aplusb"}, {"PYTHON_CMD", "python3"}};
    EXPECT_EQ(replace_tokens("PYTHON_CMD_PLACE_HOLDER PROBLEM_NAME_PLACE_HOLDER.py < PROBLEM_NAME_PLACE_HOLDER.in", tokens),
              "python3 aplusb.py < aplusb.in");
    // 没有对应值的占位符保持原样
    EXPECT_EQ(replace_tokens("MAIN_FILE_NAME_PLACE_HOLDER", tokens), "MAIN_FILE_NAME_PLACE_HOLDER");
}

TEST(TemplaterTest, InstantiateIsIdempotent) {
    temp_directory tmp;
    touch(tmp / "exec.cpp.sh", "#!/bin/bash\n./PROBLEM_NAME_PLACE_HOLDER.exe\n");
    token_map tokens = {{"PROBLEM_NAME", "aplusb"}};

    instantiate_template(tmp / "exec.cpp.sh", tmp / "exec.sh", tokens);
    string first = read_file_content(tmp / "exec.sh");
    instantiate_template(tmp / "exec.cpp.sh", tmp / "exec.sh", tokens);
    string second = read_file_content(tmp / "exec.sh");

    EXPECT_EQ(first, "#!/bin/bash\n./aplusb.exe\n");
    EXPECT_EQ(first, second);
    EXPECT_TRUE(is_executable_file(tmp / "exec.sh"));
}

TEST(TemplaterTest, MissingTemplate) {
    temp_directory tmp;
    EXPECT_THROW(instantiate_template(tmp / "exec.cpp.sh", tmp / "exec.sh", {}), template_not_found);
    EXPECT_FALSE(fs::exists(tmp / "exec.sh"));
}

TEST(TemplaterTest, RunnerKinds) {
    EXPECT_EQ(runner_kind("Batch"), "batch");
    EXPECT_EQ(runner_kind("OutputOnly"), "batch");
    EXPECT_EQ(runner_kind("Communication"), "communication");
    EXPECT_EQ(runner_kind("TwoSteps"), "two-steps");
    EXPECT_EQ(runner_kind("Interactive"), "other");
    EXPECT_EQ(runner_kind(""), "other");
}

TEST(TemplaterTest, TemplateSelection) {
    fs::path templates = "/scripts/templates";
    EXPECT_EQ(exec_template(templates, language::PY2).string(), "/scripts/templates/exec.py2.sh");
    EXPECT_EQ(run_template(templates, grader_variant::JUDGE, "Communication").string(),
              "/scripts/templates/run.judge.communication.sh");
    EXPECT_EQ(run_template(templates, grader_variant::PUBLIC, "Communication").string(),
              "/scripts/templates/run.public.sh");
}
