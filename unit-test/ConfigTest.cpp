#include <stdlib.h>
#include "common/exceptions.hpp"
#include "config.hpp"
#include "env.hpp"
#include "gtest/gtest.h"
#include "test/mock_process_runner.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace solbuild;
using namespace solbuild::mock;
namespace fs = std::filesystem;

TEST(ConfigTest, DerivedFromBaseDir) {
    temp_directory tmp;
    fs::path base = tmp.path();
    auto config = load_config({{"BASE_DIR", base.string()}, {"PROBLEM_NAME", "aplusb"}});

    EXPECT_EQ(config.dirs.sandbox.string(), (base / "sandbox").string());
    EXPECT_EQ(config.dirs.templates.string(), (base / "scripts" / "templates").string());
    EXPECT_EQ(config.dirs.internals.string(), (base / "scripts" / "internal").string());
    EXPECT_EQ(config.dirs.grader_dir.string(), (base / "grader").string());
    EXPECT_EQ(config.dirs.public_dir.string(), (base / "public").string());
    EXPECT_EQ(config.dirs.manager_dir.string(), (base / "grader").string());
    EXPECT_EQ(config.dirs.pre_compile.string(), (base / "scripts" / "templates" / "pre_compile.sh").string());
    EXPECT_EQ(config.dirs.post_compile.string(), (base / "scripts" / "templates" / "post_compile.sh").string());

    EXPECT_EQ(config.task.problem_name, "aplusb");
    EXPECT_FALSE(config.task.has_grader);
    EXPECT_FALSE(config.task.has_manager);
    EXPECT_FALSE(config.tools.cpp_opts);
    EXPECT_FALSE(config.warnings.warn_file);
}

TEST(ConfigTest, ExplicitLocationsOverrideDefaults) {
    temp_directory tmp;
    auto config = load_config({{"BASE_DIR", tmp.path().string()},
                               {"SANDBOX", (tmp / "box").string()},
                               {"SCRIPTS", (tmp / "tools").string()},
                               {"MANAGER_DIR", (tmp / "manager").string()},
                               {"PROBLEM_NAME", "aplusb"}});
    EXPECT_EQ(config.dirs.sandbox.string(), (tmp / "box").string());
    EXPECT_EQ(config.dirs.templates.string(), (tmp / "tools" / "templates").string());
    EXPECT_EQ(config.dirs.manager_dir.string(), (tmp / "manager").string());
}

TEST(ConfigTest, RelativePathsBecomeAbsolute) {
    auto config = load_config({{"SANDBOX", "sandbox"}, {"TEMPLATES", "templates"}, {"PROBLEM_NAME", "aplusb"}});
    EXPECT_TRUE(config.dirs.sandbox.is_absolute());
    EXPECT_TRUE(config.dirs.templates.is_absolute());
}

TEST(ConfigTest, ProblemJson) {
    temp_directory tmp;
    touch(tmp / "problem.json", R"({"name": "aplusb", "type": "Communication", "has_grader": true, "has_manager": true, "title": "A+B"})");

    auto config = load_config({{"BASE_DIR", tmp.path().string()}});
    EXPECT_EQ(config.task.problem_name, "aplusb");
    EXPECT_EQ(config.task.problem_type, "Communication");
    EXPECT_TRUE(config.task.has_grader);
    EXPECT_TRUE(config.task.has_manager);

    // 环境变量优先
    config = load_config({{"BASE_DIR", tmp.path().string()}, {"PROBLEM_NAME", "other"}, {"HAS_MANAGER", "false"}});
    EXPECT_EQ(config.task.problem_name, "other");
    EXPECT_TRUE(config.task.has_grader);
    EXPECT_FALSE(config.task.has_manager);
}

TEST(ConfigTest, MalformedProblemJson) {
    temp_directory tmp;
    touch(tmp / "problem.json", R"({"name": "aplusb", "has_grader": "yes"})");
    EXPECT_THROW(load_config({{"BASE_DIR", tmp.path().string()}}), configuration_error);

    touch(tmp / "problem.json", "{ not json");
    EXPECT_THROW(load_config({{"BASE_DIR", tmp.path().string()}}), configuration_error);
}

TEST(ConfigTest, InvalidBoolean) {
    temp_directory tmp;
    EXPECT_THROW(load_config({{"BASE_DIR", tmp.path().string()}, {"PROBLEM_NAME", "aplusb"}, {"HAS_GRADER", "1"}}),
                 configuration_error);
    EXPECT_THROW(load_config({{"BASE_DIR", tmp.path().string()}, {"PROBLEM_NAME", "aplusb"}, {"HAS_MANAGER", "True"}}),
                 configuration_error);
}

TEST(ConfigTest, RequiredSettings) {
    temp_directory tmp;
    EXPECT_THROW(load_config({{"PROBLEM_NAME", "aplusb"}}), configuration_error);
    EXPECT_THROW(load_config({{"SANDBOX", (tmp / "sandbox").string()}, {"PROBLEM_NAME", "aplusb"}}), configuration_error);
    EXPECT_THROW(load_config({{"BASE_DIR", tmp.path().string()}}), configuration_error);
    EXPECT_THROW(load_config({{"BASE_DIR", tmp.path().string()}, {"PROBLEM_NAME", "../aplusb"}}), configuration_error);
}

TEST(ConfigTest, ToolOptionsAndWarnings) {
    temp_directory tmp;
    auto config = load_config({{"BASE_DIR", tmp.path().string()},
                               {"PROBLEM_NAME", "aplusb"},
                               {"CPP_STD_OPT", "--std=gnu++17"},
                               {"CPP_WARNING_OPTS", ""},
                               {"PYTHON", "pypy3"},
                               {"WARN_FILE", (tmp / "warnings.txt").string()},
                               {"WARNING_TEXT_PATTERN_FOR_CPP", "warning:"}});
    ASSERT_TRUE(config.tools.cpp_std_opt);
    EXPECT_EQ(*config.tools.cpp_std_opt, "--std=gnu++17");
    // 设置为空字符串与未设置不同
    ASSERT_TRUE(config.tools.cpp_warning_opts);
    EXPECT_EQ(*config.tools.cpp_warning_opts, "");
    EXPECT_FALSE(config.tools.cpp_opts);
    EXPECT_EQ(config.tools.python.value_or(""), "pypy3");
    ASSERT_TRUE(config.warnings.warn_file);
    EXPECT_EQ(config.warnings.warn_file->string(), (tmp / "warnings.txt").string());
    EXPECT_EQ(config.warnings.cpp_pattern, "warning:");
    EXPECT_EQ(config.warnings.pas_pattern, "");
}

TEST(ConfigTest, CurrentEnvironment) {
    setenv("SOLBUILD_TEST_VARIABLE", "a=b", 1);
    auto env = current_environment();
    EXPECT_EQ(env["SOLBUILD_TEST_VARIABLE"], "a=b");
    unsetenv("SOLBUILD_TEST_VARIABLE");
}
