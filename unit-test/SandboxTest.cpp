#include "build/sandbox.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/mock_process_runner.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace solbuild;
using namespace solbuild::mock;
namespace fs = std::filesystem;

TEST(SandboxTest, RecreateClearsPreviousBuild) {
    temp_directory tmp;
    sandbox box(tmp / "sandbox");
    touch(tmp / "sandbox" / "stale.exe", "old");

    box.recreate();
    EXPECT_FALSE(fs::exists(tmp / "sandbox" / "stale.exe"));
    ASSERT_TRUE(fs::is_regular_file(box.compile_outputs()));
    EXPECT_EQ(read_file_content(box.compile_outputs()), "");
}

TEST(SandboxTest, PlaceSolutionUsesCanonicalName) {
    temp_directory tmp;
    touch(tmp / "my_solution.cpp", "int main() {}\n");
    sandbox box(tmp / "sandbox");
    box.recreate();

    auto placed = box.place_solution(tmp / "my_solution.cpp", "aplusb.cpp");
    EXPECT_EQ(placed.string(), (box.path() / "aplusb.cpp").string());
    EXPECT_EQ(read_file_content(placed), "int main() {}\n");
}

TEST(SandboxTest, CopyMissingFileFails) {
    temp_directory tmp;
    sandbox box(tmp / "sandbox");
    box.recreate();
    EXPECT_THROW(box.copy_in(tmp / "grader.cpp"), io_error);
}

TEST(SandboxTest, ScopedRestoresWorkingDirectory) {
    temp_directory tmp;
    sandbox box(tmp / "sandbox");
    box.recreate();
    fs::path before = fs::current_path();

    fs::path inside = box.scoped([] { return fs::current_path(); });
    EXPECT_EQ(fs::canonical(inside).string(), fs::canonical(box.path()).string());
    EXPECT_EQ(fs::current_path().string(), before.string());

    EXPECT_THROW(box.scoped([]() -> int { throw io_error("failure inside sandbox"); }), io_error);
    EXPECT_EQ(fs::current_path().string(), before.string());
}
