#include "build/warning.hpp"
#include "common/io_utils.hpp"
#include "gtest/gtest.h"
#include "test/mock_process_runner.hpp"
#include "test/temp_directory.hpp"

using namespace std;
using namespace solbuild;
using namespace solbuild::mock;
namespace fs = std::filesystem;

class WarningScannerTest : public ::testing::Test {
protected:
    temp_directory tmp;
    fs::path outputs;
    fs::path warn_file;

    void SetUp() override {
        outputs = tmp / "compile.outputs";
        warn_file = tmp / "warnings.txt";
        touch(outputs, "aplusb.cpp:3:5: warning: unused variable 'x' [-Wunused-variable]\n");
    }
};

TEST_F(WarningScannerTest, PatternFoundAppendsOneLine) {
    EXPECT_TRUE(scan_warnings("warning:", outputs, warn_file));
    EXPECT_EQ(read_file_content(warn_file), "Text pattern 'warning:' found in compiler outputs.\n");

    // 每次构建追加一行
    EXPECT_TRUE(scan_warnings("warning:", outputs, warn_file));
    EXPECT_EQ(read_file_content(warn_file),
              "Text pattern 'warning:' found in compiler outputs.\n"
              "Text pattern 'warning:' found in compiler outputs.\n");
}

TEST_F(WarningScannerTest, PatternNotFound) {
    EXPECT_FALSE(scan_warnings("error:", outputs, warn_file));
    EXPECT_FALSE(fs::exists(warn_file));
}

TEST_F(WarningScannerTest, NoPatternOrNoWarnFile) {
    EXPECT_FALSE(scan_warnings("", outputs, warn_file));
    EXPECT_FALSE(scan_warnings("warning:", outputs, nullopt));
    EXPECT_FALSE(fs::exists(warn_file));
}

TEST_F(WarningScannerTest, UnwritableWarnFileDoesNotFail) {
    EXPECT_FALSE(scan_warnings("warning:", outputs, tmp / "missing" / "dir" / "warnings.txt"));
}

TEST_F(WarningScannerTest, PatternIsBasicRegularExpression) {
    EXPECT_TRUE(scan_warnings("warning:.*unused", outputs, warn_file));
    EXPECT_EQ(read_file_content(warn_file), "Text pattern 'warning:.*unused' found in compiler outputs.\n");
    EXPECT_TRUE(scan_warnings("[Ww]arning", outputs, warn_file));
    EXPECT_TRUE(scan_warnings("^aplusb\\.cpp:[0-9]*:", outputs, warn_file));

    EXPECT_FALSE(scan_warnings("^warning", outputs, warn_file));
    EXPECT_FALSE(scan_warnings("unused.*warning:", outputs, warn_file));
}

TEST_F(WarningScannerTest, PatternMatchesLineByLine) {
    touch(outputs, "aplusb.cpp: In function 'int main()':\nNote: some input files use unchecked operations\n");
    EXPECT_TRUE(scan_warnings("^Note", outputs, warn_file));
    // '.' 不跨行匹配
    EXPECT_FALSE(scan_warnings("main.*unchecked", outputs, warn_file));
}

TEST_F(WarningScannerTest, InvalidPatternDoesNotFail) {
    EXPECT_FALSE(scan_warnings("warning[", outputs, warn_file));
    EXPECT_FALSE(fs::exists(warn_file));
}
