#include <filesystem>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace codejudge;
namespace fs = std::filesystem;

class IoUtilsTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = RUN_DIR / "io-utils-test";
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

TEST_F(IoUtilsTest, ReadWriteFile) {
    fs::path file = dir / "testdata.in";
    write_file_content(file, string("1 2\n\0binary", 12));
    EXPECT_EQ(read_file_content(file), string("1 2\n\0binary", 12));
    EXPECT_EQ(read_file_prefix(file, 3), "1 2");
    EXPECT_EQ(read_file_prefix(file, 100).length(), 12u);

    write_file_content(file, "short");
    EXPECT_EQ(read_file_content(file), "short");

    EXPECT_EQ(read_file_content(dir / "missing", "default"), "default");
    EXPECT_EQ(read_file_prefix(dir / "missing", 10), "");
    EXPECT_THROW(write_file_content(dir / "no" / "such" / "dir", "x"), system_error);
}

TEST_F(IoUtilsTest, Utf8Validation) {
    EXPECT_TRUE(utf8_check_is_valid("Hello, world"));
    EXPECT_TRUE(utf8_check_is_valid("你好，世界"));
    EXPECT_FALSE(utf8_check_is_valid("\xff\xfe"));
    EXPECT_FALSE(utf8_check_is_valid("\xe4\xbd"));

    EXPECT_EQ(utf8_sanitize("ok\xff"), "ok?");
    EXPECT_EQ(utf8_sanitize("你好"), "你好");
}

TEST_F(IoUtilsTest, TruncateUtf8) {
    EXPECT_EQ(truncate_utf8("Hello, world", 5), "Hello");
    EXPECT_EQ(truncate_utf8("Hello", 100), "Hello");
    // "你" 占 3 个字节，截断在字符中间时丢弃整个字符
    EXPECT_EQ(truncate_utf8("a你好", 3), "a");
    EXPECT_EQ(truncate_utf8("a你好", 4), "a你");
    EXPECT_EQ(truncate_utf8("a你好", 5), "a你");
    EXPECT_TRUE(utf8_check_is_valid(truncate_utf8(string(10, '\xe4'), 5)));
}
