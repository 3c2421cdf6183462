#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;

class UtilsTest : public ::testing::Test {
protected:
    // 子进程中检查的描述符编号，远离测试进程已经打开的描述符
    static constexpr int INHERITED_FD = 100;
    int sock = -1;

    void SetUp() override {
        // 和 tacopie 一样创建没有 SOCK_CLOEXEC 的 socket
        sock = socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(sock, 0);
        ASSERT_EQ(dup2(sock, INHERITED_FD), INHERITED_FD);
    }

    void TearDown() override {
        close(INHERITED_FD);
        if (sock >= 0) close(sock);
    }
};

TEST_F(UtilsTest, ChildDoesNotInheritDescriptors) {
    EXPECT_EQ(call_process("sh", "-c", "test -e /proc/self/fd/1"), 0);
    EXPECT_EQ(call_process("sh", "-c", "test -e /proc/self/fd/" + to_string(INHERITED_FD)), 1);
    // 父进程的描述符不受影响
    EXPECT_NE(fcntl(INHERITED_FD, F_GETFD), -1);
}

TEST_F(UtilsTest, CallProcessEnvironment) {
    EXPECT_EQ(call_process_env({{"CODEJUDGE_FLAG", "on"}}, "sh", "-c", "test \"$CODEJUDGE_FLAG\" = on"), 0);
    EXPECT_EQ(get_env("CODEJUDGE_FLAG", "off"), "off");
}

TEST_F(UtilsTest, GenerateUuid) {
    string first = generate_uuid(), second = generate_uuid();
    EXPECT_EQ(first.length(), 36u);
    EXPECT_NE(first, second);
}
