#include <filesystem>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "config.hpp"
#include "gtest/gtest.h"
#include "judge/sandbox.hpp"
#include "runguard.hpp"
#include "test/mocks.hpp"

using namespace std;
using namespace codejudge;
namespace fs = std::filesystem;

class RunguardMetaTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = RUN_DIR / "meta-test";
        fs::create_directories(dir);
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    runguard_result parse(const string &content) {
        fs::path metafile = dir / "program.meta";
        write_file_content(metafile, content);
        return read_runguard_result(metafile);
    }
};

TEST_F(RunguardMetaTest, ParseNormalExit) {
    auto result = parse(
        "memory-bytes: 1536000\n"
        "memory-result:\n"
        "exitcode: 0\n"
        "wall-time: 0.012\n"
        "cpu-time: 0.004\n");
    EXPECT_EQ(result.exitcode, 0);
    EXPECT_EQ(result.signal, -1);
    EXPECT_EQ(result.memory, 1536000);
    EXPECT_DOUBLE_EQ(result.wall_time, 0.012);
    EXPECT_DOUBLE_EQ(result.cpu_time, 0.004);
    EXPECT_TRUE(result.memory_result.empty());
    EXPECT_TRUE(result.time_result.empty());
    EXPECT_TRUE(result.internal_error.empty());
}

TEST_F(RunguardMetaTest, ParseTimeoutAndSignal) {
    auto result = parse(
        "exitcode: 137\n"
        "signal: 9\n"
        "wall-time: 1.503\n"
        "time-result: hard-timelimit\n"
        "output-truncated: stdout\n");
    EXPECT_EQ(result.signal, 9);
    EXPECT_EQ(result.time_result, "hard-timelimit");
    EXPECT_EQ(result.output_truncated, "stdout");
}

TEST_F(RunguardMetaTest, LastInternalErrorWins) {
    auto result = parse(
        "internal-error: first\n"
        "exitcode: x\n"
        "internal-error: unable to exec program\n");
    EXPECT_EQ(result.internal_error, "unable to exec program");
    EXPECT_EQ(result.exitcode, -1);
}

TEST_F(RunguardMetaTest, MissingMetaFile) {
    EXPECT_THROW(read_runguard_result(dir / "missing.meta"), internal_error);
}

TEST_F(RunguardMetaTest, ClassifyRun) {
    submission submit = test::make_submission("classify", language::CPP, "int main() {}", "", "");
    submit.limits.memory_limit = 65536;  // 64MB

    runguard_result ok;
    ok.exitcode = 0;
    ok.memory = 1 << 20;
    EXPECT_EQ(classify_run(ok, submit, ""), run_outcome::COMPLETED);

    runguard_result timeout = ok;
    timeout.time_result = "soft-timelimit";
    EXPECT_EQ(classify_run(timeout, submit, ""), run_outcome::TIMED_OUT);

    runguard_result oom = timeout;
    oom.memory_result = "oom";
    EXPECT_EQ(classify_run(oom, submit, ""), run_outcome::MEMORY_EXCEEDED);

    runguard_result crash = ok;
    crash.exitcode = 139;
    crash.signal = 11;
    EXPECT_EQ(classify_run(crash, submit, ""), run_outcome::CRASHED);

    runguard_result crash_at_ceiling = crash;
    crash_at_ceiling.memory = 65536LL * 1024;
    EXPECT_EQ(classify_run(crash_at_ceiling, submit, ""), run_outcome::MEMORY_EXCEEDED);

    runguard_result exit_code = ok;
    exit_code.exitcode = 1;
    EXPECT_EQ(classify_run(exit_code, submit, ""), run_outcome::CRASHED);
}

TEST_F(RunguardMetaTest, ClassifyRuntimeOutOfMemory) {
    submission submit = test::make_submission("classify", language::PYTHON, "x = [0] * 10**10", "", "");
    runguard_result run;
    run.exitcode = 1;
    run.memory = 1 << 20;
    EXPECT_EQ(classify_run(run, submit, "Traceback (most recent call last):\nMemoryError\n"), run_outcome::MEMORY_EXCEEDED);
    EXPECT_EQ(classify_run(run, submit, "Traceback (most recent call last):\nZeroDivisionError\n"), run_outcome::CRASHED);
}
