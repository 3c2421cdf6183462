#include "judge/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <system_error>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codejudge {
using namespace std;
namespace fs = std::filesystem;

// 内存使用达到限制的这个比例且程序崩溃时，认为是内存超限导致的崩溃
const double MEMORY_CEILING_RATIO = 0.98;

// 超过时钟时间限制后多久强制杀死用户程序，单位为秒
const double WALL_TIME_GRACE = 0.5;

// 用户程序创建文件的大小限制，单位为 KB
const int64_t FILE_LIMIT = 1 << 16;

const size_t OUTPUT_SLACK = 4096;

static bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), [](unsigned char c) { return isdigit(c); });
}

size_t stdout_capture_limit() {
    return (OUTPUT_LIMIT + OUTPUT_SLACK + 1023) / 1024 * 1024;
}

fs::path sandbox_workspace::sandbox_path(const fs::path &host_path) {
    if (CHROOT_DIR.empty()) return host_path;
    return fs::path("/") / fs::relative(host_path, CHROOT_DIR);
}

/**
 * @brief 将文件夹交给 RUN_USER，只有 root 运行评测系统时才需要
 */
static void hand_over_to_run_user(const fs::path &dir) {
    if (RUN_USER.empty() || geteuid() != 0) return;

    struct passwd pwd, *pwd_result = nullptr;
    char buf[4096];
    int ret = is_number(RUN_USER) ? getpwuid_r((uid_t)stoul(RUN_USER), &pwd, buf, sizeof(buf), &pwd_result)
                                  : getpwnam_r(RUN_USER.c_str(), &pwd, buf, sizeof(buf), &pwd_result);
    if (ret != 0 || !pwd_result)
        throw internal_error("unknown run user " + RUN_USER);
    uid_t uid = pwd.pw_uid;
    gid_t gid = pwd.pw_gid;

    if (!RUN_GROUP.empty()) {
        struct group grp, *grp_result = nullptr;
        ret = is_number(RUN_GROUP) ? getgrgid_r((gid_t)stoul(RUN_GROUP), &grp, buf, sizeof(buf), &grp_result)
                                   : getgrnam_r(RUN_GROUP.c_str(), &grp, buf, sizeof(buf), &grp_result);
        if (ret != 0 || !grp_result)
            throw internal_error("unknown run group " + RUN_GROUP);
        gid = grp.gr_gid;
    }

    if (chown(dir.c_str(), uid, gid) != 0)
        throw system_error(errno, generic_category(), fmt::format("unable to chown {}", dir));
}

sandbox_workspace::sandbox_workspace(const submission &submit) {
    root_dir = RUN_DIR / generate_uuid();
    compile_path = root_dir / "compile";
    run_path = root_dir / "run";
    fs::create_directory(root_dir);
    try {
        // 用户程序可以进入工作区，但不能列出其中的文件夹
        fs::permissions(root_dir, fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec);
        fs::create_directory(compile_path);
        fs::permissions(compile_path, fs::perms::owner_all);
        hand_over_to_run_user(compile_path);
        fs::create_directory(run_path);
        fs::permissions(run_path, fs::perms::owner_all);

        auto &profile = get_language_profile(submit.lang);
        fs::path workdir = sandbox_path(compile_path);
        variables = {{"source", (workdir / profile.source_file).string()},
                     {"executable", (workdir / "program").string()},
                     {"workdir", workdir.string()},
                     {"memory_mb", to_string(max<int64_t>(submit.limits.memory_limit / 1024, 16))}};

        env = {"PATH=/usr/local/bin:/usr/bin:/bin",
               "LANG=C.UTF-8",
               "HOME=" + workdir.string()};
        for (auto &[key, value] : profile.environment)
            env.push_back(key + "=" + expand_placeholders(value, variables));
    } catch (...) {
        // 构造失败时析构函数不会执行
        error_code ec;
        fs::remove_all(root_dir, ec);
        throw;
    }

    DLOG(INFO) << "Created workspace " << root_dir << " for submission " << submit.sub_id;
}

sandbox_workspace::~sandbox_workspace() {
    if (DEBUG) return;
    error_code ec;
    fs::remove_all(root_dir, ec);
    if (ec)
        LOG(WARNING) << "Unable to remove workspace " << root_dir << ": " << ec.message();
}

executor::~executor() {}

/**
 * @brief runguard 的一次调用参数
 */
struct guarded_command {
    vector<string> command;
    double time_limit;
    int64_t memory_limit;  // KB
    fs::path stdin_file;
    fs::path stdout_file;
    fs::path stderr_file;
    fs::path metafile;
};

static runguard_result run_guarded(const sandbox_workspace &workspace, const string &cpuset, const guarded_command &cmd) {
    vector<string> args;
    if (!CHROOT_DIR.empty()) args.insert(args.end(), {"--root", CHROOT_DIR.string()});
    if (!RUN_USER.empty()) args.insert(args.end(), {"--user", RUN_USER});
    if (!RUN_GROUP.empty()) args.insert(args.end(), {"--group", RUN_GROUP});
    if (!cpuset.empty()) args.insert(args.end(), {"--cpuset", cpuset});
    args.insert(args.end(), {"--work-dir", workspace.sandbox_path(workspace.compile_dir()).string(),
                             "--wall-time", fmt::format("{:.3f}:{:.3f}", cmd.time_limit, cmd.time_limit + WALL_TIME_GRACE),
                             "--cpu-time", fmt::format("{:.3f}", cmd.time_limit),
                             "--memory-limit", to_string(cmd.memory_limit),
                             "--file-limit", to_string(FILE_LIMIT),
                             "--nproc", to_string(PROC_LIMIT),
                             "--no-core-dumps",
                             "--stream-size", to_string(stdout_capture_limit() / 1024),
                             "--standard-output-file", cmd.stdout_file.string(),
                             "--standard-error-file", cmd.stderr_file.string(),
                             "--out-meta", cmd.metafile.string()});
    if (!cmd.stdin_file.empty())
        args.insert(args.end(), {"--standard-input-file", cmd.stdin_file.string()});
    for (auto &variable : workspace.environment())
        args.insert(args.end(), {"--variable", variable});
    args.push_back("--");
    args.insert(args.end(), cmd.command.begin(), cmd.command.end());

    int ret = call_process(RUNGUARD, args);
    DLOG(INFO) << "runguard exited with " << ret;

    runguard_result result = read_runguard_result(cmd.metafile);
    if (!result.internal_error.empty())
        throw internal_error("runguard: " + result.internal_error);
    return result;
}

static vector<string> expand_command(const vector<string> &command, const sandbox_workspace &workspace) {
    vector<string> result;
    for (auto &token : command)
        result.push_back(expand_placeholders(token, workspace.placeholders()));
    return result;
}

run_outcome classify_run(const runguard_result &run, const submission &submit, const string &stderr_text) {
    if (run.memory_result == "oom")
        return run_outcome::MEMORY_EXCEEDED;
    if (!run.time_result.empty())
        return run_outcome::TIMED_OUT;
    if (run.exitcode != 0 || run.signal > 0) {
        // cgroup 限制内存时，内存分配失败通常会让程序自己崩溃，而不会触发 OOM killer
        int64_t ceiling = submit.limits.memory_limit * 1024;
        if (ceiling > 0 && run.memory >= (int64_t)(ceiling * MEMORY_CEILING_RATIO))
            return run_outcome::MEMORY_EXCEEDED;
        auto &marker = get_language_profile(submit.lang).out_of_memory_marker;
        if (!marker.empty() && stderr_text.find(marker) != string::npos)
            return run_outcome::MEMORY_EXCEEDED;
        return run_outcome::CRASHED;
    }
    return run_outcome::COMPLETED;
}

sandbox_executor::sandbox_executor(string cpuset) : cpuset(move(cpuset)) {}

execution_result sandbox_executor::execute(const submission &submit) {
    return execute(submit, make_unique<sandbox_workspace>(submit));
}

execution_result sandbox_executor::execute(const submission &submit, unique_ptr<sandbox_workspace> workspace) {
    execution_result result;
    result.sub_id = submit.sub_id;

    auto &profile = get_language_profile(submit.lang);
    write_file_content(workspace->compile_dir() / profile.source_file, submit.source_code);
    fs::path input_file = workspace->run_dir() / "testdata.in";
    write_file_content(input_file, submit.input);

    if (profile.compiled()) {
        guarded_command compile;
        compile.command = expand_command(profile.compile_command, *workspace);
        compile.time_limit = COMPILE_TIME_LIMIT;
        compile.memory_limit = COMPILE_MEMORY_LIMIT;
        compile.stdout_file = compile.stderr_file = workspace->run_dir() / "compile.out";
        compile.metafile = workspace->run_dir() / "compile.meta";

        elapsed_time compile_time;
        runguard_result compiled = run_guarded(*workspace, cpuset, compile);
        LOG(INFO) << "Compiled submission " << submit.sub_id << " in "
                  << compile_time.duration<chrono::milliseconds>().count() << "ms, exitcode: " << compiled.exitcode;

        if (compiled.exitcode != 0 || !compiled.time_result.empty() || compiled.memory_result == "oom") {
            result.outcome = run_outcome::COMPILE_ERROR;
            result.compile_log = read_file_prefix(compile.stdout_file, OUTPUT_LIMIT);
            if (!compiled.time_result.empty())
                result.compile_log += fmt::format("\nCompilation time limit exceeded ({:.1f}s)", COMPILE_TIME_LIMIT);
            else if (compiled.memory_result == "oom")
                result.compile_log += "\nCompilation memory limit exceeded";
            return result;
        }
    }

    guarded_command run;
    run.command = expand_command(profile.run_command, *workspace);
    run.time_limit = submit.limits.time_limit;
    run.memory_limit = submit.limits.memory_limit;
    run.stdin_file = input_file;
    run.stdout_file = workspace->run_dir() / "program.out";
    run.stderr_file = workspace->run_dir() / "program.err";
    run.metafile = workspace->run_dir() / "program.meta";

    runguard_result ran = run_guarded(*workspace, cpuset, run);

    result.output = read_file_prefix(run.stdout_file, stdout_capture_limit());
    result.error = read_file_prefix(run.stderr_file, OUTPUT_LIMIT);
    result.exitcode = ran.exitcode;
    result.signal = ran.signal;
    result.wall_time = ran.wall_time;
    result.memory = ran.memory;
    // stderr 被截断不影响答案的比较
    result.output_truncated = ran.output_truncated.find("stdout") != string::npos;
    result.outcome = classify_run(ran, submit, result.error);

    LOG(INFO) << "Ran submission " << submit.sub_id << ": " << get_display_message(result.outcome)
              << ", exitcode: " << ran.exitcode << ", time: " << ran.wall_time << "s, memory: " << ran.memory / 1024 << "KB";
    return result;
}

}  // namespace codejudge
