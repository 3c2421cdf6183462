#include "run.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <math.h>
#include <sched.h>
#include <signal.h>
#include <string.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/assign.hpp>
#include <iostream>
#include <system_error>
#include "cgroup.hpp"
#include "limits.hpp"
#include "utils.hpp"

using namespace std;

const struct timespec killdelay = {0, 100000000L};  // 0.1s

const int BUF_SIZE = 4096;

const int PIPE_IN = 1;
const int PIPE_OUT = 0;

const int TIMELIMIT_SOFT = 1;
const int TIMELIMIT_HARD = 2;
int walllimit = 0, cpulimit = 0;

int metafd = -1;
pid_t child_pid = -1;
static volatile sig_atomic_t received_SIGCHLD = 0;
static volatile sig_atomic_t received_signal = -1;

template <typename... Args>
[[noreturn]] void error(int err, const char *format, Args &&...args) {
    throw system_error(err, system_category(), fmt::format(format, std::forward<Args>(args)...));
}

template <typename T>
void append_meta(const char *key, const T &message) {
    if (metafd < 0) return;
    string line = fmt::format("{}: {}\n", key, message);
    const char *data = line.data();
    size_t remaining = line.size();
    while (remaining > 0) {
        ssize_t written = write(metafd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += written;
        remaining -= written;
    }
}

static void kill_child() {
    if (child_pid <= 0) return;
    // child_pid 是 PID 命名空间的 init 进程，它退出时命名空间内所有进程都会被杀死
    if (kill(child_pid, SIGKILL) != 0 && errno != ESRCH)
        LOG(ERROR) << "unable to send SIGKILL to children: " << strerror(errno);
    /* Wait a while to make sure the process is killed by now. */
    nanosleep(&killdelay, nullptr);
}

void runguard_terminate_handler() {
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGALRM);
    sigaddset(&sigs, SIGTERM);
    sigprocmask(SIG_BLOCK, &sigs, nullptr);

    exception_ptr cur = current_exception();
    try {
        if (cur) rethrow_exception(cur);
    } catch (const exception &e) {
        cerr << e.what() << endl;
        append_meta("internal-error", e.what());
    } catch (...) {
        cerr << "Unknown exception occurred" << endl;
        append_meta("internal-error", "unknown exception");
    }

    /* Make sure that all children are killed before terminating */
    kill_child();
    _exit(EXIT_FAILURE);
}

/**
 * @brief SIGALRM（时钟时间超限）和 SIGTERM 的处理函数
 * 只调用异步信号安全的函数：直接杀死子进程组，日志留到子进程退出后输出
 */
static void terminate(int sig) {
    received_signal = sig;
    if (sig == SIGALRM) walllimit |= TIMELIMIT_HARD;

    // 命名空间的 init 进程会忽略除 SIGKILL 以外的信号
    if (child_pid > 0) kill(child_pid, SIGKILL);
}

static void child_handler(int /* signal */) {
    received_SIGCHLD = 1;
}

static void summarize(const runguard_options &opt, int exitcode, int signal,
                      struct timeval starttime, struct timeval endtime,
                      size_t data_passed[3], size_t data_read[3]) {
    static const char output_timelimit_str[4][16] = {
        "",
        "soft-timelimit",
        "hard-timelimit",
        "hard-timelimit"};
    double cpudiff;
    bool is_oom = false;

    {
        cgroup_guard guard(opt.cgroupname);
        guard.get_cgroup();  // prepare for get_controller

        cgroup_ctrl memory = guard.get_controller("memory");
        int64_t max_usage = memory.get_value_int64(has_swap_accounting() ? "memory.memsw.max_usage_in_bytes" : "memory.max_usage_in_bytes");
        LOG(INFO) << "total memory used: " << max_usage / 1024 << "kB";
        append_meta("memory-bytes", max_usage);

        // memory.oom_control 的格式为多行 "key value"，oom_kill 为 OOM killer 杀死进程的次数
        string oom_control = memory.get_value_string("memory.oom_control");
        auto pos = oom_control.find("oom_kill ");
        if (pos != string::npos)
            is_oom = atol(oom_control.c_str() + pos + 9) > 0;

        cgroup_ctrl cpuacct = guard.get_controller("cpuacct");
        cpudiff = (double)cpuacct.get_value_int64("cpuacct.usage") / 1e9;  // in ns
    }

    append_meta("memory-result", is_oom ? "oom" : "");

    // 杀死 cgroup 内所有的进程，选手程序 fork 出来的进程不能比被监控的进程活得更久
    cgroup_kill(opt);
    cgroup_delete(opt);

    append_meta("exitcode", exitcode);
    if (signal > 0) append_meta("signal", signal);

    double walldiff = (endtime.tv_sec - starttime.tv_sec) +
                      (endtime.tv_usec - starttime.tv_usec) * 1E-6;
    append_meta("wall-time", fmt::format("{:.3f}", walldiff));
    append_meta("cpu-time", fmt::format("{:.3f}", cpudiff));
    LOG(INFO) << fmt::format("run time: real {:.3f}, cpu {:.3f}", walldiff, cpudiff);

    if (opt.use_wall_limit && walldiff > opt.wall_limit.soft) {
        walllimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft wall time)";
    }

    if (opt.use_cpu_limit && cpudiff > opt.cpu_limit.soft) {
        cpulimit |= TIMELIMIT_SOFT;
        LOG(WARNING) << "Time Limit Exceeded (soft cpu time)";
    }

    append_meta("time-result", output_timelimit_str[walllimit | cpulimit]);

    using namespace boost::assign;
    vector<string> output_truncated;
    if (data_passed[STDOUT_FILENO] < data_read[STDOUT_FILENO])
        output_truncated += "stdout";
    if (data_passed[STDERR_FILENO] < data_read[STDERR_FILENO])
        output_truncated += "stderr";
    append_meta("output-truncated", boost::algorithm::join(output_truncated, ","));
}

/**
 * @brief 从子进程的输出管道中读取数据并写入文件
 * 超过 stream_size 的数据被读取后丢弃，但是仍然计入 data_read
 */
static void pump_pipes(const runguard_options &opt, fd_set *readfds, int child_pipefd[3][2], int child_redirfd[3], size_t data_read[], size_t data_passed[]) {
    char buf[BUF_SIZE];
    ssize_t nread, nwritten;

    for (int i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT] == -1 || !FD_ISSET(child_pipefd[i][PIPE_OUT], readfds))
            continue;

        size_t to_read = BUF_SIZE;
        if (opt.stream_size >= 0 && data_passed[i] < (size_t)opt.stream_size)
            to_read = min((size_t)BUF_SIZE, (size_t)opt.stream_size - data_passed[i]);

        nread = read(child_pipefd[i][PIPE_OUT], buf, to_read);
        if (nread == -1) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            error(errno, "copying data fd {}", i);
        }
        if (nread == 0) {
            /* EOF detected: close fd and indicate this with -1 */
            if (close(child_pipefd[i][PIPE_OUT]) != 0)
                error(errno, "closing pipe for fd {}", i);
            child_pipefd[i][PIPE_OUT] = -1;
            continue;
        }

        size_t to_write = nread;
        if (opt.stream_size >= 0)
            to_write = min(to_write, (size_t)opt.stream_size - data_passed[i]);
        for (const char *p = buf; to_write > 0;) {
            nwritten = write(child_redirfd[i], p, to_write);
            if (nwritten == -1) {
                if (errno == EINTR) continue;
                error(errno, "writing output of fd {}", i);
            }
            to_write -= nwritten;
            p += nwritten;
            data_passed[i] += nwritten;
        }
        data_read[i] += nread;

        if (opt.stream_size >= 0 && data_passed[i] == (size_t)opt.stream_size && data_read[i] == data_passed[i])
            LOG(INFO) << "child fd " << i << " limit reached";
    }
}

/**
 * @brief 子进程：重定向输入输出、加上资源限制后执行用户程序
 * 任何错误都写入 meta 文件的 internal-error 并以 127 退出，不会返回
 */
[[noreturn]] static void run_child(const runguard_options &opt, int child_pipefd[3][2]) {
    try {
        int infd = open(opt.stdin_filename.empty() ? "/dev/null" : opt.stdin_filename.c_str(), O_RDONLY);
        if (infd < 0) error(errno, "opening input file '{}'", opt.stdin_filename);
        if (dup2(infd, STDIN_FILENO) < 0) error(errno, "redirecting child stdin");
        if (infd != STDIN_FILENO) close(infd);

        // 将管道连接到 stdout/stderr。
        for (int i = 1; i <= 2; ++i) {
            if (dup2(child_pipefd[i][PIPE_IN], i) < 0)
                error(errno, "redirecting child fd {}", i);
            if (close(child_pipefd[i][PIPE_IN]) != 0 || close(child_pipefd[i][PIPE_OUT]) != 0)
                error(errno, "closing pipe for fd {}", i);
        }

        // 不能让用户程序拿到 runguard 从评测系统继承来的 socket（比如已经认证过的 Redis 连接）
        set_cloexec_from(STDERR_FILENO + 1);

        set_restrictions(opt);

        sigset_t emptymask;
        sigemptyset(&emptymask);
        if (sigprocmask(SIG_SETMASK, &emptymask, nullptr) != 0) error(errno, "unmasking signals");

        vector<char *> args;
        for (auto &arg : opt.command) args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        error(errno, "unable to start command {}", opt.command[0]);
    } catch (const exception &e) {
        append_meta("internal-error", e.what());
    }
    _exit(127);
}

/**
 * @brief 在 init 进程的挂载命名空间中重新挂载 /proc
 * 用户程序只能看到自己 PID 命名空间内的进程，无法通过 /proc/<pid>/cwd 访问其他提交的工作区。
 * runguard 本身仍然使用原来的 /proc。
 */
static void mount_proc(const runguard_options &opt) {
    if (unshare(CLONE_NEWNS) != 0) error(errno, "unable to unshare mount namespace");
    // 挂载不能传播回宿主机
    if (mount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, nullptr) != 0)
        error(errno, "unable to make mounts private");

    string target = opt.chroot_dir + "/proc";
    struct stat st;
    if (stat(target.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) return;
    if (mount("proc", target.c_str(), "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr) != 0)
        error(errno, "unable to mount proc on '{}'", target);
}

/**
 * @brief PID 命名空间的 init 进程：启动用户程序并等待它结束
 * 用户程序的 wait status 通过 status_fd 传回 runguard，因为 init 进程无法以信号的方式退出。
 */
[[noreturn]] static void run_init(const runguard_options &opt, int child_pipefd[3][2], int status_fd) {
    try {
        mount_proc(opt);

        pid_t pid = fork();
        if (pid < 0) error(errno, "unable to fork");
        if (pid == 0) run_child(opt, child_pipefd);

        // 只有用户程序持有管道的写端，用户程序退出后 runguard 才能读到 EOF
        for (int i = 1; i <= 2; ++i) {
            if (close(child_pipefd[i][PIPE_IN]) != 0 || close(child_pipefd[i][PIPE_OUT]) != 0)
                error(errno, "closing pipe for fd {}", i);
        }

        int status;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) error(errno, "waiting on command");
        }
        while (write(status_fd, &status, sizeof(status)) < 0) {
            if (errno != EINTR) error(errno, "writing command status");
        }
        _exit(0);
    } catch (const exception &e) {
        append_meta("internal-error", e.what());
    }
    _exit(127);
}

int runit(struct runguard_options opt) {
    set_terminate(runguard_terminate_handler);

    // 用户程序不能继承 meta 文件
    metafd = open(opt.metafile_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (metafd < 0) error(errno, "opening meta file '{}'", opt.metafile_path);

    if (opt.command.empty()) throw invalid_argument("no command specified");

    int child_pipefd[3][2];
    int child_redirfd[3];

    /* Setup pipes connecting to child stdout/err streams (ignore stdin). */
    for (int i = 1; i <= 2; i++) {
        if (pipe(child_pipefd[i]) != 0) error(errno, "creating pipe for fd {}", i);
    }

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) error(errno, "creating status pipe");

    sigset_t emptymask;
    if (sigemptyset(&emptymask) != 0) error(errno, "creating empty signal mask");
    {
        struct sigaction sigact;
        sigset_t sigmask;

        /* unmask all signals, except SIGCHLD: detected in pselect() below */
        sigmask = emptymask;
        if (sigaddset(&sigmask, SIGCHLD) != 0) error(errno, "setting signal mask");
        if (sigprocmask(SIG_SETMASK, &sigmask, NULL) != 0) error(errno, "unmasking signals");

        /* Construct signal handler for SIGCHLD detection in pselect(). */
        received_SIGCHLD = 0;
        sigact.sa_handler = child_handler;
        sigact.sa_flags = 0;
        sigact.sa_mask = emptymask;
        if (sigaction(SIGCHLD, &sigact, NULL) != 0) error(errno, "installing signal handler");
    }

    cgroup_guard::init();
    opt.cgroupname = fmt::format("/codejudge/run_{}_{}", getpid(), (long)time(NULL));
    cgroup_create(opt);

    /*
     * 通过 unshare 进行进程隔离：
     * CLONE_FILES：隔离文件描述符表，受控程序无法访问调用者打开过的文件
     * CLONE_NEWIPC：受控程序无法与主机程序进行 System V 进程间通信
     * CLONE_NEWNET：受控程序被移入一个没有网络设备的网络命名空间，无法访问网络
     * CLONE_NEWNS：受控程序的挂载操作不影响主机
     * CLONE_NEWPID：受控程序看不到其他进程，fork 出的第一个子进程是命名空间的 init 进程
     * CLONE_NEWUTS：隔离 hostname 和 NIS 域名
     */
    if (unshare(CLONE_FILES | CLONE_FS | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWNS | CLONE_NEWPID | CLONE_NEWUTS | CLONE_SYSVSEM) != 0)
        error(errno, "unable to unshare namespaces");

    {
        /* The oom_score_adj is inherited by child processes; a negative
         * value makes the OOM killer prefer other processes. */
        const char *OOM_PATH = "/proc/self/oom_score_adj";
        FILE *fp = fopen(OOM_PATH, "r+");
        if (fp) {
            int ret;
            if (fscanf(fp, "%d", &ret) != 1) error(errno, "cannot read from '{}'", OOM_PATH);
            if (ret < 0) {
                LOG(INFO) << "resetting '" << OOM_PATH << "' from " << ret << " to 0";
                rewind(fp);
                if (fprintf(fp, "0\n") <= 0) error(errno, "cannot write to '{}'", OOM_PATH);
            }
            if (fclose(fp) != 0) error(errno, "closing file '{}'", OOM_PATH);
        }
    }

    switch (child_pid = fork()) {
        case -1:
            error(errno, "unable to fork");
        case 0:
            close(status_pipe[0]);
            run_init(opt, child_pipefd, status_pipe[1]);
        default:
            break;
    }
    if (close(status_pipe[1]) != 0) error(errno, "closing status pipe");

    // watchdog
    int status = 0, exitcode, signal = -1;
    struct timeval starttime, endtime;
    size_t data_read[3] = {0, 0, 0};
    size_t data_passed[3] = {0, 0, 0};
    fd_set readfds;

    if (gettimeofday(&starttime, NULL)) error(errno, "getting time");

    /* Close unused file descriptors */
    for (int i = 1; i <= 2; i++) {
        if (close(child_pipefd[i][PIPE_IN]) != 0) error(errno, "closing pipe for fd {}", i);
    }

    /* Redirect child stdout/stderr to file */
    child_redirfd[STDIN_FILENO] = -1;
    child_redirfd[STDOUT_FILENO] = open(opt.stdout_filename.empty() ? "/dev/null" : opt.stdout_filename.c_str(),
                                        O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
    if (child_redirfd[STDOUT_FILENO] < 0) error(errno, "opening file '{}'", opt.stdout_filename);
    if (!opt.stderr_filename.empty() && opt.stderr_filename == opt.stdout_filename) {
        child_redirfd[STDERR_FILENO] = child_redirfd[STDOUT_FILENO];
    } else {
        child_redirfd[STDERR_FILENO] = open(opt.stderr_filename.empty() ? "/dev/null" : opt.stderr_filename.c_str(),
                                            O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (child_redirfd[STDERR_FILENO] < 0) error(errno, "opening file '{}'", opt.stderr_filename);
    }

    {
        sigset_t sigmask;
        struct sigaction sigact;

        /* One-time signal handler to terminate() for TERM and ALRM signals. */
        sigmask = emptymask;
        if (sigaddset(&sigmask, SIGALRM) != 0 || sigaddset(&sigmask, SIGTERM) != 0)
            error(errno, "setting signal mask");

        sigact.sa_handler = terminate;
        sigact.sa_flags = SA_RESETHAND | SA_RESTART;
        sigact.sa_mask = sigmask;

        /* Kill child command when we receive SIGTERM */
        if (sigaction(SIGTERM, &sigact, NULL) != 0) error(errno, "installing signal handler");

        if (opt.use_wall_limit) {
            /* Kill child when we receive SIGALRM */
            if (sigaction(SIGALRM, &sigact, NULL) != 0) error(errno, "installing signal handler");

            double tmpd;
            struct itimerval itimer;
            itimer.it_interval.tv_sec = 0;
            itimer.it_interval.tv_usec = 0;
            itimer.it_value.tv_sec = (int)opt.wall_limit.hard;
            itimer.it_value.tv_usec = (int)(modf(opt.wall_limit.hard, &tmpd) * 1E6);

            if (setitimer(ITIMER_REAL, &itimer, NULL) != 0) error(errno, "setting timer");
            LOG(INFO) << fmt::format("setting hard wall-time limit to {:.3f} seconds", opt.wall_limit.hard);
        }
    }

    while (true) {
        FD_ZERO(&readfds);
        int nfds = -1;
        for (int i = 1; i <= 2; i++) {
            if (child_pipefd[i][PIPE_OUT] >= 0) {
                FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
                nfds = max(nfds, child_pipefd[i][PIPE_OUT]);
            }
        }

        int r = pselect(nfds + 1, &readfds, NULL, NULL, NULL, &emptymask);
        if (r == -1 && errno != EINTR) error(errno, "waiting for child data");

        if (received_SIGCHLD || received_signal == SIGALRM) {
            received_SIGCHLD = 0;
            int pid = waitpid(child_pid, &status, WNOHANG);
            if (pid < 0) error(errno, "waiting on child");
            if (pid == child_pid) break;
        }

        if (r > 0)
            pump_pipes(opt, &readfds, child_pipefd, child_redirfd, data_read, data_passed);
    }

    if (gettimeofday(&endtime, NULL)) error(errno, "getting time");

    /* Stop the timer, the child has exited. */
    struct itimerval zero_timer = {{0, 0}, {0, 0}};
    setitimer(ITIMER_REAL, &zero_timer, NULL);

    if (received_signal == SIGALRM)
        LOG(WARNING) << "timelimit exceeded (hard wall time): command aborted";
    else if (received_signal > 0)
        LOG(WARNING) << "received signal " << received_signal << ": command aborted";

    // 子进程的后代可能仍然持有管道的写端，先杀死 cgroup 内所有进程再读取剩余的输出
    cgroup_kill(opt);

    /* Drain remaining data with blocking I/O. */
    for (int i = 1; i <= 2; i++) {
        if (child_pipefd[i][PIPE_OUT] < 0) continue;
        int flags = fcntl(child_pipefd[i][PIPE_OUT], F_GETFL);
        if (flags == -1) error(errno, "fcntl, getting flags");
        if (fcntl(child_pipefd[i][PIPE_OUT], F_SETFL, flags & ~O_NONBLOCK) == -1) error(errno, "fcntl, setting flags");
    }
    while (child_pipefd[STDOUT_FILENO][PIPE_OUT] >= 0 || child_pipefd[STDERR_FILENO][PIPE_OUT] >= 0) {
        FD_ZERO(&readfds);
        for (int i = 1; i <= 2; i++)
            if (child_pipefd[i][PIPE_OUT] >= 0) FD_SET(child_pipefd[i][PIPE_OUT], &readfds);
        pump_pipes(opt, &readfds, child_pipefd, child_redirfd, data_read, data_passed);
    }

    {
        // init 进程在用户程序结束前被杀死（时钟时间超限）时没有 wait status，使用 init 自身的退出状态
        int command_status;
        ssize_t nread;
        while ((nread = read(status_pipe[0], &command_status, sizeof(command_status))) < 0) {
            if (errno != EINTR) error(errno, "reading command status");
        }
        if (nread == (ssize_t)sizeof(command_status)) status = command_status;
        close(status_pipe[0]);
    }

    /* Close the output files */
    if (close(child_redirfd[STDOUT_FILENO]) != 0) error(errno, "closing output fd {}", STDOUT_FILENO);
    if (child_redirfd[STDOUT_FILENO] != child_redirfd[STDERR_FILENO] && close(child_redirfd[STDERR_FILENO]) != 0)
        error(errno, "closing output fd {}", STDERR_FILENO);

    if (WIFEXITED(status)) {
        exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        signal = WTERMSIG(status);
        exitcode = signal + 128;
        if (signal == SIGXCPU) {
            cpulimit |= TIMELIMIT_HARD;
            LOG(WARNING) << "Time Limit Exceeded (hard cpu time)";
        } else {
            LOG(WARNING) << "Command terminated with signal (" << signal << ", " << strsignal(signal) << ")";
        }
    } else {
        throw runtime_error(fmt::format("unknown status: {:x}", status));
    }

    summarize(opt, exitcode, signal, starttime, endtime, data_passed, data_read);
    close(metafd);

    return exitcode;
}
