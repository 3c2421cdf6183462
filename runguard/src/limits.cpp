#include "limits.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <libcgroup.h>
#include <math.h>
#include <signal.h>
#include <sys/resource.h>
#include <time.h>
#include <unistd.h>
#include <system_error>
#include "cgroup.hpp"

using namespace std;

static const char *MEMORY_CGROUP_ROOT = "/sys/fs/cgroup/memory";

// 杀死 cgroup 内进程时的最大轮数
static const int KILL_ROUNDS = 10;

bool has_swap_accounting() {
    return access(fmt::format("{}/memory.memsw.limit_in_bytes", MEMORY_CGROUP_ROOT).c_str(), F_OK) == 0;
}

void cgroup_create(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);

    cgroup_ctrl ctrl = cg.add_controller("memory");
    if (opt.memory_limit >= 0) {
        // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
        ctrl.add_value("memory.limit_in_bytes", opt.memory_limit);
        if (has_swap_accounting())
            ctrl.add_value("memory.memsw.limit_in_bytes", opt.memory_limit);
        else
            LOG(WARNING) << "swap accounting is disabled, only physical memory is limited";
    }

    if (!opt.cpuset.empty()) {
        // 设置选手程序能使用的 CPU，独占 CPU 以避免时间计量不准确
        cgroup_ctrl cpuset_ctrl = cg.add_controller("cpuset");
        cpuset_ctrl.add_value("cpuset.mems", string("0"));
        cpuset_ctrl.add_value("cpuset.cpus", opt.cpuset);
    }

    cg.add_controller("cpuacct");

    cg.create_cgroup(1);
}

void cgroup_attach(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.get_cgroup();
    cg.attach_task();
}

void cgroup_kill(const struct runguard_options &opt) {
    const struct timespec delay = {0, 10000000L};  // 0.01s
    // 进程可能在遍历时继续 fork，重复遍历直到 cgroup 为空
    for (int round = 0; round < KILL_ROUNDS; ++round) {
        void *handle = nullptr;
        pid_t pid;
        bool found = false;
        int ret = cgroup_get_task_begin(opt.cgroupname.c_str(), "memory", &handle, &pid);
        while (ret == 0) {
            found = true;
            kill(pid, SIGKILL);
            ret = cgroup_get_task_next(&handle, &pid);
        }
        cgroup_get_task_end(&handle);
        if (ret != ECGEOF)
            throw cgroup_exception("cgroup_get_task", ret);
        if (!found) return;
        nanosleep(&delay, nullptr);
    }
    LOG(WARNING) << "processes still alive in cgroup " << opt.cgroupname;
}

void cgroup_delete(const struct runguard_options &opt) {
    cgroup_guard cg(opt.cgroupname);
    cg.add_controller("cpuacct");
    cg.add_controller("memory");
    if (!opt.cpuset.empty())
        cg.add_controller("cpuset");
    cg.delete_cgroup();
}

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), fmt::format("setrlimit({})", resource));
}

void set_restrictions(const struct runguard_options &opt) {
    // 用户程序只能看到显式传入的环境变量
    if (clearenv() != 0)
        throw runtime_error("unable to clear environment");
    for (auto &entry : opt.env) {
        auto idx = entry.find('=');
        if (idx == string::npos || idx == 0)
            throw invalid_argument("malformed environment variable " + entry);
        if (setenv(entry.substr(0, idx).c_str(), entry.substr(idx + 1).c_str(), true) != 0)
            throw system_error(errno, generic_category(), "setenv");
    }

    if (opt.use_cpu_limit) {
        /* Setting the real hard limit one second
		   higher: at the soft limit the kernel will send SIGXCPU at
		   the hard limit a SIGKILL. */
        rlim_t cputime_limit = (rlim_t)ceil(opt.cpu_limit.hard);
        set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);
    }

    // 内存由 cgroup 限制
    set_rlimit(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY);
    set_rlimit(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY);
    set_rlimit(RLIMIT_STACK, RLIM_INFINITY, RLIM_INFINITY);

    if (opt.file_limit > 0) set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit);
    if (opt.nproc > 0) set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc);
    if (opt.no_core_dumps) set_rlimit(RLIMIT_CORE, 0, 0);

    // put child process in the control group
    cgroup_attach(opt);

    // run the command in a separate process group,
    // so the command and all its child processes can be killed
    // off with one signal
    if (setsid() == -1)
        throw system_error(errno, generic_category(), "unable to setsid");

    if (!opt.chroot_dir.empty()) {
        if (chroot(opt.chroot_dir.c_str()) != 0)
            throw system_error(errno, generic_category(), fmt::format("unable to chroot to {}", opt.chroot_dir));
        if (chdir("/") != 0)
            throw system_error(errno, generic_category(), "unable to chdir to / in chroot");
    }

    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
        throw system_error(errno, generic_category(), fmt::format("unable to chdir to {}", opt.work_dir));

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[1] = {(gid_t)opt.group_id};
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    } else {
        if (setuid(getuid()))
            throw system_error(errno, generic_category(), "unable to reset user id");
    }

    if (geteuid() == 0 || getuid() == 0)
        throw runtime_error("you cannot run user command as root");
}
