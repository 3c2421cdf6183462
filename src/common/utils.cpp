#include "common/utils.hpp"
#include <linux/close_range.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <mutex>
#include <system_error>
using namespace std;

int exec_program(const map<string, string> &env, const char **argv) {
    // 使用 POSIX 提供的函数来实现外部程序调用
    pid_t pid;
    switch (pid = fork()) {
        case -1:  // fork 失败
            throw system_error(errno, system_category(), "unable to fork");
        case 0:  // 子进程
            // 避免子进程被终止，要求父进程处理中断信号
            signal(SIGINT, SIG_IGN);
            // 子进程只继承标准输入输出，Redis、AMQP 和 HTTP 连接都不能传给子进程
            if (close_range(STDERR_FILENO + 1, ~0U, 0) != 0) {
                for (long fd = STDERR_FILENO + 1, max_fd = sysconf(_SC_OPEN_MAX); fd < max_fd; ++fd)
                    close((int)fd);
            }
            for (auto &[key, value] : env)
                set_env(key, value);
            execvp(argv[0], (char **)argv);
            _exit(EXIT_FAILURE);
        default:  // 父进程
            int status;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR)
                    throw system_error(errno, system_category(), "unable to wait for child process");
            }
            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            else
                return -1;
    }
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

string generate_uuid() {
    // random_generator 不是线程安全的
    static mutex generator_mutex;
    static boost::uuids::random_generator generator;
    scoped_lock guard(generator_mutex);
    return boost::uuids::to_string(generator());
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}
