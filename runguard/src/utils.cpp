#include "utils.hpp"
#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <linux/close_range.h>
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <system_error>
#include <vector>

using namespace std;

bool is_number(const string &s) {
    return !s.empty() && all_of(s.begin(), s.end(), ::isdigit);
}

int get_userid(const char *name) {
    errno = 0;
    struct passwd *pwd = getpwnam(name);
    if (!pwd || errno) return -1;
    return (int)pwd->pw_uid;
}

int get_groupid(const char *name) {
    errno = 0;
    struct group *g = getgrnam(name);
    if (!g || errno) return -1;
    return (int)g->gr_gid;
}

static void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags < 0) {
        if (errno == EBADF) return;
        throw system_error(errno, generic_category(), "fcntl, getting fd flags");
    }
    if (fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0)
        throw system_error(errno, generic_category(), "fcntl, setting FD_CLOEXEC");
}

void set_cloexec_from(int lowfd) {
    if (close_range(lowfd, ~0U, CLOSE_RANGE_CLOEXEC) == 0) return;

    // 内核不支持 CLOSE_RANGE_CLOEXEC (< 5.11) 时逐个设置
    DIR *dir = opendir("/proc/self/fd");
    if (!dir) throw system_error(errno, generic_category(), "opening /proc/self/fd");
    vector<int> fds;
    for (struct dirent *entry; (entry = readdir(dir));) {
        if (!is_number(entry->d_name)) continue;
        int fd = atoi(entry->d_name);
        if (fd >= lowfd && fd != dirfd(dir)) fds.push_back(fd);
    }
    closedir(dir);
    for (int fd : fds) set_cloexec(fd);
}
