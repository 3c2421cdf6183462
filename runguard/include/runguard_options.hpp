#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

struct time_limit {
    double soft, hard;
};

struct runguard_options {
    std::string cgroupname;
    std::string chroot_dir;
    std::string work_dir;  // 相对于 chroot 的工作目录
    size_t nproc = 0;
    int user_id = -1;
    int group_id = -1;
    std::string cpuset;  // processor id to run client program.

    bool use_wall_limit = false;
    struct time_limit wall_limit;  // wall clock time
    bool use_cpu_limit = false;
    struct time_limit cpu_limit;  // CPU time

    int64_t memory_limit = -1;  // Memory limit in bytes
    int64_t file_limit = -1;    // Created file size limit in bytes
    int64_t stream_size = -1;   // Output stream limit in bytes
    bool no_core_dumps = false;

    std::string stdin_filename;
    std::string stdout_filename;
    std::string stderr_filename;

    // 用户程序只能看到这些环境变量，格式为 KEY=VALUE
    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};
