#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief runguard 写入 meta 文件的运行信息
 * meta 文件每行的格式为 "key: value"
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，如果是多线程程序，所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    int exitcode = -1;

    int signal = -1;

    /**
     * @brief runguard 自身出错的原因，为空表示没有出错
     */
    std::string internal_error;

    /**
     * @brief 实际内存使用（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief 为 "oom" 表示触发了 cgroup 的内存限制
     */
    std::string memory_result;

    /**
     * @brief 为空表示没有超时，否则为 "soft-timelimit" 或 "hard-timelimit"
     */
    std::string time_result;

    /**
     * @brief 被截断的输出流，如 "stdout,stderr"
     */
    std::string output_truncated;
};

/**
 * @brief 读取 runguard 产生的 meta 文件
 * @throw internal_error 如果 meta 文件不存在
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace codejudge
