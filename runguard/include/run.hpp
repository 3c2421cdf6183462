#pragma once

#include "runguard_options.hpp"

/**
 * @brief 根据传入的设置运行指定的程序
 * @note 该函数必须在 main 函数最后调用
 * 1. 注册 SIGCHLD 来监听子进程的信号
 * 2. 创建 cgroup，并注册 cpuacct、memory、cpuset 资源管控器，限制 CPU 核心、内存使用
 * 3. 分离 FD、FS、IPC、NET、NS、PID、UTS、SYSVSEM 等命名空间，用户程序无法访问网络，也看不到其他进程
 * 4. 调用 fork 创建子进程，并等待子进程结束
 *    1. 对于父进程
 *       1. 创建 itimer 来限制时钟时间，在收到 SIGALRM 时杀死子进程
 *       2. 通过管道读取子进程的输出，写入文件，超过 stream_size 的部分被丢弃
 *       3. 等待子进程结束，从状态管道读取用户程序的 wait status
 *    2. 子进程是新 PID 命名空间的 init 进程，它重新挂载 /proc，再 fork 出用户程序并等待其结束
 *    3. 对于用户程序进程
 *       1. 将标准输入重定向到输入文件，没有输入文件时为 /dev/null
 *       2. 给标准输入输出以外的文件描述符设置 FD_CLOEXEC，清空环境变量，只保留 --variable 指定的环境变量
 *       3. 通过 rlimit 限制 CPU 时间、进程数、文件大小
 *       4. 将子进程挂载到我们创建的 cgroup 上
 *       5. 将子进程分离到一个独立的进程组，以便我们通过 SIGKILL 可以杀死进程组内所有进程
 *       6. 设置 chroot 和工作路径
 *       7. 设置子进程的 user 和 group，拒绝以 root 身份运行用户程序
 * 5. 检查子进程是否正常退出
 * 6. 读取 cgroup 的监测数据，得到 CPU 时间、内存使用和是否触发 OOM
 * 7. 杀死 cgroup 内的所有进程确保选手 fork 出来的子进程都不会留驻系统
 * 8. 删除创建的 cgroup，并记录所有的信息到 meta 文件中
 *
 * meta 文件的键有：exitcode, signal, wall-time, cpu-time, memory-bytes,
 * memory-result, time-result, output-truncated, internal-error
 * @return 用户程序的返回值
 */
int runit(struct runguard_options opt);
