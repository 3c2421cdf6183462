#pragma once

#include "runguard_options.hpp"

/**
 * @brief 创建 cgroup 并写入内存限制和 cpuset
 */
void cgroup_create(const struct runguard_options &);

/**
 * Move current process to the control group.
 *
 * Attach to the control group to change settings
 * and monitor status.
 */
void cgroup_attach(const struct runguard_options &);

/**
 * Kill all processes in the control group.
 *
 * Here, runguard will kill all child processes of
 * the monitored process after exiting.
 */
void cgroup_kill(const struct runguard_options &);

void cgroup_delete(const struct runguard_options &);

/**
 * @brief 内核是否开启了 swap 的内存统计
 * 没有开启时 memory.memsw.* 文件不存在，只能限制物理内存
 */
bool has_swap_accounting();

/**
 * Limit current process resources usage.
 */
void set_restrictions(const struct runguard_options &opt);
