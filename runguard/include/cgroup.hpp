#pragma once

#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

/**
 * @brief libcgroup 返回的错误
 */
struct cgroup_exception : public std::exception {
    cgroup_exception(const std::string &cgroup_op, int err);

    const char *what() const noexcept override;

    /**
     * @brief 如果 err 不为 0 则抛出异常
     */
    static void ensure(const std::string &cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup v1 的 controller
 *
 * runguard 使用的 controller 有：
 * 1. cpuacct - 统计 cgroup 中任务占用的 CPU 时间
 * 2. cpuset - 给 cgroup 中的任务分配独立 CPU 和内存节点
 * 3. memory - 对 cgroup 中的任务可用内存做出限制，并且统计内存使用峰值和 OOM 次数
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    void add_value(const std::string &name, int64_t value);

    void add_value(const std::string &name, const std::string &value);

    int64_t get_value_int64(const std::string &name);

    std::string get_value_string(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放 libcgroup 分配的内存，不会删除内核中的 cgroup
 */
struct cgroup_guard {
    /**
     * @param cgroup_name cgroup 相对于层级根目录的路径，如 /codejudge/run_1
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    ~cgroup_guard();

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 在内核中创建这个 cgroup
     * add_controller、add_value 添加的设定也会在这时写入内核。
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 添加一个 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当添加失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 获得 add_controller 添加的或者 get_cgroup 从内核读入的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * @brief 从内核中读入 cgroup 绑定的所有 controller 和参数
     */
    void get_cgroup();

    /**
     * @brief 将当前进程移入本 cgroup
     */
    void attach_task();

    /**
     * @brief 从内核中删除这个 cgroup，剩下的进程被移入上一层的 cgroup
     */
    void delete_cgroup();

    static void init();

private:
    struct cgroup *cg;
};
