#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "judge/submission.hpp"
#include "runguard.hpp"

namespace codejudge {

/**
 * @brief 一次评测使用的一次性工作区
 * 构造时在 RUN_DIR 下创建以随机 uuid 命名的文件夹，并计算用户程序可见的
 * 环境变量（只包含 PATH、LANG、HOME 和语言相关的变量，评测系统自身的
 * 环境变量和凭据都不会被传给用户程序），析构时删除整个文件夹。
 *
 * 工作区只能给一个提交使用一次。构造失败时已经创建的文件夹会被删除。
 */
struct sandbox_workspace {
    explicit sandbox_workspace(const submission &submit);
    ~sandbox_workspace();

    sandbox_workspace(const sandbox_workspace &) = delete;
    sandbox_workspace &operator=(const sandbox_workspace &) = delete;

    /**
     * @brief 工作区根目录 RUN_DIR/<uuid>
     */
    const std::filesystem::path &root() const { return root_dir; }

    /**
     * @brief 源代码、编译产物所在的文件夹，也是用户程序的工作目录和 HOME
     * 属于运行用户，权限为 0700
     */
    const std::filesystem::path &compile_dir() const { return compile_path; }

    /**
     * @brief 标准输入输出文件和 meta 文件所在的文件夹，只有 root 可以访问
     */
    const std::filesystem::path &run_dir() const { return run_path; }

    /**
     * @brief 传给 runguard 的环境变量，格式为 KEY=VALUE
     */
    const std::vector<std::string> &environment() const { return env; }

    /**
     * @brief 命令中的占位符和对应的值（已经转换为 chroot 内的路径）
     */
    const std::map<std::string, std::string> &placeholders() const { return variables; }

    /**
     * @brief 将宿主机上的路径转换为用户程序看到的路径
     * 没有设置 CHROOT_DIR 时路径不变
     */
    static std::filesystem::path sandbox_path(const std::filesystem::path &host_path);

private:
    std::filesystem::path root_dir, compile_path, run_path;
    std::vector<std::string> env;
    std::map<std::string, std::string> variables;
};

/**
 * @brief 沙箱执行器接口
 * 每次调用 execute 只评测一个提交，不同的调用之间不共享任何文件。
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 编译并运行提交
     * @return 运行的原始结果
     * @throw internal_error 如果评测系统出错（比如 runguard 无法启动）
     */
    virtual execution_result execute(const submission &submit) = 0;
};

/**
 * @brief 通过 runguard 在沙箱中编译、运行用户程序
 * 1. 将源代码和标准输入写入工作区
 * 2. 如果语言需要编译，在编译时间、内存限制下调用编译器，编译失败则不运行
 * 3. 在提交的时间、内存限制下运行用户程序，runguard 负责：
 *    1. 通过时钟定时器在超时时杀死用户程序
 *    2. 通过 cgroup 限制内存使用
 *    3. 通过网络命名空间禁止网络访问
 *    4. 截断过长的输出
 * 4. 读取 runguard 的 meta 文件并分类运行结果
 */
struct sandbox_executor : public executor {
    /**
     * @param cpuset 用户程序可以使用的 CPU 核心，为空表示不限制
     */
    explicit sandbox_executor(std::string cpuset = "");

    execution_result execute(const submission &submit) override;

    /**
     * @brief 在给定的工作区中评测提交
     * 执行器获得工作区的所有权，无论评测是否成功，返回时工作区都会被删除。
     */
    execution_result execute(const submission &submit, std::unique_ptr<sandbox_workspace> workspace);

private:
    std::string cpuset;
};

/**
 * @brief 用户程序 stdout 的保存长度，单位为字节
 * 比 OUTPUT_LIMIT 多出 OUTPUT_SLACK 并按 KB 向上取整，使得输出恰好等于期望输出
 * 再加上若干空白字符时不会被截断。超过这个长度的输出会被截断，评测为 WA。
 */
extern const std::size_t OUTPUT_SLACK;
std::size_t stdout_capture_limit();

/**
 * @brief 根据 runguard 的运行信息分类用户程序的运行结果
 * @param run runguard 的运行信息
 * @param stderr_text 用户程序的标准错误输出，用于识别语言运行时报告的内存不足
 */
run_outcome classify_run(const runguard_result &run, const submission &submit, const std::string &stderr_text);

}  // namespace codejudge
