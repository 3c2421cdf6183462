#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace codejudge {

/**
 * @brief 表示提交在评测流水线中的状态
 * 状态只能按 QUEUED -> RUNNING -> {COMPLETED, FAILED} 的顺序转移，
 * 终止状态不能再转移到其他状态。
 */
enum class submission_status {
    /**
     * @brief 提交已经被接收并进入提交队列，还没有 worker 开始评测
     */
    QUEUED = 0,

    /**
     * @brief 某个 worker 已经领取了这个提交，正在编译或运行
     */
    RUNNING = 1,

    /**
     * @brief 评测完成，评测结果为用户程序的结果（包括 CE、RE 等）
     */
    COMPLETED = 2,

    /**
     * @brief 评测系统内部出错，评测结果为 Internal Error
     */
    FAILED = 3
};

/**
 * @brief 表示整个提交的评测结果
 */
enum class verdict {
    /**
     * @brief 用户程序正常退出，且输出与标准输出一致
     */
    ACCEPTED = 0,

    /**
     * @brief 用户程序正常退出，但输出与标准输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 用户程序运行时间超出限制
     * runguard 的时钟时间定时器或 CPU 时间限制被触发
     */
    TIME_LIMIT_EXCEEDED = 2,

    /**
     * @brief 用户程序运行内存超限
     * cgroup 的 OOM killer 被触发，或者程序在内存上限处分配失败而崩溃，
     * 或者 Java 程序抛出 OutOfMemoryError
     */
    MEMORY_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序以非零返回值退出或者因为信号崩溃
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 用户程序无法通过编译，或者编译超时
     * 此时用户程序不会被运行
     */
    COMPILATION_ERROR = 5,

    /**
     * @brief 内部错误，评测系统出错
     * 比如 runguard 启动失败、工作区无法创建
     */
    INTERNAL_ERROR = 6
};

const char *get_display_message(verdict);

const char *get_display_message(submission_status);

/**
 * @brief 评测结果在 JSON 中的表示，如 "AC"、"WA"
 */
const char *get_wire_name(verdict);

/**
 * @brief 提交状态在 JSON 中的表示，如 "QUEUED"、"COMPLETED"
 */
const char *get_wire_name(submission_status);

/**
 * @brief 从 JSON 表示中解析评测结果
 * @throw std::invalid_argument 如果 name 不是合法的评测结果
 */
verdict parse_verdict(const std::string &name);

/**
 * @brief 从 JSON 表示中解析提交状态
 * @throw std::invalid_argument 如果 name 不是合法的提交状态
 */
submission_status parse_submission_status(const std::string &name);

bool is_terminal(submission_status status);

/**
 * @brief 检查状态转移 from -> to 是否合法
 */
bool is_valid_transition(submission_status from, submission_status to);

void to_json(nlohmann::json &j, const verdict &value);
void from_json(const nlohmann::json &j, verdict &value);
void to_json(nlohmann::json &j, const submission_status &value);
void from_json(const nlohmann::json &j, submission_status &value);

}  // namespace codejudge
