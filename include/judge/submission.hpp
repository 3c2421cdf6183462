#pragma once

#include <cstdint>
#include <ctime>
#include <nlohmann/json.hpp>
#include <string>
#include "common/status.hpp"
#include "judge/language.hpp"

namespace codejudge {

/**
 * @brief 提交的资源限制
 */
struct resource_limits {
    /**
     * @brief 时间限制，单位为秒
     * 同时作为时钟时间和 CPU 时间的限制
     */
    double time_limit;

    /**
     * @brief 内存限制，单位为 KB
     */
    int64_t memory_limit;
};

/**
 * @brief 一个选手提交
 * 提交在进入提交队列之后不会再被修改，sub_id 在系统内全局唯一。
 */
struct submission {
    /**
     * @brief 提交 id，由客户端指定或者由系统生成
     * 只包含字母、数字、下划线和连字符
     */
    std::string sub_id;

    language lang;

    std::string source_code;

    /**
     * @brief 用户程序的标准输入，可以为空
     */
    std::string input;

    /**
     * @brief 用户程序的期望输出
     */
    std::string expected_output;

    resource_limits limits;

    /**
     * @brief 评测完成后通知的 URL，为空表示不需要回调
     */
    std::string callback_url;

    /**
     * @brief 提交被接收的时间（从 1970 年 1 月 1 日开始的时间戳）
     */
    time_t created_at = 0;
};

void to_json(nlohmann::json &j, const submission &submit);
void from_json(const nlohmann::json &j, submission &submit);

/**
 * @brief 用户程序的运行结果分类
 */
enum class run_outcome {
    /**
     * @brief 用户程序正常退出（返回值为 0）
     */
    COMPLETED,

    /**
     * @brief 用户程序运行超时并被杀死
     */
    TIMED_OUT,

    /**
     * @brief 用户程序内存超限
     */
    MEMORY_EXCEEDED,

    /**
     * @brief 用户程序以非零返回值退出或者因信号崩溃
     */
    CRASHED,

    /**
     * @brief 用户程序编译失败，没有运行
     */
    COMPILE_ERROR
};

const char *get_display_message(run_outcome);

/**
 * @brief 一次沙箱执行的原始结果
 * 由沙箱执行器产生，产生后不再修改。
 */
struct execution_result {
    std::string sub_id;

    run_outcome outcome = run_outcome::COMPLETED;

    /**
     * @brief 用户程序的标准输出，最多 stdout_capture_limit() 字节
     */
    std::string output;

    /**
     * @brief 用户程序的标准错误输出，最多 OUTPUT_LIMIT 字节
     */
    std::string error;

    /**
     * @brief 编译器的输出，仅在需要编译时有效
     */
    std::string compile_log;

    /**
     * @brief 用户程序的返回值，没有运行时为 -1
     */
    int exitcode = -1;

    /**
     * @brief 导致用户程序终止的信号，没有时为 -1
     */
    int signal = -1;

    /**
     * @brief 时钟时间，单位为秒，没有运行时为 -1
     */
    double wall_time = -1;

    /**
     * @brief 内存使用峰值，单位为字节，没有运行时为 -1
     */
    int64_t memory = -1;

    /**
     * @brief 标准输出是否被截断
     * 标准输出被截断的程序不可能通过评测
     */
    bool output_truncated = false;
};

/**
 * @brief 评测结果，是结果队列中的消息
 * 回调 worker 根据这个结构体通知客户端。
 */
struct judge_result {
    std::string sub_id;

    submission_status status;

    verdict result;

    /**
     * @brief 输出片段：用户程序输出、编译错误信息或者内部错误信息
     */
    std::string output;

    /**
     * @brief 运行时间，单位为秒，没有运行时为 -1
     */
    double run_time = -1;

    /**
     * @brief 内存使用峰值，单位为 KB，没有运行时为 -1
     */
    int64_t memory = -1;

    std::string callback_url;
};

void to_json(nlohmann::json &j, const judge_result &result);
void from_json(const nlohmann::json &j, judge_result &result);

}  // namespace codejudge
