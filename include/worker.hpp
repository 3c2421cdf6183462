#pragma once

#include <chrono>
#include <optional>
#include <thread>
#include "judge/sandbox.hpp"
#include "judge/verdict.hpp"
#include "server/callback.hpp"
#include "server/message_queue.hpp"
#include "server/state_store.hpp"

/**
 * 评测服务相关函数
 * 评测系统启动时开启若干个评测 worker 和回调 worker。
 *
 * 每个评测 worker 独占一个 judge_pipeline，循环从提交队列中取出一个提交，
 * 在状态存储中把提交标记为 RUNNING，然后编译、运行、比较输出，最后以条件更新
 * 写入终止状态，并把评测结果放入结果队列。只有当结果成功写入存储并放入结果队列
 * 后才确认提交队列中的消息，因此 worker 崩溃后提交会被重新投递。
 *
 * 重复投递的提交：
 * 1. 记录已经是终止状态：重新把存储中的评测结果放入结果队列，不再评测
 * 2. 记录是 RUNNING：之前的 worker 崩溃了，重新评测，写入终止状态时由条件更新决定唯一的评测结果
 * 3. 其他 worker 抢先把记录标记为 RUNNING：确认消息并跳过
 *
 * 回调 worker 循环从结果队列中批量取出评测结果并通知客户端。
 */
namespace codejudge {

/**
 * @brief 停止所有的 worker
 * 调用该函数后，将 worker 状态标记为停止。worker 在完成当前的提交后退出。
 */
void stop_workers();

/**
 * @brief worker 是否已经被要求停止
 */
bool workers_stopped();

/**
 * @brief 一个提交的评测流水线：领取、编译运行、评测、写入存储、发送结果
 */
struct judge_pipeline {
    judge_pipeline(server::message_queue &submissions, server::message_queue &results,
                   server::state_store &store, executor &exec, compare_policy policy);

    /**
     * @brief 从提交队列中取出一个提交并评测
     * @return 是否取到了提交
     */
    bool run_once(std::chrono::milliseconds poll_timeout);

    /**
     * @brief 评测一个提交
     * @return 是否可以确认提交队列中的消息。返回 false 时消息需要重新投递
     */
    bool process(const submission &submit);

    /**
     * @brief 编译运行并评测，不修改存储
     * 评测系统出错时评测结果为 INTERNAL_ERROR，状态为 FAILED。
     */
    judge_result judge(const submission &submit);

private:
    bool claim(const submission &submit);
    void publish(const judge_result &result);

    server::typed_queue<submission> submissions;
    server::typed_queue<judge_result> results;
    server::state_store &store;
    executor &exec;
    compare_policy policy;
};

/**
 * @brief 根据状态存储中的终止记录还原评测结果
 */
judge_result make_judge_result(const server::submission_record &record);

/**
 * @brief 启动评测 worker 线程
 * @param worker_id worker 的编号，用于日志
 * @param pipeline worker 独占的评测流水线
 * @param core_id worker 运行的 CPU 核心，为空表示不设置 CPU 亲和性
 * @return 产生的线程
 */
std::thread start_worker(std::size_t worker_id, judge_pipeline &pipeline, std::optional<std::size_t> core_id = std::nullopt);

/**
 * @brief 启动回调 worker 线程
 */
std::thread start_callback_worker(std::size_t worker_id, server::callback_worker &worker);

}  // namespace codejudge
