#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "judge/submission.hpp"
#include "server/message_queue.hpp"
#include "server/state_store.hpp"

namespace codejudge::server {

/**
 * @brief 接收提交后返回给客户端的确认
 */
struct intake_ack {
    std::string sub_id;

    /**
     * @brief 提交队列中消息的 id
     */
    std::string token;
};

/**
 * @brief 校验客户端发来的提交，并解析为 submission
 * 提交格式为 {submissionId?, language, sourceCode, input?, expectedOutput, callbackUrl?, timeLimit?, memoryLimit?}
 * 没有 submissionId 时生成随机 uuid，没有时间、内存限制时使用默认值。
 * @throw invalid_submission 如果提交不合法
 */
submission parse_submission(const nlohmann::json &payload);

/**
 * @brief 提交的入口
 * 负责校验提交、在状态存储中以 QUEUED 创建记录、将提交放入提交队列。
 */
struct intake {
    intake(state_store &store, message_queue &submission_queue);

    /**
     * @brief 接收一个提交
     * @throw invalid_submission 如果提交不合法
     * @throw duplicate_submission 如果提交 id 已经存在
     * @throw store_error 如果状态存储出错
     * @throw queue_error 如果提交无法放入提交队列
     */
    intake_ack accept(const nlohmann::json &payload);

private:
    state_store &store;
    typed_queue<submission> queue;
};

}  // namespace codejudge::server
