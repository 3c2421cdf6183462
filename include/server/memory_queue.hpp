#pragma once

#include <chrono>
#include <condition_variable>
#include <list>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "server/message_queue.hpp"

namespace codejudge::server {

/**
 * @brief 进程内的消息队列，写者读者模型
 * 语义与 SQS 一致：
 * 1. 被取出的消息在可见性超时之前没有被确认，会重新回到队列中；
 * 2. 每次取出都会产生新的 receipt，过期的 receipt 无法确认消息；
 * 3. 一条消息被取出超过 max_receives 次后进入死信队列。
 * 用于单机部署和测试。
 */
struct memory_queue : public message_queue {
    /**
     * @param visibility_timeout 可见性超时
     * @param max_receives 最大投递次数，0 表示不限制
     */
    explicit memory_queue(std::chrono::milliseconds visibility_timeout = std::chrono::seconds(30), unsigned max_receives = 0);

    std::string publish(const std::string &body) override;
    bool fetch(delivery &item, std::chrono::milliseconds timeout) override;
    void ack(const delivery &item) override;
    void release(const delivery &item, std::chrono::milliseconds delay) override;

    /**
     * @brief 等待投递的消息数（包括延迟可见的消息）
     */
    std::size_t size();

    /**
     * @brief 已经被取出但还没有确认的消息数
     */
    std::size_t in_flight();

    /**
     * @brief 死信队列中的消息内容
     */
    std::vector<std::string> dead_letters();

private:
    using clock = std::chrono::steady_clock;

    struct message {
        std::string id;
        std::string body;
        unsigned receives = 0;
        clock::time_point visible_at;
    };

    struct lease {
        message msg;
        clock::time_point deadline;
    };

    /**
     * @brief 将可见性超时的消息放回队列
     */
    void restore_expired(clock::time_point now);

    std::chrono::milliseconds visibility_timeout;
    unsigned max_receives;

    std::list<message> waiting;
    std::map<std::string, lease> leases;
    std::vector<message> dead;
    unsigned long next_id = 0, next_receipt = 0;

    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace codejudge::server
