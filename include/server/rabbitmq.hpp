#pragma once

#include <chrono>
#include <mutex>
#include "SimpleAmqpClient/SimpleAmqpClient.h"
#include "server/config.hpp"
#include "server/message_queue.hpp"

namespace codejudge::server {

/**
 * @brief 消息头中记录投递次数的键
 */
extern const char *ATTEMPT_HEADER;

/**
 * @brief 计算消息是第几次投递
 * 通过 release 重新发送的消息在 ATTEMPT_HEADER 中记录了次数，
 * broker 因为消费者断开而重新投递的消息再加一次。
 */
unsigned delivery_attempt(const AmqpClient::BasicMessage::ptr_t &message, bool redelivered);

/**
 * @brief 构造 release 时重新发送的消息
 * 消息内容和属性与原消息相同，ATTEMPT_HEADER 为 next_attempt
 */
AmqpClient::BasicMessage::ptr_t make_retry_message(const AmqpClient::BasicMessage::ptr_t &message, unsigned next_attempt);

/**
 * @brief 与 AMQP 消息队列交互的类
 * 队列和 Exchange 都是持久化的，消息以持久化模式发送，消费者手动确认消息。
 * 每个队列还有两个辅助队列：
 * 1. <queue>.delay：没有消费者，消息过期后通过默认 Exchange 回到 <queue>，用来实现延迟重试
 * 2. <queue>.dead：超过最大投递次数的消息
 * Channel 不是线程安全的，每个 worker 线程应当持有独立的 rabbitmq 对象。
 */
struct rabbitmq : public message_queue {
    /**
     * @param amqp 消息队列配置
     * @param write 真时只发送消息，否则同时监听队列
     * @param prefetch 未确认消息的最大数量，提交队列为 1，结果队列为批大小
     */
    rabbitmq(const amqp &amqp, bool write, uint16_t prefetch = 1);

    std::string publish(const std::string &body) override;
    bool fetch(delivery &item, std::chrono::milliseconds timeout) override;
    void ack(const delivery &item) override;

    /**
     * @brief 将消息的副本发送到延迟队列，delay 之后重新投递，再确认原消息
     * 达到最大投递次数的消息被发送到死信队列。
     * 延迟队列只有队首的消息会过期，延迟较短的消息可能要等待排在前面的消息。
     */
    void release(const delivery &item, std::chrono::milliseconds delay) override;

private:
    void connect();
    void send(const std::string &routing_key, const AmqpClient::BasicMessage::ptr_t &message);

    std::string delay_queue() const { return queue.queue + ".delay"; }
    std::string dead_queue() const { return queue.queue + ".dead"; }

    AmqpClient::Channel::ptr_t channel;
    std::string tag;
    codejudge::server::amqp queue;
    bool write;
    uint16_t prefetch;
    std::mutex mut;
};

}  // namespace codejudge::server
