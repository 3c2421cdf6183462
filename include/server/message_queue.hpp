#pragma once

#include <any>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codejudge::server {

/**
 * @brief 从消息队列中取出的一条消息
 * 在调用 ack 之前，消息仍然属于队列：如果处理者崩溃或者调用 release，
 * 消息会重新变得可见并再次投递（至少一次投递）。
 */
struct delivery {
    /**
     * @brief 消息内容，为 JSON 字符串
     */
    std::string body;

    /**
     * @brief 第几次投递这条消息，从 1 开始
     */
    unsigned attempt = 1;

    /**
     * @brief 具体队列实现用来确认消息的句柄
     * memory_queue 为 receipt 字符串，rabbitmq 为 Envelope::ptr_t
     */
    std::any handle;
};

/**
 * @brief 持久化的、至少一次投递的消息队列
 */
struct message_queue {
    virtual ~message_queue();

    /**
     * @brief 发送一条消息
     * @return 消息的 id
     * @throw queue_error 如果消息无法发送
     */
    virtual std::string publish(const std::string &body) = 0;

    /**
     * @brief 取出一条消息，如果队列为空则阻塞等待直到有消息或者超时为止
     * @param item 取出的消息
     * @param timeout 等待时间
     * @return 是否取到了消息
     */
    virtual bool fetch(delivery &item, std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 取出至多 max_count 条消息
     * 阻塞等待直到有至少一条消息或者超时为止，然后不再等待地取出剩下的消息。
     */
    virtual std::vector<delivery> fetch_batch(std::size_t max_count, std::chrono::milliseconds timeout);

    /**
     * @brief 确认消息已经处理完成，消息将从队列中删除
     */
    virtual void ack(const delivery &item) = 0;

    /**
     * @brief 放弃处理消息，消息在 delay 之后重新可见
     */
    virtual void release(const delivery &item, std::chrono::milliseconds delay) = 0;
};

/**
 * @brief 以 JSON 序列化 T 的消息队列包装
 * T 需要支持 nlohmann::json 的 to_json 和 from_json
 */
template <typename T>
struct typed_queue {
    explicit typed_queue(message_queue &queue) : queue(queue) {}

    std::string enqueue(const T &value) {
        nlohmann::json j = value;
        return queue.publish(j.dump());
    }

    /**
     * @brief 取出一条消息并反序列化
     * @return 是否取到了消息
     * @throw nlohmann::json::exception 如果消息无法解析，此时 item 仍然有效，调用者需要决定如何确认
     */
    bool dequeue_one(T &value, delivery &item, std::chrono::milliseconds timeout) {
        if (!queue.fetch(item, timeout)) return false;
        value = nlohmann::json::parse(item.body).get<T>();
        return true;
    }

    void ack(const delivery &item) {
        queue.ack(item);
    }

    void release(const delivery &item, std::chrono::milliseconds delay) {
        queue.release(item, delay);
    }

    message_queue &underlying() { return queue; }

private:
    message_queue &queue;
};

}  // namespace codejudge::server
