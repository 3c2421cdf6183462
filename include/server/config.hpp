#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace codejudge::server {

/**
 * @brief 描述一个 AMQP 消息队列的配置数据结构
 */
struct amqp {
    /**
     * @brief AMQP 消息队列的主机地址
     */
    std::string hostname;

    /**
     * @brief AMQP 消息队列的主机端口
     */
    int port;

    /**
     * @brief 通过该结构体发送的消息的 Exchange 名
     */
    std::string exchange;

    /**
     * @brief Exchange 类型，可选 direct, topic, fanout
     */
    std::string exchange_type;

    /**
     * @brief AMQP 消息队列的队列名
     */
    std::string queue;

    /**
     * @brief AMQP 消息队列的 Routing Key
     */
    std::string routing_key;

    /**
     * @brief 最大投递次数，超过后消息进入死信队列 <queue>.dead，0 表示不限制
     */
    unsigned max_receives = 0;
};

void from_json(const nlohmann::json &j, amqp &mq);

/**
 * @brief 描述一个消息队列的配置
 * 配置文件中的值为 "memory" 时使用进程内的队列，否则为 AMQP 的配置
 */
struct queue_config {
    /**
     * @brief "memory" 或 "amqp"
     */
    std::string type;

    amqp broker;

    /**
     * @brief 进程内队列的可见性超时，单位为毫秒
     * 被取出但没有确认的消息在超时后重新可见
     */
    std::chrono::milliseconds visibility_timeout{30000};

    /**
     * @brief 进程内队列的最大投递次数，超过后消息进入死信队列，0 表示不限制
     */
    unsigned max_receives = 0;
};

void from_json(const nlohmann::json &j, queue_config &config);

/**
 * redis 的登录情况
 */
struct redis {
    /**
     * @brief redis 服务器地址
     */
    std::string host;

    /**
     * @brief redis 服务器端口
     */
    int port;

    /**
     * @brief 重试时间间隔，单位毫秒
     */
    unsigned retry_interval;

    /**
     * @brief 密码，若不为空，则使用该密码登录
     */
    std::string password;
};

void from_json(const nlohmann::json &j, redis &redis_config);

/**
 * @brief 回调 worker 的配置
 */
struct callback_config {
    /**
     * @brief 一次 HTTP 请求的超时时间，单位为毫秒
     */
    long timeout = 5000;

    /**
     * @brief 一次从结果队列中取出的最大消息数
     */
    std::size_t batch_size = 10;

    /**
     * @brief 回调失败后第一次重试的延迟，单位为毫秒
     */
    std::chrono::milliseconds backoff_base{1000};

    /**
     * @brief 回调失败后重试延迟的上限，单位为毫秒
     */
    std::chrono::milliseconds backoff_max{60000};

    /**
     * @brief 从结果队列中拉取消息的等待时间，单位为毫秒
     */
    std::chrono::milliseconds poll_timeout{1000};
};

void from_json(const nlohmann::json &j, callback_config &config);

/**
 * @brief 评测相关的配置，会覆盖 config.hpp 中的默认值
 */
struct judge_config {
    std::string compare_policy = "ignore_trailing_newlines";

    double compile_time_limit = 10;

    std::size_t output_limit = 1 << 20;
};

void from_json(const nlohmann::json &j, judge_config &config);

/**
 * @brief 评测系统的部署配置，由 --config 指定的 JSON 文件读取
 */
struct daemon_config {
    queue_config submission_queue;

    queue_config result_queue;

    /**
     * @brief 为空时使用进程内的状态存储
     */
    std::optional<redis> redis_config;

    callback_config callback;

    judge_config judge;
};

void from_json(const nlohmann::json &j, daemon_config &config);

}  // namespace codejudge::server
