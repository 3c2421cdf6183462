#pragma once

#include <chrono>
#include <ctime>
#include <nlohmann/json.hpp>
#include <string>
#include "judge/submission.hpp"
#include "server/config.hpp"
#include "server/message_queue.hpp"

namespace codejudge::server {

/**
 * @brief 一次回调的记录，只用于日志和计算重试延迟
 */
struct callback_attempt {
    std::string sub_id;

    std::string url;

    /**
     * @brief 第几次尝试回调，从 1 开始
     */
    unsigned attempt = 1;

    bool success = false;

    /**
     * @brief HTTP 状态码，网络错误时为 0
     */
    long http_status = 0;

    /**
     * @brief 网络错误的信息
     */
    std::string error;

    time_t timestamp = 0;
};

/**
 * @brief 发送 HTTP 回调
 */
struct callback_sender {
    virtual ~callback_sender();

    /**
     * @brief 向 url 发送内容为 body 的 POST 请求
     * @return HTTP 状态码
     * @throw network_error 如果请求没有得到响应（连接失败、超时等）
     */
    virtual long post(const std::string &url, const std::string &body) = 0;
};

/**
 * @brief 通过 libcurl 发送回调，不跟随重定向
 * 调用者需要在启动时调用 curl_global_init。
 */
struct curl_callback_sender : public callback_sender {
    /**
     * @param timeout 连接和整个请求的超时时间，单位为毫秒
     */
    explicit curl_callback_sender(long timeout);

    long post(const std::string &url, const std::string &body) override;

private:
    long timeout;
};

/**
 * @brief 回调请求体 {submissionId, status, verdict, output?, time?, memory?}
 */
nlohmann::json build_callback_body(const judge_result &result);

/**
 * @brief 第 attempt 次回调失败后的重试延迟
 * delay = min(backoff_base * 2^(attempt-1), backoff_max)
 */
std::chrono::milliseconds backoff_delay(unsigned attempt, const callback_config &config);

/**
 * @brief 回调 worker
 * 从结果队列中批量取出评测结果，逐个回调客户端。
 * 回调返回 2xx 时确认消息，否则放回队列等待重新投递，每条消息的失败互不影响。
 * 客户端需要根据 submissionId 去重。
 */
struct callback_worker {
    callback_worker(message_queue &results, callback_sender &sender, const callback_config &config);

    /**
     * @brief 取出一批评测结果并回调
     * @return 本次处理的消息数
     */
    std::size_t run_once();

    /**
     * @brief 回调一条评测结果，不会抛出异常
     */
    callback_attempt deliver(const judge_result &result, unsigned attempt);

private:
    void handle(const delivery &item);

    typed_queue<judge_result> results;
    callback_sender &sender;
    callback_config config;
};

}  // namespace codejudge::server
