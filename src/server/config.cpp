#include "server/config.hpp"
#include "common/json_utils.hpp"

namespace codejudge::server {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, amqp &mq) {
    j.at("port").get_to(mq.port);
    j.at("exchange").get_to(mq.exchange);
    mq.exchange_type = get_value_def<string>(j, "direct", "exchangeType");
    j.at("hostname").get_to(mq.hostname);
    j.at("queue").get_to(mq.queue);
    mq.routing_key = get_value_def<string>(j, "", "routingKey");
    mq.max_receives = get_value_def<unsigned>(j, 0, "maxReceives");
}

void from_json(const json &j, queue_config &config) {
    if (j.is_string()) {
        config.type = j.get<string>();
        if (config.type != "memory")
            throw invalid_argument("unknown queue type " + config.type);
        return;
    }
    config.type = get_value_def<string>(j, "amqp", "type");
    if (config.type == "memory") {
        config.visibility_timeout = chrono::milliseconds(get_value_def<long>(j, 30000, "visibilityTimeout"));
        config.max_receives = get_value_def<unsigned>(j, 0, "maxReceives");
    } else if (config.type == "amqp") {
        j.get_to(config.broker);
    } else {
        throw invalid_argument("unknown queue type " + config.type);
    }
}

void from_json(const json &j, redis &redis_config) {
    j.at("host").get_to(redis_config.host);
    j.at("port").get_to(redis_config.port);
    redis_config.password = get_value_def<string>(j, "", "password");
    redis_config.retry_interval = get_value_def<unsigned>(j, 1000, "retryInterval");
}

void from_json(const json &j, callback_config &config) {
    config.timeout = get_value_def<long>(j, 5000, "timeout");
    config.batch_size = get_value_def<size_t>(j, 10, "batchSize");
    config.backoff_base = chrono::milliseconds(get_value_def<long>(j, 1000, "backoffBase"));
    config.backoff_max = chrono::milliseconds(get_value_def<long>(j, 60000, "backoffMax"));
    config.poll_timeout = chrono::milliseconds(get_value_def<long>(j, 1000, "pollTimeout"));
    if (config.batch_size == 0 || config.batch_size > 10)
        throw invalid_argument("callback.batchSize should be in [1, 10]");
}

void from_json(const json &j, judge_config &config) {
    config.compare_policy = get_value_def<string>(j, "ignore_trailing_newlines", "comparePolicy");
    config.compile_time_limit = get_value_def<double>(j, 10, "compileTimeLimit");
    config.output_limit = get_value_def<size_t>(j, 1 << 20, "outputLimit");
}

void from_json(const json &j, daemon_config &config) {
    if (j.count("submissionQueue"))
        j.at("submissionQueue").get_to(config.submission_queue);
    else
        config.submission_queue.type = "memory";
    if (j.count("resultQueue"))
        j.at("resultQueue").get_to(config.result_queue);
    else
        config.result_queue.type = "memory";
    if (exists(j, "redis"))
        config.redis_config = j.at("redis").get<redis>();
    if (j.count("callback"))
        j.at("callback").get_to(config.callback);
    if (j.count("judge"))
        j.at("judge").get_to(config.judge);
}

}  // namespace codejudge::server
