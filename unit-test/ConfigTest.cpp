#include "gtest/gtest.h"
#include "server/config.hpp"

using namespace std;
using namespace std::chrono_literals;
using namespace codejudge::server;
using namespace nlohmann;

class ConfigTest : public ::testing::Test {
};

TEST_F(ConfigTest, EmptyConfigUsesMemoryBackends) {
    auto config = json::object().get<daemon_config>();
    EXPECT_EQ(config.submission_queue.type, "memory");
    EXPECT_EQ(config.result_queue.type, "memory");
    EXPECT_FALSE(config.redis_config);
    EXPECT_EQ(config.callback.batch_size, 10u);
    EXPECT_EQ(config.callback.backoff_base, 1000ms);
    EXPECT_EQ(config.judge.compare_policy, "ignore_trailing_newlines");
}

TEST_F(ConfigTest, FullConfig) {
    json j = json::parse(R"({
        "submissionQueue": {
            "hostname": "rabbitmq",
            "port": 5672,
            "exchange": "codejudge",
            "queue": "submissions",
            "routingKey": "submission",
            "maxReceives": 5
        },
        "resultQueue": {"type": "memory", "visibilityTimeout": 5000, "maxReceives": 8},
        "redis": {"host": "redis", "port": 6379, "password": "secret"},
        "callback": {"timeout": 2000, "batchSize": 5, "backoffBase": 500, "backoffMax": 8000},
        "judge": {"comparePolicy": "exact", "compileTimeLimit": 20, "outputLimit": 4096}
    })");
    auto config = j.get<daemon_config>();

    EXPECT_EQ(config.submission_queue.type, "amqp");
    EXPECT_EQ(config.submission_queue.broker.hostname, "rabbitmq");
    EXPECT_EQ(config.submission_queue.broker.port, 5672);
    EXPECT_EQ(config.submission_queue.broker.exchange_type, "direct");
    EXPECT_EQ(config.submission_queue.broker.routing_key, "submission");
    EXPECT_EQ(config.submission_queue.broker.max_receives, 5u);

    EXPECT_EQ(config.result_queue.type, "memory");
    EXPECT_EQ(config.result_queue.visibility_timeout, 5000ms);
    EXPECT_EQ(config.result_queue.max_receives, 8u);

    ASSERT_TRUE(config.redis_config);
    EXPECT_EQ(config.redis_config->host, "redis");
    EXPECT_EQ(config.redis_config->password, "secret");
    EXPECT_EQ(config.redis_config->retry_interval, 1000u);

    EXPECT_EQ(config.callback.timeout, 2000);
    EXPECT_EQ(config.callback.batch_size, 5u);
    EXPECT_EQ(config.callback.backoff_base, 500ms);
    EXPECT_EQ(config.callback.backoff_max, 8000ms);
    EXPECT_EQ(config.callback.poll_timeout, 1000ms);

    EXPECT_EQ(config.judge.compare_policy, "exact");
    EXPECT_DOUBLE_EQ(config.judge.compile_time_limit, 20);
    EXPECT_EQ(config.judge.output_limit, 4096u);
}

TEST_F(ConfigTest, InvalidConfig) {
    EXPECT_THROW(json::parse(R"({"submissionQueue": "kafka"})").get<daemon_config>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"resultQueue": {"type": "sqs"}})").get<daemon_config>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"callback": {"batchSize": 11}})").get<daemon_config>(), invalid_argument);
    EXPECT_THROW(json::parse(R"({"callback": {"timeout": "5s"}})").get<daemon_config>(), invalid_argument);
    EXPECT_ANY_THROW(json::parse(R"({"redis": {"host": "redis"}})").get<daemon_config>());
}
