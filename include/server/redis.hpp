#pragma once

#include <cpp_redis/cpp_redis>
#include <functional>
#include <future>
#include <mutex>
#include <vector>
#include "server/config.hpp"
#include "server/state_store.hpp"

namespace codejudge::server {

/**
 * @brief 表示一个 Redis 连接
 */
struct redis_conn {
    /**
     * @brief 根据 Redis 配置初始化 Redis 服务器连接
     */
    void init(const redis &redis_config) noexcept;

    /**
     * @brief 在 callback 内发送 Redis 的操作
     * 该函数负责确保 Redis 连接会被建立。
     * 如果 Redis 服务器主动断开连接，那么这个函数将尝试重新创建连接，
     * 如果重试次数过多则抛出异常。
     * @param callback 你可以在 callback 内完成 Redis 的操作，并将操作的 future 放入 replies
     * @return 按顺序排列的所有操作的结果
     * @throw store_error 如果重试多次后仍然失败
     */
    std::vector<cpp_redis::reply> execute(std::function<void(cpp_redis::client &, std::vector<std::future<cpp_redis::reply>> &)> callback);

    /**
     * @brief 尝试重连
     * @param force 真时强制重连
     */
    void reconnect(bool force = false);

private:
    redis redis_config;
    cpp_redis::client redis_client;
};

/**
 * @brief 以 Redis 为后端的提交状态存储
 * 每条记录以 JSON 形式保存在键 submission:<id> 中。
 * create 使用 SET NX 保证提交 id 唯一，transition 使用 Lua 脚本在服务端
 * 原子地比较状态并改写记录。
 */
struct redis_state_store : public state_store {
    explicit redis_state_store(const redis &redis_config);

    bool create(const submission_record &record) override;
    bool transition(const std::string &sub_id, submission_status from, submission_status to,
                    const std::optional<completion> &done = std::nullopt) override;
    std::optional<submission_record> get(const std::string &sub_id) override;

    static std::string key_of(const std::string &sub_id);

private:
    // cpp_redis::client 不能被多个线程同时提交操作
    std::mutex mut;
    redis_conn conn;
};

}  // namespace codejudge::server
