#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "common/status.hpp"

namespace codejudge::server {

/**
 * @brief 提交状态存储中的一条记录
 * 记录在提交被接收时以 QUEUED 状态创建，永远不会被自动删除。
 */
struct submission_record {
    std::string sub_id;

    submission_status status = submission_status::QUEUED;

    /**
     * @brief 评测结果，只有终止状态的记录才有评测结果
     */
    std::optional<verdict> result;

    std::string language;

    std::string callback_url;

    /**
     * @brief 输出片段：用户程序输出、编译错误信息或者内部错误信息
     */
    std::string output;

    /**
     * @brief 运行时间，单位为秒，没有运行时为 -1
     */
    double run_time = -1;

    /**
     * @brief 内存使用峰值，单位为 KB，没有运行时为 -1
     */
    int64_t memory = -1;

    time_t created_at = 0;
    time_t started_at = 0;
    time_t finished_at = 0;
};

void to_json(nlohmann::json &j, const submission_record &record);
void from_json(const nlohmann::json &j, submission_record &record);

/**
 * @brief 转移到终止状态时写入的评测结果
 */
struct completion {
    verdict result;
    std::string output;
    double run_time = -1;
    int64_t memory = -1;
};

/**
 * @brief 提交状态存储
 * 存储是提交状态的唯一可信来源，所有写操作都是条件更新。
 */
struct state_store {
    virtual ~state_store();

    /**
     * @brief 创建一条记录
     * @return 如果提交 id 已经存在，返回 false 且不修改已有记录
     * @throw store_error 如果存储出错
     */
    virtual bool create(const submission_record &record) = 0;

    /**
     * @brief 比较并交换提交状态
     * 只有当记录当前状态为 from 时才转移到 to，并写入时间戳和评测结果。
     * 转移到 RUNNING 时写入 started_at，转移到终止状态时写入 finished_at。
     * @param done 转移到终止状态时必须提供评测结果
     * @return 是否成功转移。记录不存在或者状态不是 from 时返回 false
     * @throw std::invalid_argument 如果 from -> to 不是合法的状态转移
     * @throw store_error 如果存储出错
     */
    virtual bool transition(const std::string &sub_id, submission_status from, submission_status to,
                            const std::optional<completion> &done = std::nullopt) = 0;

    /**
     * @brief 读取记录
     * @return 记录不存在时返回 std::nullopt
     * @throw store_error 如果存储出错
     */
    virtual std::optional<submission_record> get(const std::string &sub_id) = 0;
};

/**
 * @brief 检查状态转移的参数
 * @throw std::invalid_argument 如果状态转移不合法，或者转移到终止状态时没有提供评测结果
 */
void check_transition(submission_status from, submission_status to, const std::optional<completion> &done);

/**
 * @brief 将状态转移的结果应用到记录上
 */
void apply_transition(submission_record &record, submission_status to, const std::optional<completion> &done, time_t now);

/**
 * @brief 进程内的提交状态存储，用于单机部署和测试
 */
struct memory_state_store : public state_store {
    bool create(const submission_record &record) override;
    bool transition(const std::string &sub_id, submission_status from, submission_status to,
                    const std::optional<completion> &done = std::nullopt) override;
    std::optional<submission_record> get(const std::string &sub_id) override;

private:
    std::mutex mut;
    std::map<std::string, submission_record> records;
};

}  // namespace codejudge::server
