#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace codejudge {

struct judge_exception : std::exception {
    judge_exception();
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    template <typename T>
    judge_exception operator<<(const T &t) const {
        return judge_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 一般是 runguard 启动失败、工作区无法创建等问题，
 * 此时提交的评测结果为 Internal Error
 */
struct internal_error : public judge_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示网络错误，通常由 CURL 产生
 */
struct network_error : public judge_exception {
    network_error();
    explicit network_error(const std::string &message);
};

/**
 * @brief 表示提交状态存储的读写错误
 * 抛出该异常时，状态存储中的记录没有被修改
 */
struct store_error : public judge_exception {
    store_error();
    explicit store_error(const std::string &message);
};

/**
 * @brief 表示消息队列的错误，比如连接 broker 失败
 */
struct queue_error : public judge_exception {
    queue_error();
    explicit queue_error(const std::string &message);
};

/**
 * @brief 表示提交的内容不合法，应当拒绝这个提交
 */
struct invalid_submission : public judge_exception {
    invalid_submission();
    explicit invalid_submission(const std::string &message);
};

/**
 * @brief 表示提交 id 已经存在
 */
struct duplicate_submission : public invalid_submission {
    explicit duplicate_submission(const std::string &sub_id);
};

}  // namespace codejudge
