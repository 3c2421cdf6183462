#pragma once

#include <string>
#include "common/status.hpp"
#include "judge/submission.hpp"

namespace codejudge {

/**
 * @brief 比较用户输出和标准输出的规则
 */
enum class compare_policy {
    /**
     * @brief 逐字节比较
     */
    EXACT,

    /**
     * @brief 忽略输出末尾的换行，行末空格仍然需要一致
     */
    IGNORE_TRAILING_NEWLINES,

    /**
     * @brief 忽略每行行末的空白字符和文末空行
     */
    IGNORE_TRAILING_WHITESPACE,

    /**
     * @brief 忽略整个输出首尾的空白字符
     */
    IGNORE_SURROUNDING_WHITESPACE
};

/**
 * @brief 默认的比较规则为 IGNORE_TRAILING_NEWLINES
 */
extern compare_policy DEFAULT_COMPARE_POLICY;

/**
 * @brief 解析比较规则的名称，如 "ignore_trailing_newlines"
 * @throw std::invalid_argument 如果名称不合法
 */
compare_policy parse_compare_policy(const std::string &name);

const char *get_display_message(compare_policy);

/**
 * @brief 按照比较规则比较用户输出和标准输出
 * 除 EXACT 外的规则都会先将 "\r\n" 转换为 "\n"。
 */
bool outputs_match(const std::string &expected, const std::string &actual, compare_policy policy);

/**
 * @brief 根据运行结果得到评测结果
 * 运行超时、内存超限、崩溃、编译错误直接对应 TLE、MLE、RE、CE，
 * 正常退出时比较输出得到 AC 或 WA。该函数没有副作用，也不会抛出异常，
 * 出错时返回 INTERNAL_ERROR。
 */
verdict evaluate(const execution_result &result, const std::string &expected_output, compare_policy policy) noexcept;

verdict evaluate(const execution_result &result, const std::string &expected_output) noexcept;

}  // namespace codejudge
