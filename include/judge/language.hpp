#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 支持的编程语言
 */
enum class language {
    C,
    CPP,
    PYTHON,
    JAVA,
    JAVASCRIPT,
    GO
};

/**
 * @brief 描述一种语言如何编译和运行
 * 命令和环境变量中可以使用以下占位符，执行前会被替换：
 * {source}: 源代码文件路径
 * {executable}: 编译产物路径
 * {workdir}: 编译目录
 * {memory_mb}: 内存限制，单位为 MB，用于限制 JVM、V8 的堆大小
 */
struct language_profile {
    /**
     * @brief 源代码文件名，如 main.cpp
     * Java 要求文件名与公共类名一致，因此为 Solution.java
     */
    std::string source_file;

    /**
     * @brief 编译命令，为空表示该语言不需要编译（解释执行）
     */
    std::vector<std::string> compile_command;

    /**
     * @brief 运行命令
     */
    std::vector<std::string> run_command;

    /**
     * @brief 编译和运行时额外添加的环境变量
     */
    std::map<std::string, std::string> environment;

    /**
     * @brief 运行时输出到 stderr 的内存不足标记，如 java.lang.OutOfMemoryError
     * 为空表示该语言没有这种标记
     */
    std::string out_of_memory_marker;

    bool compiled() const { return !compile_command.empty(); }
};

/**
 * @brief 解析语言标签，支持别名（c++、py、js、golang）
 * @throw std::invalid_argument 如果语言不被支持
 */
language parse_language(const std::string &tag);

/**
 * @brief 语言的标准标签，如 "cpp"
 */
const char *get_language_tag(language lang);

const language_profile &get_language_profile(language lang);

/**
 * @brief 替换 text 中的占位符
 * @param variables 占位符名称（不含花括号）到值的映射
 */
std::string expand_placeholders(const std::string &text, const std::map<std::string, std::string> &variables);

void to_json(nlohmann::json &j, const language &lang);
void from_json(const nlohmann::json &j, language &lang);

}  // namespace codejudge
