#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace codejudge {

/**
 * @brief 用户程序编译及运行的根目录
 * 每个提交在评测时都会分配一个独立的工作区，评测结束后工作区将被删除。
 * RUN_DIR 的文件结构如下：
 *
 * RUN_DIR // 0711，用户程序无法列出工作区
 * ├── 7c9e6679-7425-40de-944b-e07fc1f90ae7 // 随机生成的 uuid，每次评测都不同，0711
 * │   ├── compile // 源代码和编译产物，也是用户程序的工作目录和 HOME，属于运行用户，0700
 * │   │   ├── main.cpp // 用户程序的源代码（示例）
 * │   │   └── program // 编译产物（示例）
 * │   └── run // 属于 root，0700，用户程序无法读写
 * │       ├── testdata.in // 用户程序的 stdin 输入
 * │       ├── program.out // 用户程序的 stdout 输出
 * │       ├── program.err // 用户程序的 stderr 输出
 * │       ├── compile.out // 编译器的输出
 * │       ├── compile.meta // 编译器的运行信息
 * │       └── program.meta // 用户程序的运行信息
 * └── ...
 *
 * 如果设置了 CHROOT_DIR，那么 RUN_DIR 必须位于 CHROOT_DIR 内。
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 配置好的 chroot 路径
 * 为空时不进行 chroot，此时用户程序可以看到宿主机的文件系统（仍然受到用户权限限制）
 */
extern std::filesystem::path CHROOT_DIR;

/**
 * @brief runguard 可执行文件的路径
 */
extern std::filesystem::path RUNGUARD;

/**
 * @brief 运行用户程序的用户，默认为 nobody
 * 为空时 runguard 不切换用户，此时评测系统必须以非 root 身份运行
 */
extern std::string RUN_USER;

/**
 * @brief 运行用户程序的用户组，为空时为 RUN_USER 的主用户组
 */
extern std::string RUN_GROUP;

/**
 * @brief 编译时间限制，单位为秒
 */
extern double COMPILE_TIME_LIMIT;

/**
 * @brief 编译内存限制，单位为 KB
 */
extern int64_t COMPILE_MEMORY_LIMIT;

/**
 * @brief 用户程序输出的截断长度，单位为字节
 * runguard 只会保存 stderr 的前 OUTPUT_LIMIT 个字节，stdout 多保存少量余量，
 * 期望输出的长度不能超过 OUTPUT_LIMIT
 */
extern std::size_t OUTPUT_LIMIT;

/**
 * @brief 评测报告中输出片段的最大长度，单位为字节
 */
extern std::size_t REPORT_OUTPUT_LIMIT;

/**
 * @brief 提交没有指定时间限制时的默认值，单位为秒
 */
extern double DEFAULT_TIME_LIMIT;

/**
 * @brief 提交没有指定内存限制时的默认值，单位为 KB
 */
extern int64_t DEFAULT_MEMORY_LIMIT;

/**
 * @brief 提交允许的最大时间限制，单位为秒
 */
extern double MAX_TIME_LIMIT;

/**
 * @brief 提交允许的最大内存限制，单位为 KB
 */
extern int64_t MAX_MEMORY_LIMIT;

/**
 * @brief 源代码的最大长度，单位为字节
 */
extern std::size_t MAX_SOURCE_SIZE;

/**
 * @brief 标准输入的最大长度，单位为字节
 */
extern std::size_t MAX_DATA_SIZE;

/**
 * @brief 用户程序允许同时存在的最大进程（线程）数
 * Java 和 Go 的运行时会创建较多线程，因此不能设得太小
 */
extern int PROC_LIMIT;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测系统将不再检查程序是否在特权模式下执行，
 * 并且不会删除产生的工作区，以便手动检查测试产生的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace codejudge
