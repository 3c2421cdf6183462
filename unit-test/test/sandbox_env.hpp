#pragma once

namespace codejudge {

/**
 * @brief 初始化测试使用的全局配置
 * RUN_DIR 为临时文件夹中的 codejudge-test，RUNGUARD 为构建出的 runguard，
 * 设置了 DEBUG 环境变量时保留工作区。
 */
void setup_test_environment();

void teardown_test_environment();

/**
 * @brief 当前环境能否运行 runguard
 * 需要 root 权限、cgroup v1 的 memory 控制器以及构建出的 runguard
 */
bool sandbox_available();

/**
 * @brief 检查外部命令是否在 PATH 中
 */
bool command_available(const char *name);

}  // namespace codejudge
