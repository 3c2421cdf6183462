#pragma once

#include <string>

bool is_number(const std::string &s);

/**
 * @brief 根据用户名查找用户 id
 * @return 用户不存在时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 根据组名查找组 id
 * @return 组不存在时返回 -1
 */
int get_groupid(const char *name);

/**
 * @brief 给 lowfd 及以上的所有文件描述符设置 FD_CLOEXEC
 * 用户程序 exec 后不会继承评测系统打开的文件和 socket，exec 之前这些描述符仍然可用
 * @throw std::system_error 如果无法枚举或修改文件描述符
 */
void set_cloexec_from(int lowfd);
