#pragma once

#include <chrono>
#include <string>

namespace grader {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 根据用户名查找用户 id
 * @return 用户 id，不存在时返回 -1
 */
int get_userid(const char *name);

/**
 * @brief 根据组名查找组 id
 * @return 组 id，不存在时返回 -1
 */
int get_groupid(const char *name);

/**
 * @brief 生成一个随机的唯一标识，用于命名临时目录和 cgroup
 */
std::string random_id();

/**
 * @brief 计时器，从构造时开始计时
 * 使用单调时钟，不受系统时间调整影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

private:
    std::chrono::steady_clock::time_point start;
};

}  // namespace grader
