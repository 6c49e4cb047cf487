#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 一道题的运行限制
 * 纯数据，由沙箱读取。限制由监督进程在运行用户代码前设置，用户代码无法修改。
 */
struct limit_policy {
    /**
     * @brief CPU 时间限制，单位为毫秒
     * 内核按秒向上取整设置软限制，到达软限制时发送 SIGXCPU。
     */
    int64_t cpu_time_ms = 1000;

    /**
     * @brief 墙上时间限制，单位为毫秒，不小于 cpu_time_ms
     * 超时后整个进程组会被 SIGKILL。
     */
    int64_t wall_clock_ms = 2000;

    /**
     * @brief 内存限制，单位为字节
     * 启用 cgroup 时限制整个进程组，否则为 RLIMIT_AS。
     */
    int64_t memory_bytes = 256 << 20;

    /**
     * @brief 标准输出和标准错误各自的大小限制，单位为字节
     */
    int64_t max_output_bytes = 64 << 10;

    /**
     * @brief 在安全基线之外额外允许导入的模块
     * 为空表示只允许基线模块
     */
    std::vector<std::string> allowed_modules;

    /**
     * @brief 进程数限制 (RLIMIT_NPROC)
     */
    int max_processes = 1;

    /**
     * @brief 用户代码能写入的单个文件的大小上限，单位为字节 (RLIMIT_FSIZE)
     */
    int64_t max_file_bytes = 1 << 20;
};

/**
 * @brief 检查限制是否合法：所有限制为正数、墙上时间不小于 CPU 时间、模块名合法
 * @throw configuration_error 限制不合法
 */
void validate_limit_policy(const limit_policy &policy);

void from_json(const nlohmann::json &j, limit_policy &policy);

void to_json(nlohmann::json &j, const limit_policy &policy);

}  // namespace grader
