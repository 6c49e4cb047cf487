#pragma once

#include <cstdint>

namespace grader {

/**
 * @brief 子进程在 exec 之前需要设置的所有限制
 * 由父进程在 fork 之前准备好，子进程中只读取
 */
struct child_restrictions {
    int64_t cpu_time_ms = 0;
    int64_t memory_bytes = 0;
    int64_t max_file_bytes = 0;
    int max_processes = 0;
    int max_open_files = 64;

    /**
     * @brief 父进程已将子进程移入 cgroup，由 cgroup 限制内存，否则由 RLIMIT_AS 限制
     */
    bool memory_in_cgroup = false;

    int user_id = -1;
    int group_id = -1;
    bool isolate_network = true;
};

/**
 * @brief 设置当前进程的资源限制、网络命名空间和用户
 * 只能在 fork 出的子进程中调用
 * @throw std::system_error 设置失败
 */
void set_restrictions(const child_restrictions &opt);

/**
 * @brief 加载 seccomp 过滤器
 * 默认允许所有系统调用，拒绝网络、调试、挂载、命名空间和离开进程组相关的系统调用（返回 EACCES）。
 * 以打开的目录文件描述符为基准的写入、创建、改名和删除同样被拒绝。
 * 必须在 setsid 之后调用。
 * @throw std::runtime_error libseccomp 调用失败
 */
void set_seccomp();

}  // namespace grader
