#pragma once

#include <sys/types.h>
#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

namespace grader {

struct cgroup_exception : public std::exception {
    cgroup_exception(std::string cgroup_op, int err);

    const char *what() const noexcept override;

    static void ensure(std::string cgroup_op, int err);

private:
    std::string errmsg;
};

/**
 * @brief 表示一个 cgroup 的 controller
 * 沙箱只使用 memory（限制整个进程组的内存并统计峰值）和 cpuacct 两个 controller
 */
struct cgroup_ctrl {
    struct cgroup_controller *ctrl;

    /**
     * @brief 为 controller 添加设定
     */
    void add_value(const std::string &name, int64_t value);

    int64_t get_value_int64(const std::string &name);
};

/**
 * @brief 创建指定 cgroup 的管理器
 * 在析构时释放内存以确保没有内存泄漏
 */
struct cgroup_guard {
    /**
     * @brief 构造函数，调用 libcgroup 的创建函数
     * @param cgroup_name cgroup 的内核名称
     */
    explicit cgroup_guard(const std::string &cgroup_name);

    cgroup_guard(const cgroup_guard &) = delete;
    cgroup_guard &operator=(const cgroup_guard &) = delete;

    /**
     * @brief 析构函数，调用 libcgroup 的释放函数
     */
    ~cgroup_guard();

    /**
     * @brief 在内核中创建这个 cgroup，并写入 add_controller、add_value 添加的设定
     */
    void create_cgroup(int ignore_ownership);

    /**
     * @brief 创建一个新的 controller
     * @param name 控制器的名称，如 "memory"
     * @throw cgroup_exception 当创建失败时
     */
    cgroup_ctrl add_controller(const std::string &name);

    /**
     * @brief 从 cgroup 中获得已有的 controller
     * @throw cgroup_exception 当 controller 不存在时
     */
    cgroup_ctrl get_controller(const std::string &name);

    /**
     * 从内核中读入 cgroup 的所有信息
     */
    void get_cgroup();

    /**
     * 将进程 pid 移入本 cgroup
     */
    void attach_task(pid_t pid);

    /**
     * @brief 从内核中删除这个 cgroup，进程会被移入上一层的 cgroup
     */
    void delete_cgroup();

    /**
     * @brief 初始化 libcgroup，多次调用只会初始化一次
     */
    static void init();

private:
    struct cgroup *cg;
};

/**
 * @brief 一次运行结束后 cgroup 的统计信息
 */
struct cgroup_usage {
    int64_t max_usage_bytes = 0;
    bool oom_killed = false;
};

/**
 * @brief 为一次运行创建 cgroup，内存和内存+交换的限制都设为 memory_bytes
 */
void cgroup_create(const std::string &name, int64_t memory_bytes);

/**
 * @brief 将进程移入 cgroup
 * 由父进程在 fork 之后、放行子进程之前调用，子进程中不调用 libcgroup
 */
void cgroup_attach(const std::string &name, pid_t pid);

/**
 * @brief 读取内存峰值和 OOM 计数
 */
cgroup_usage cgroup_summarize(const std::string &name);

/**
 * @brief 杀死 cgroup 中剩余的所有进程
 */
void cgroup_kill(const std::string &name);

void cgroup_delete(const std::string &name);

}  // namespace grader
