#pragma once

#include <cstdint>
#include <string>
#include "common/cancellation.hpp"
#include "common/status.hpp"
#include "sandbox/limit_policy.hpp"

namespace grader {

/**
 * @brief 沙箱中一次运行的记录
 * 由测试器消费后丢弃，评测引擎不持久化它。
 */
struct sandbox_run {
    exit_status status = exit_status::INTERNAL_ERROR;

    /**
     * @brief 标准输出，超过 max_output_bytes 的部分被丢弃
     */
    std::string stdout_data;

    /**
     * @brief 标准错误，超过 max_output_bytes 的部分被丢弃
     */
    std::string stderr_data;

    /**
     * @brief 从启动进程到回收进程的墙上时间，单位为毫秒
     */
    int64_t duration_ms = 0;

    /**
     * @brief 内存使用峰值（尽力而为），单位为字节
     */
    int64_t peak_memory_bytes = 0;

    /**
     * @brief 进程返回值，被信号终止时为 -1
     */
    int exit_code = -1;

    /**
     * @brief 终止进程的信号，正常退出时为 0
     */
    int signal = 0;
};

/**
 * @brief 隔离执行一段代码的沙箱
 * 实现必须可以被多个线程同时调用，每次调用互不共享临时目录和环境。
 */
struct sandbox {
    virtual ~sandbox() = default;

    /**
     * @brief 在 policy 的限制下运行一次代码
     * 返回前保证进程已经被回收，临时目录已经被删除。
     * 不会阻塞超过 wall_clock_ms 加上宽限时间。
     * @param code 用户代码
     * @param input 标准输入
     * @param policy 运行限制
     * @param cancellation 被设置时立即杀死进程组并返回 CANCELLED
     * @return 运行记录，沙箱自身出错时状态为 INTERNAL_ERROR
     */
    virtual sandbox_run execute(const std::string &code, const std::string &input,
                                const limit_policy &policy, const cancellation_token &cancellation) = 0;
};

}  // namespace grader
