#pragma once

namespace grader {

/**
 * @brief 表示沙箱中一次运行的结束状态
 */
enum class exit_status {
    /**
     * @brief 程序在所有限制内正常退出，且返回值为 0
     * 没有任何输出也属于正常退出。
     */
    NORMAL = 0,

    /**
     * @brief 程序因为超出墙上时间或 CPU 时间限制被杀死
     */
    KILLED_TIMEOUT = 1,

    /**
     * @brief 程序因为超出内存限制被杀死，或者因为无法分配内存而退出
     */
    KILLED_MEMORY = 2,

    /**
     * @brief 程序的标准输出或标准错误超过了输出大小限制
     */
    KILLED_OUTPUT_OVERFLOW = 3,

    /**
     * @brief 程序返回值非 0，包括未捕获的异常和被拒绝的操作
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 沙箱监督进程自身出错，与用户代码无关
     */
    INTERNAL_ERROR = 5,

    /**
     * @brief 评测请求被取消，程序被强制终止
     */
    CANCELLED = 6
};

/**
 * @brief 表示整个提交的评测结果
 */
enum class grading_status {
    /**
     * @brief 所有测试点均通过
     */
    PASSED = 0,

    /**
     * @brief 没有任何测试点通过
     */
    FAILED = 1,

    /**
     * @brief 部分测试点通过
     */
    PARTIAL = 2,

    /**
     * @brief 评测系统连续出现内部错误，评测被提前中止
     * 此时的分数不代表学生代码的质量。
     */
    INFRASTRUCTURE_ERROR = 3,

    /**
     * @brief 评测请求被调用方取消
     */
    CANCELLED = 4
};

/**
 * @brief 表示评测请求在调度器中的状态
 * 状态只会按 QUEUED -> RUNNING -> {COMPLETED | CANCELLED} 或 QUEUED -> CANCELLED 转移。
 * 被准入控制拒绝的请求不会获得票据。
 */
enum class request_state {
    QUEUED = 0,
    RUNNING = 1,
    COMPLETED = 2,
    CANCELLED = 3
};

/**
 * @brief 获得运行状态的展示文本，例如 "Time Limit Exceeded"
 */
const char *get_display_message(exit_status stat);

/**
 * @brief 获得评测结果的展示文本
 */
const char *get_display_message(grading_status stat);

/**
 * @brief 获得运行状态在 JSON 中的名字，例如 "killed_timeout"
 */
const char *get_status_name(exit_status stat);

/**
 * @brief 获得评测结果在 JSON 中的名字，例如 "infrastructure_error"
 */
const char *get_status_name(grading_status stat);

const char *get_state_name(request_state state);

}  // namespace grader
