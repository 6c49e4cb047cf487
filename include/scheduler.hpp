#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "common/cancellation.hpp"
#include "common/status.hpp"
#include "judge/exercise.hpp"
#include "judge/result.hpp"
#include "sandbox/sandbox.hpp"

/**
 * 评测调度相关的类型
 *
 * 调度器持有固定数量的 worker 线程和一个有界的全局 FIFO 队列。
 * 提交时在一把锁内完成准入控制：队列已满，或同一调用方排队中和运行中的请求数
 * 已达上限时立即拒绝，而不是无限排队。准入控制不做任何 IO。
 *
 * 每个 worker 从队首取出最早的请求，在当前线程按顺序运行所有测试点，
 * 运行完一个请求后再取下一个。
 */
namespace grader {

struct scheduler_state;

/**
 * @brief 调度器的规模
 */
struct scheduler_options {
    /**
     * @brief worker 线程数，即同时运行的评测数
     */
    size_t workers = 4;

    /**
     * @brief 排队中请求数的上限
     */
    size_t queue_depth = 64;

    /**
     * @brief 同一调用方排队中和运行中的请求数之和的上限
     */
    size_t per_caller_limit = 1;
};

/**
 * @brief 一个被接受的评测请求
 * 调用方通过票据等待结果或者取消请求
 */
struct grading_ticket {
    uint64_t id() const;

    const std::string &caller_id() const;

    request_state state() const;

    /**
     * @brief 阻塞直到评测结束
     * @return 评测结果，被取消的请求返回 CANCELLED 且没有测试点结果
     */
    grading_result wait() const;

    /**
     * @brief 最多等待 timeout
     * @return 评测是否已经结束
     */
    bool wait_for(std::chrono::milliseconds timeout) const;

    /**
     * @brief 取消请求
     * 排队中的请求直接从队列中移除；运行中的请求会立即杀死当前的沙箱进程，
     * 结果为 CANCELLED 而不是部分得分。
     * @return 请求是否处于可以取消的状态；已经结束或调度器已经析构时返回 false
     */
    bool cancel();

private:
    friend struct grading_scheduler;
    friend struct scheduler_state;

    grading_ticket(std::string caller_id, std::shared_ptr<const exercise> ex, std::string code,
                   std::weak_ptr<scheduler_state> owner);

    uint64_t id_ = 0;
    std::string caller_id_;
    std::shared_ptr<const exercise> ex;
    std::string code;
    cancellation_token cancellation;
    std::atomic<request_state> state_{request_state::QUEUED};
    std::promise<grading_result> promise;
    std::shared_future<grading_result> future;
    std::weak_ptr<scheduler_state> owner;
};

/**
 * @brief 评测调度器
 */
struct grading_scheduler {
    /**
     * @brief 启动 worker 线程
     * @param box 所有 worker 共享的沙箱，必须可以被并发调用
     * @throw configuration_error 规模参数为 0
     */
    explicit grading_scheduler(std::shared_ptr<sandbox> box, scheduler_options options = {});

    grading_scheduler(const grading_scheduler &) = delete;
    grading_scheduler &operator=(const grading_scheduler &) = delete;

    /**
     * @brief 停止调度器，见 stop()
     */
    ~grading_scheduler();

    /**
     * @brief 提交评测请求，只在准入控制期间阻塞
     * @param ex 题目，提交时检查
     * @param code 用户代码
     * @param caller_id 调用方，用于限制同一调用方的并发请求数
     * @return 请求的票据
     * @throw configuration_error 题目不合法
     * @throw rejection_error 队列已满、调用方请求过多或调度器已停止
     */
    std::shared_ptr<grading_ticket> submit(std::shared_ptr<const exercise> ex, std::string code,
                                           const std::string &caller_id);

    /**
     * @brief 提交并等待评测结果
     * @throw configuration_error 题目不合法
     * @throw rejection_error 准入控制拒绝
     */
    grading_result grade(std::shared_ptr<const exercise> ex, std::string code, const std::string &caller_id);

    /**
     * @brief 取消请求，与 grading_ticket::cancel 相同
     */
    bool cancel(grading_ticket &ticket);

    /**
     * @brief 停止接受请求，取消所有排队中的请求，等待运行中的请求结束后回收 worker 线程
     * 可以重复调用
     */
    void stop();

    /**
     * @brief 排队中的请求数
     */
    size_t queued() const;

    /**
     * @brief 调用方排队中和运行中的请求数
     */
    size_t in_flight(const std::string &caller_id) const;

private:
    std::shared_ptr<scheduler_state> state;
    std::shared_ptr<sandbox> box;
    std::vector<std::thread> workers;
};

}  // namespace grader
