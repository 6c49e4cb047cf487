#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace grader {

/**
 * @brief 评测引擎所有异常的基类
 * 构造时记录调用栈，便于在日志中定位问题
 */
struct grader_exception : std::exception {
    grader_exception();
    explicit grader_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const grader_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示题目配置错误
 * 例如测试点权重之和不为 100、限制非正数、JSON 格式的期望输出无法解析。
 * 该错误在执行任何代码之前抛出，只会反馈给题目作者。
 */
struct configuration_error : public grader_exception {
    configuration_error();
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 表示准入控制拒绝了评测请求
 * 调用方应当稍后重试，被拒绝的请求不会进入队列
 */
struct rejection_error : public grader_exception {
    enum class reason {
        QUEUE_FULL,    ///< 全局队列已满
        CALLER_LIMIT,  ///< 同一调用方在途的请求数已达上限
        STOPPED        ///< 调度器已经停止
    };

    rejection_error(reason why, const std::string &message);

    reason why() const noexcept;

private:
    reason why_;
};

/**
 * @brief 表示沙箱监督进程自身的故障
 * 例如无法 fork、无法创建管道或临时目录。与学生代码的错误区分开。
 */
struct sandbox_error : public grader_exception {
    sandbox_error();
    explicit sandbox_error(const std::string &message);
};

}  // namespace grader
