#pragma once

#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "judge/exercise.hpp"
#include "judge/result.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 一次评测的测试点游标
 * 每次调用 next 只运行一个测试点，调用方可以在任意两个测试点之间停止。
 * 引用的沙箱、题目和取消标记必须比游标活得更久。
 */
struct harness_run {
    harness_run(sandbox &box, const exercise &ex, std::string code, const cancellation_token &cancellation);

    /**
     * @brief 运行下一个测试点
     * @param verdict 输出参数，测试点的评测结果
     * @return 是否运行了一个测试点；所有测试点已经运行完、评测被中止或被取消时返回 false
     */
    bool next(test_verdict &verdict);

    /**
     * @brief 评测是否在运行完所有测试点之前停止
     */
    bool truncated() const;

    /**
     * @brief 是否因为连续的内部错误而中止
     */
    bool infrastructure_failed() const;

    bool cancelled() const;

private:
    sandbox &box;
    const exercise &ex;
    std::string code;
    const cancellation_token &cancellation;
    size_t position = 0;
    int consecutive_internal_errors = 0;
    bool aborted = false;
};

/**
 * @brief 按顺序对每个测试点调用沙箱，比较输出并生成评测结果
 */
struct test_harness {
    explicit test_harness(sandbox &box);

    /**
     * @brief 开始评测
     * @return 惰性求值的测试点游标
     */
    harness_run run(const exercise &ex, const std::string &code, const cancellation_token &cancellation) const;

private:
    sandbox &box;
};

/**
 * @brief 根据一次沙箱运行生成测试点的评测结果
 */
test_verdict make_verdict(const exercise &ex, const test_case &kase, sandbox_run run);

}  // namespace grader
