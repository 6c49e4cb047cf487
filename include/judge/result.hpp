#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 一个测试点的评测结果
 */
struct test_verdict {
    std::string test_case_id;

    std::string name;

    bool passed = false;

    int weight = 0;

    /**
     * @brief 本测试点的得分，通过时为 weight，否则为 0
     */
    int points_earned = 0;

    bool is_hidden = false;

    /**
     * @brief 实际输出，隐藏测试点没有这个字段
     */
    std::optional<std::string> actual_output;

    /**
     * @brief 第一处差异的描述，隐藏测试点没有这个字段
     */
    std::optional<std::string> diff_summary;

    /**
     * @brief 未通过的原因，例如 Python 异常的最后一行
     * 隐藏测试点只给出运行状态的展示文本
     */
    std::string error_message;

    /**
     * @brief 沙箱运行记录，隐藏测试点的标准输出和标准错误会被清空
     */
    sandbox_run run;
};

/**
 * @brief 一次评测的最终结果，构造后不再修改
 */
struct grading_result {
    std::string exercise_id;

    grading_status overall_status = grading_status::FAILED;

    /**
     * @brief 通过的测试点的权重之和
     */
    int score = 0;

    int max_score = 0;

    std::vector<test_verdict> verdicts;

    /**
     * @brief 第一个未通过的测试点
     */
    std::optional<std::string> first_failure;

    int64_t total_duration_ms = 0;

    /**
     * @brief 所有运行中内存使用的最大值
     */
    int64_t peak_memory_bytes = 0;

    /**
     * @brief 评测是否被提前中止
     */
    bool truncated = false;

    /**
     * @brief 给用户看的总结
     */
    std::string message;
};

void to_json(nlohmann::json &j, const sandbox_run &run);

void to_json(nlohmann::json &j, const test_verdict &verdict);

void to_json(nlohmann::json &j, const grading_result &result);

}  // namespace grader
