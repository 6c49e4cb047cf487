#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "judge/exercise.hpp"
#include "judge/result.hpp"

namespace grader {

/**
 * @brief 测试器结束时的状态
 */
struct harness_outcome {
    bool truncated = false;
    bool infrastructure_error = false;
    bool cancelled = false;
};

/**
 * @brief 将所有测试点的结果归约为最终结果，不做任何 IO
 *
 * 得分为通过的测试点的权重之和。取消和基础设施错误直接传递，
 * 否则全部通过为 PASSED，全部未通过为 FAILED，其余为 PARTIAL。
 * 隐藏测试点的实际输出、差异、标准输出和标准错误在这里被删除，
 * 所有文本中以 scratch_prefixes 开头的临时目录路径被替换为 <sandbox>。
 *
 * @param ex 题目，用于确定哪些测试点是隐藏的
 * @param verdicts 按测试点顺序排列的结果
 * @param outcome 测试器结束时的状态
 * @param total_duration_ms 整个评测的耗时
 * @param scratch_prefixes 由 scratch_path_prefixes 预先计算的临时目录写法
 */
grading_result aggregate(const exercise &ex, std::vector<test_verdict> verdicts,
                         const harness_outcome &outcome, int64_t total_duration_ms,
                         const std::vector<std::string> &scratch_prefixes = {});

/**
 * @brief 临时目录可能的写法：配置的路径、绝对路径、解析符号链接后的路径，较长的在前
 * 需要访问文件系统，调度器启动时计算一次
 */
std::vector<std::string> scratch_path_prefixes(const std::filesystem::path &scratch_dir);

/**
 * @brief 将文本中的临时目录路径连同 /run-<uuid> 替换为 <sandbox>
 */
std::string redact_sandbox_paths(const std::string &text, const std::vector<std::string> &prefixes);

}  // namespace grader
