#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "judge/comparator.hpp"
#include "sandbox/limit_policy.hpp"

namespace grader {

/**
 * @brief 测试点的运行方式
 */
enum class test_case_mode {
    /**
     * @brief input 作为标准输入传给程序
     */
    STDIN,

    /**
     * @brief input 是一段 Python 代码（例如 print(add(2, 3))），附加到用户代码末尾执行
     * 此时标准输入为空
     */
    FUNCTION_CALL
};

/**
 * @brief 一个测试点
 */
struct test_case {
    std::string id;

    /**
     * @brief 展示给用户的名字，默认与 id 相同
     */
    std::string name;

    test_case_mode mode = test_case_mode::STDIN;

    std::string input;

    std::string expected_output;

    /**
     * @brief 本测试点的分值，非负，所有测试点之和为 TOTAL_WEIGHT
     */
    int weight = 0;

    /**
     * @brief 隐藏测试点照常运行，但实际输出、差异和标准错误都不会返回给调用方
     */
    bool is_hidden = false;
};

/**
 * @brief 一道题，评测引擎只读取不修改
 */
struct exercise {
    std::string id;

    /**
     * @brief 初始代码，仅供展示
     */
    std::string source_template;

    std::vector<test_case> test_cases;

    limit_policy limits;

    comparator_kind comparator = comparator_kind::EXACT_TEXT;

    /**
     * @brief 数值比较的相对误差，对整道题的所有测试点生效
     */
    double numeric_tolerance = 1e-6;

    /**
     * @brief 从 JSON 读入题目并检查
     * @throw configuration_error 题目格式错误或不满足约束
     */
    static exercise from_json(const nlohmann::json &j);
};

/**
 * @brief 检查题目是否满足约束
 * 至少一个测试点、测试点 id 唯一、权重非负且之和为 TOTAL_WEIGHT、限制合法，
 * 使用 JSON 比较时所有期望输出必须是合法的 JSON。
 * @throw configuration_error 不满足约束
 */
void validate_exercise(const exercise &ex);

/**
 * @brief 生成某个测试点实际运行的代码
 * 函数调用模式下在用户代码之后附加测试片段
 */
std::string assemble_program(const test_case &kase, const std::string &code);

/**
 * @brief 生成某个测试点的标准输入
 */
std::string program_input(const test_case &kase);

void to_json(nlohmann::json &j, const exercise &ex);

}  // namespace grader
