#pragma once

#include <string>

namespace grader {

/**
 * @brief 比较实际输出和期望输出的方式，对整道题生效
 */
enum class comparator_kind {
    /**
     * @brief 逐字节比较，比较前两侧各去掉一个末尾换行符
     */
    EXACT_TEXT,

    /**
     * @brief 将连续空白字符合并为一个空格，并去掉首尾空白后比较
     */
    WHITESPACE_NORMALIZED,

    /**
     * @brief 两侧按空白切分为浮点数，逐个在误差范围内比较
     * 数量不同或出现非数字的记号时判为不通过
     */
    NUMERIC_TOLERANCE,

    /**
     * @brief 两侧解析为 JSON 后深度比较，对象的键顺序无关
     * 实际输出无法解析时判为不通过
     */
    STRUCTURED
};

/**
 * @brief 一次比较的结果
 */
struct comparison {
    bool equal = false;

    /**
     * @brief 第一处差异的简短描述，相等时为空
     */
    std::string diff_summary;
};

/**
 * @brief 比较实际输出和期望输出
 * @param kind 比较方式
 * @param expected 期望输出
 * @param actual 实际输出
 * @param tolerance 数值比较的相对误差，其他比较方式忽略
 */
comparison compare_output(comparator_kind kind, const std::string &expected, const std::string &actual, double tolerance);

/**
 * @brief 解析比较方式的名字：exact、whitespace、numeric、json
 * @throw configuration_error 未知的名字
 */
comparator_kind parse_comparator_kind(const std::string &name);

const char *get_comparator_name(comparator_kind kind);

/**
 * @brief 将连续空白字符合并为一个空格，并去掉首尾空白
 */
std::string normalize_whitespace(const std::string &text);

}  // namespace grader
