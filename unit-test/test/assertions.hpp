#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include "gtest/gtest.h"

namespace grader::test {

/**
 * @brief 比较两个 JSON 值，不相等时输出两边的内容和 JSON Patch 形式的差异
 */
inline ::testing::AssertionResult json_equal(const char *actual_expression,
                                             const char *expected_expression,
                                             const nlohmann::json &actual,
                                             const nlohmann::json &expected) {
    if (actual == expected)
        return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << actual_expression << " is:" << std::endl
       << actual.dump(2) << std::endl
       << expected_expression << " is:" << std::endl
       << expected.dump(2) << std::endl
       << "difference:" << std::endl
       << nlohmann::json::diff(actual, expected).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

}  // namespace grader::test

#define EXPECT_JSON_EQ(actual, expected) \
    EXPECT_PRED_FORMAT2(::grader::test::json_equal, actual, expected)
