#pragma once

#include <nlohmann/json.hpp>
#include <sstream>
#include "gtest/gtest.h"

namespace grader {

/**
 * @brief 比较两个 JSON 值，不相等时输出两侧的值以及 JSON Patch 形式的差异
 * 数值按 nlohmann::json 的规则比较，因此 55 与 55.0 相等
 */
inline ::testing::AssertionResult json_equal(const char *lhs_expression, const char *rhs_expression,
                                             const nlohmann::json &lhs, const nlohmann::json &rhs) {
    if (lhs == rhs) return ::testing::AssertionSuccess();

    std::stringstream ss;
    ss << std::endl
       << "      Expected: " << lhs_expression << std::endl
       << lhs.dump(2) << std::endl
       << "To be equal to: " << rhs_expression << std::endl
       << rhs.dump(2) << std::endl
       << "    Difference: " << std::endl
       << nlohmann::json::diff(lhs, rhs).dump(2);
    return ::testing::AssertionFailure() << ss.str();
}

}  // namespace grader

#define EXPECT_JSON_EQ(obj1, obj2) EXPECT_PRED_FORMAT2(::grader::json_equal, obj1, obj2)

#define ASSERT_JSON_EQ(obj1, obj2) ASSERT_PRED_FORMAT2(::grader::json_equal, obj1, obj2)
