#include <chrono>
#include <nlohmann/json.hpp>
#include "gtest/gtest.h"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/exercise.hpp"
#include "sandbox/process_sandbox.hpp"
#include "scheduler.hpp"
#include "test/python_support.hpp"
#include "test/sample_exercise.hpp"
using namespace std;
using namespace nlohmann;
using namespace grader;

/**
 * 使用真实的 Python 沙箱完成整个评测流程
 */
class GraderTest : public ::testing::Test {
protected:
    static unique_ptr<grading_scheduler> scheduler;

    static void SetUpTestCase() {
        scheduler_options options;
        options.workers = 2;
        options.per_caller_limit = 1;
        scheduler = make_unique<grading_scheduler>(make_shared<process_sandbox>(), options);
    }

    static void TearDownTestCase() {
        scheduler.reset();
    }

    void SetUp() override {
        if (auto &reason = test::python_sandbox_unavailable()) GTEST_SKIP() << *reason;
    }

    static grading_result grade(const exercise &ex, const string &code) {
        return scheduler->grade(test::share(ex), code, "grader-test");
    }
};

unique_ptr<grading_scheduler> GraderTest::scheduler;

TEST_F(GraderTest, AcceptedTest) {
    grading_result result = grade(test::sum_exercise(), "a, b = input().split('+')\nprint(int(a) + int(b))\n");
    EXPECT_EQ(result.overall_status, grading_status::PASSED);
    EXPECT_EQ(result.score, 100);
    EXPECT_EQ(result.max_score, 100);
    EXPECT_FALSE(result.truncated);
}

TEST_F(GraderTest, WrongAnswerTest) {
    grading_result result = grade(test::sum_exercise(), "print(4 if input() == '2+2' else 6)\n");
    EXPECT_EQ(result.overall_status, grading_status::PARTIAL);
    EXPECT_EQ(result.score, 50);
    ASSERT_EQ(result.verdicts.size(), 2);
    EXPECT_TRUE(result.verdicts[0].passed);
    EXPECT_FALSE(result.verdicts[1].passed);
    EXPECT_EQ(*result.verdicts[1].actual_output, "6\n");
}

TEST_F(GraderTest, TimeLimitExceededTest) {
    exercise ex = test::uniform_exercise("loop", 1);
    elapsed_time timer;
    grading_result result = grade(ex, "while True:\n    pass\n");

    EXPECT_EQ(result.overall_status, grading_status::FAILED);
    EXPECT_EQ(result.score, 0);
    ASSERT_EQ(result.verdicts.size(), 1);
    EXPECT_EQ(result.verdicts[0].run.status, exit_status::KILLED_TIMEOUT);
    EXPECT_LT(timer.duration<chrono::milliseconds>().count(), 4000);
}

TEST_F(GraderTest, RuntimeErrorTracebackRedactedTest) {
    grading_result result = grade(test::sum_exercise(), "print(1 / 0)\n");
    EXPECT_EQ(result.overall_status, grading_status::FAILED);
    ASSERT_EQ(result.verdicts.size(), 2);
    EXPECT_EQ(result.verdicts[0].error_message, "ZeroDivisionError: division by zero");
    EXPECT_EQ(result.verdicts[0].run.stderr_data.find(SCRATCH_DIR.string()), string::npos)
        << result.verdicts[0].run.stderr_data;
}

TEST_F(GraderTest, FunctionCallTest) {
    json j = R"json({
        "id": "add",
        "comparator": "numeric",
        "test_cases": [
            {"id": "ints", "mode": "function_call", "input": "print(add(2, 3))", "expected_output": "5", "weight": 50},
            {"id": "floats", "mode": "function_call", "input": "print(add(0.1, 0.2))", "expected_output": "0.3", "weight": 50, "hidden": true}
        ]
    })json"_json;
    grading_result result = grade(exercise::from_json(j), "def add(a, b):\n    return a + b\n");
    EXPECT_EQ(result.overall_status, grading_status::PASSED);
    EXPECT_EQ(result.score, 100);
    EXPECT_FALSE(result.verdicts[1].actual_output);
}

TEST_F(GraderTest, IdempotentTest) {
    string code = "print(4 if input() == '2+2' else 6)\n";
    grading_result first = grade(test::sum_exercise(), code);
    grading_result second = grade(test::sum_exercise(), code);
    EXPECT_EQ(first.score, second.score);
    EXPECT_EQ(first.overall_status, second.overall_status);
    ASSERT_EQ(first.verdicts.size(), second.verdicts.size());
    for (size_t i = 0; i < first.verdicts.size(); ++i)
        EXPECT_EQ(first.verdicts[i].passed, second.verdicts[i].passed);
}

TEST_F(GraderTest, ResultJsonTest) {
    grading_result result = grade(test::sum_exercise(), "a, b = input().split('+')\nprint(int(a) + int(b))\n");
    json j = result;
    EXPECT_EQ(j["overall_status"], "passed");
    EXPECT_EQ(j["verdicts"][0]["sandbox_run"]["exit_status"], "normal");
    EXPECT_TRUE(j["first_failure"].is_null());
    EXPECT_NO_THROW(j.dump(-1, ' ', false, json::error_handler_t::replace));
}
