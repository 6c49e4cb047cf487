#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "judge/aggregator.hpp"
#include "judge/harness.hpp"
#include "test/fake_sandbox.hpp"
#include "test/sample_exercise.hpp"
using namespace std;
using namespace grader;

class HarnessTest : public ::testing::Test {
protected:
    struct collected {
        vector<test_verdict> verdicts;
        bool truncated;
        bool infrastructure_failed;
        bool cancelled;
    };

    static collected run_all(sandbox &box, const exercise &ex, const string &code,
                             const cancellation_token &cancellation) {
        test_harness harness(box);
        harness_run run = harness.run(ex, code, cancellation);
        collected result;
        test_verdict verdict;
        while (run.next(verdict))
            result.verdicts.push_back(verdict);
        result.truncated = run.truncated();
        result.infrastructure_failed = run.infrastructure_failed();
        result.cancelled = run.cancelled();
        return result;
    }

    static grading_result grade(sandbox &box, const exercise &ex, const string &code = "print(eval(input()))") {
        cancellation_token cancellation;
        collected c = run_all(box, ex, code, cancellation);
        harness_outcome outcome;
        outcome.truncated = c.truncated;
        outcome.infrastructure_error = c.infrastructure_failed;
        outcome.cancelled = c.cancelled;
        return aggregate(ex, c.verdicts, outcome, 0);
    }
};

TEST_F(HarnessTest, AcceptedTest) {
    test::fake_sandbox box([](const string &, const string &input, const cancellation_token &) {
        return test::evaluate_sum(input);
    });
    grading_result result = grade(box, test::sum_exercise());

    EXPECT_EQ(result.overall_status, grading_status::PASSED);
    EXPECT_EQ(result.score, 100);
    EXPECT_EQ(result.verdicts.size(), 2);
    EXPECT_EQ(box.calls(), 2);
}

TEST_F(HarnessTest, WrongAnswerTest) {
    test::fake_sandbox box([](const string &, const string &input, const cancellation_token &) {
        return test::normal_run(input == "2+2" ? "4\n" : "6\n");
    });
    grading_result result = grade(box, test::sum_exercise());

    EXPECT_EQ(result.overall_status, grading_status::PARTIAL);
    EXPECT_EQ(result.score, 50);
    EXPECT_TRUE(result.verdicts[0].passed);
    EXPECT_FALSE(result.verdicts[1].passed);
    EXPECT_EQ(*result.verdicts[1].actual_output, "6\n");
}

TEST_F(HarnessTest, RuntimeErrorContinuesTest) {
    test::fake_sandbox box([](const string &, const string &input, const cancellation_token &) {
        if (input == "2+2")
            return test::failed_run(exit_status::RUNTIME_ERROR,
                                    "Traceback (most recent call last):\n  File \"main.py\", line 1\n"
                                    "ZeroDivisionError: division by zero\n");
        return test::evaluate_sum(input);
    });
    grading_result result = grade(box, test::sum_exercise());

    ASSERT_EQ(result.verdicts.size(), 2);
    EXPECT_EQ(result.verdicts[0].run.status, exit_status::RUNTIME_ERROR);
    EXPECT_EQ(result.verdicts[0].error_message, "ZeroDivisionError: division by zero");
    EXPECT_EQ(*result.verdicts[0].diff_summary, "Runtime Error");
    EXPECT_TRUE(result.verdicts[1].passed);
    EXPECT_EQ(result.score, 50);
}

TEST_F(HarnessTest, TimeLimitExceededTest) {
    test::fake_sandbox box([](const string &, const string &, const cancellation_token &) {
        sandbox_run run = test::failed_run(exit_status::KILLED_TIMEOUT);
        run.stdout_data = "4\n";
        return run;
    });
    grading_result result = grade(box, test::sum_exercise());

    EXPECT_EQ(result.overall_status, grading_status::FAILED);
    EXPECT_FALSE(result.verdicts[0].passed);
    EXPECT_EQ(result.verdicts[0].error_message, "Time Limit Exceeded");
}

TEST_F(HarnessTest, ConsecutiveInternalErrorsAbortTest) {
    test::fake_sandbox box([](const string &, const string &, const cancellation_token &) {
        return test::failed_run(exit_status::INTERNAL_ERROR);
    });
    exercise ex = test::uniform_exercise("broken", 5);
    cancellation_token cancellation;
    collected c = run_all(box, ex, "print(1)", cancellation);

    EXPECT_EQ(c.verdicts.size(), (size_t)MAX_CONSECUTIVE_INTERNAL_ERRORS);
    EXPECT_EQ(box.calls(), MAX_CONSECUTIVE_INTERNAL_ERRORS);
    EXPECT_TRUE(c.truncated);
    EXPECT_TRUE(c.infrastructure_failed);
    EXPECT_FALSE(c.cancelled);

    grading_result result = grade(box, ex);
    EXPECT_EQ(result.overall_status, grading_status::INFRASTRUCTURE_ERROR);
    EXPECT_TRUE(result.truncated);
}

TEST_F(HarnessTest, InterleavedInternalErrorsDoNotAbortTest) {
    test::fake_sandbox box([](const string &, const string &input, const cancellation_token &) {
        if (input == "3+0") return test::evaluate_sum(input);
        return test::failed_run(exit_status::INTERNAL_ERROR);
    });
    exercise ex = test::uniform_exercise("flaky", 5);
    cancellation_token cancellation;
    collected c = run_all(box, ex, "print(1)", cancellation);

    EXPECT_EQ(c.verdicts.size(), 5);
    EXPECT_FALSE(c.truncated);
    EXPECT_FALSE(c.infrastructure_failed);
    EXPECT_TRUE(c.verdicts[2].passed);
}

TEST_F(HarnessTest, SandboxExceptionIsInternalErrorTest) {
    test::fake_sandbox box([](const string &, const string &input, const cancellation_token &) -> sandbox_run {
        if (input == "2+2") throw sandbox_error("unable to create scratch directory");
        return test::evaluate_sum(input);
    });
    grading_result result = grade(box, test::sum_exercise());

    ASSERT_EQ(result.verdicts.size(), 2);
    EXPECT_EQ(result.verdicts[0].run.status, exit_status::INTERNAL_ERROR);
    EXPECT_EQ(result.verdicts[0].error_message, "Internal Error");
    EXPECT_TRUE(result.verdicts[1].passed);
    EXPECT_EQ(result.overall_status, grading_status::PARTIAL);
}

TEST_F(HarnessTest, LazyEvaluationTest) {
    test::fake_sandbox box([](const string &, const string &input, const cancellation_token &) {
        return test::evaluate_sum(input);
    });
    exercise ex = test::sum_exercise();
    cancellation_token cancellation;
    test_harness harness(box);
    harness_run run = harness.run(ex, "print(eval(input()))", cancellation);
    EXPECT_EQ(box.calls(), 0);

    test_verdict verdict;
    ASSERT_TRUE(run.next(verdict));
    EXPECT_EQ(verdict.test_case_id, "t1");
    EXPECT_EQ(box.calls(), 1);
    ASSERT_TRUE(run.next(verdict));
    EXPECT_EQ(verdict.test_case_id, "t2");
    EXPECT_FALSE(run.next(verdict));
    EXPECT_EQ(box.calls(), 2);
}

TEST_F(HarnessTest, CancellationStopsRunTest) {
    cancellation_token cancellation;
    test::fake_sandbox box([&](const string &, const string &input, const cancellation_token &) {
        cancellation.cancel();
        return test::evaluate_sum(input);
    });
    exercise ex = test::uniform_exercise("cancelled", 4);
    collected c = run_all(box, ex, "print(1)", cancellation);

    EXPECT_EQ(c.verdicts.size(), 1);
    EXPECT_EQ(box.calls(), 1);
    EXPECT_TRUE(c.cancelled);
    EXPECT_TRUE(c.truncated);
    EXPECT_FALSE(c.infrastructure_failed);
}

TEST_F(HarnessTest, FunctionCallModeTest) {
    exercise ex = test::sum_exercise();
    ex.test_cases[0].mode = test_case_mode::FUNCTION_CALL;
    ex.test_cases[0].input = "print(add(2, 2))";

    test::fake_sandbox box([](const string &code, const string &input, const cancellation_token &) {
        if (input.empty() && code.find("print(add(2, 2))") != string::npos)
            return test::normal_run("4\n");
        return test::evaluate_sum(input);
    });
    grading_result result = grade(box, ex, "def add(a, b):\n    return a + b\n");

    EXPECT_EQ(result.score, 100);
    vector<string> executed = box.executed();
    ASSERT_EQ(executed.size(), 2);
    EXPECT_EQ(executed[0], "def add(a, b):\n    return a + b\n\nprint(add(2, 2))\n");
    EXPECT_EQ(executed[1], "def add(a, b):\n    return a + b\n");
}

TEST_F(HarnessTest, IdempotentGradingTest) {
    test::fake_sandbox box([](const string &, const string &input, const cancellation_token &) {
        return test::normal_run(input == "2+2" ? "4\n" : "6\n");
    });
    exercise ex = test::sum_exercise();
    grading_result first = grade(box, ex), second = grade(box, ex);

    EXPECT_EQ(first.score, second.score);
    EXPECT_EQ(first.overall_status, second.overall_status);
    EXPECT_EQ(first.first_failure, second.first_failure);
}
