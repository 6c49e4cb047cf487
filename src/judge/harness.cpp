#include "judge/harness.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;

test_verdict make_verdict(const exercise &ex, const test_case &kase, sandbox_run run) {
    test_verdict verdict;
    verdict.test_case_id = kase.id;
    verdict.name = kase.name.empty() ? kase.id : kase.name;
    verdict.weight = kase.weight;
    verdict.is_hidden = kase.is_hidden;
    verdict.actual_output = run.stdout_data;

    if (run.status == exit_status::NORMAL) {
        comparison cmp = compare_output(ex.comparator, kase.expected_output, run.stdout_data, ex.numeric_tolerance);
        verdict.passed = cmp.equal;
        verdict.diff_summary = cmp.diff_summary;
        if (!cmp.equal) verdict.error_message = "Wrong Answer";
    } else {
        // 运行失败时不比较输出
        verdict.passed = false;
        verdict.diff_summary = get_display_message(run.status);
        string reason = run.status == exit_status::RUNTIME_ERROR ? last_line(run.stderr_data) : "";
        verdict.error_message = reason.empty() ? get_display_message(run.status) : reason;
    }

    verdict.points_earned = verdict.passed ? kase.weight : 0;
    verdict.run = move(run);
    return verdict;
}

harness_run::harness_run(sandbox &box, const exercise &ex, string code, const cancellation_token &cancellation)
    : box(box), ex(ex), code(move(code)), cancellation(cancellation) {}

bool harness_run::next(test_verdict &verdict) {
    if (aborted || position >= ex.test_cases.size() || cancellation.is_cancelled())
        return false;

    const test_case &kase = ex.test_cases[position++];
    sandbox_run run;
    try {
        run = box.execute(assemble_program(kase, code), program_input(kase), ex.limits, cancellation);
    } catch (exception &e) {
        LOG(ERROR) << "exercise " << ex.id << ", test case " << kase.id << ": sandbox threw: " << e.what();
        run = sandbox_run();
        run.status = exit_status::INTERNAL_ERROR;
    }

    if (run.status == exit_status::INTERNAL_ERROR) {
        if (++consecutive_internal_errors >= MAX_CONSECUTIVE_INTERNAL_ERRORS) {
            LOG(ERROR) << "exercise " << ex.id << ": " << consecutive_internal_errors
                       << " consecutive internal errors, aborting remaining test cases";
            aborted = true;
        }
    } else {
        consecutive_internal_errors = 0;
    }

    verdict = make_verdict(ex, kase, move(run));
    return true;
}

bool harness_run::truncated() const {
    return aborted || (position < ex.test_cases.size() && cancellation.is_cancelled());
}

bool harness_run::infrastructure_failed() const {
    return aborted;
}

bool harness_run::cancelled() const {
    return cancellation.is_cancelled();
}

test_harness::test_harness(sandbox &box) : box(box) {}

harness_run test_harness::run(const exercise &ex, const string &code, const cancellation_token &cancellation) const {
    return harness_run(box, ex, code, cancellation);
}

}  // namespace grader
