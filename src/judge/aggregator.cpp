#include "judge/aggregator.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include "config.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

static const char *SANDBOX_PLACEHOLDER = "<sandbox>";

vector<string> scratch_path_prefixes(const fs::path &scratch_dir) {
    set<string> prefixes;
    error_code ec;
    for (const fs::path &path : {scratch_dir, fs::absolute(scratch_dir, ec), fs::weakly_canonical(scratch_dir, ec)}) {
        string prefix = path.string();
        while (prefix.size() > 1 && prefix.back() == '/') prefix.pop_back();
        if (prefix.size() > 1) prefixes.insert(prefix);
    }
    vector<string> result(prefixes.begin(), prefixes.end());
    // 较长的前缀优先匹配
    sort(result.begin(), result.end(), [](const string &a, const string &b) { return a.size() > b.size(); });
    return result;
}

string redact_sandbox_paths(const string &text, const vector<string> &prefixes) {
    string result = text;
    for (auto &prefix : prefixes) {
        size_t pos = 0;
        while ((pos = result.find(prefix, pos)) != string::npos) {
            size_t end = pos + prefix.size();
            // 连同 /run-<uuid> 一起替换
            if (result.compare(end, 5, "/run-") == 0) {
                end += 5;
                while (end < result.size() && (isxdigit((unsigned char)result[end]) || result[end] == '-'))
                    ++end;
            }
            result.replace(pos, end - pos, SANDBOX_PLACEHOLDER);
            pos += char_traits<char>::length(SANDBOX_PLACEHOLDER);
        }
    }
    return result;
}

static bool is_hidden_test(const exercise &ex, const test_verdict &verdict) {
    if (verdict.is_hidden) return true;
    for (auto &kase : ex.test_cases)
        if (kase.id == verdict.test_case_id)
            return kase.is_hidden;
    return false;
}

static void redact(const exercise &ex, test_verdict &verdict, const vector<string> &prefixes) {
    if (is_hidden_test(ex, verdict)) {
        verdict.is_hidden = true;
        verdict.actual_output.reset();
        verdict.diff_summary.reset();
        verdict.run.stdout_data.clear();
        verdict.run.stderr_data.clear();
        verdict.error_message = verdict.passed ? "" : get_display_message(verdict.run.status);
        if (!verdict.passed && verdict.run.status == exit_status::NORMAL)
            verdict.error_message = "Wrong Answer";
        return;
    }

    if (verdict.actual_output) verdict.actual_output = redact_sandbox_paths(*verdict.actual_output, prefixes);
    if (verdict.diff_summary) verdict.diff_summary = redact_sandbox_paths(*verdict.diff_summary, prefixes);
    verdict.error_message = redact_sandbox_paths(verdict.error_message, prefixes);
    verdict.run.stdout_data = redact_sandbox_paths(verdict.run.stdout_data, prefixes);
    verdict.run.stderr_data = redact_sandbox_paths(verdict.run.stderr_data, prefixes);
}

grading_result aggregate(const exercise &ex, vector<test_verdict> verdicts,
                         const harness_outcome &outcome, int64_t total_duration_ms,
                         const vector<string> &scratch_prefixes) {
    grading_result result;
    result.exercise_id = ex.id;
    result.max_score = TOTAL_WEIGHT;
    result.total_duration_ms = total_duration_ms;

    if (outcome.cancelled) {
        result.overall_status = grading_status::CANCELLED;
        result.truncated = outcome.truncated;
        result.message = get_display_message(grading_status::CANCELLED);
        return result;
    }

    size_t passed = 0;
    for (auto &verdict : verdicts) {
        if (verdict.passed) {
            ++passed;
            result.score += verdict.weight;
        } else if (!result.first_failure) {
            result.first_failure = verdict.test_case_id;
        }
        result.peak_memory_bytes = max(result.peak_memory_bytes, verdict.run.peak_memory_bytes);
        redact(ex, verdict, scratch_prefixes);
    }

    result.truncated = outcome.truncated || outcome.infrastructure_error;
    if (outcome.infrastructure_error) {
        result.overall_status = grading_status::INFRASTRUCTURE_ERROR;
        result.message = get_display_message(grading_status::INFRASTRUCTURE_ERROR);
    } else {
        if (!verdicts.empty() && passed == verdicts.size())
            result.overall_status = grading_status::PASSED;
        else if (passed == 0)
            result.overall_status = grading_status::FAILED;
        else
            result.overall_status = grading_status::PARTIAL;
        result.message = fmt::format("{} of {} tests passed, score {}/{}",
                                     passed, ex.test_cases.size(), result.score, result.max_score);
    }

    result.verdicts = move(verdicts);
    return result;
}

}  // namespace grader
