#include "judge/result.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const sandbox_run &run) {
    j = {{"exit_status", get_status_name(run.status)},
         {"stdout", run.stdout_data},
         {"stderr", run.stderr_data},
         {"duration_ms", run.duration_ms},
         {"peak_memory_bytes", run.peak_memory_bytes},
         {"exit_code", run.exit_code},
         {"signal", run.signal}};
}

void to_json(json &j, const test_verdict &verdict) {
    j = {{"test_case_id", verdict.test_case_id},
         {"name", verdict.name},
         {"passed", verdict.passed},
         {"weight", verdict.weight},
         {"points_earned", verdict.points_earned},
         {"hidden", verdict.is_hidden},
         {"error_message", verdict.error_message},
         {"sandbox_run", verdict.run}};
    if (verdict.actual_output)
        j["actual_output"] = *verdict.actual_output;
    if (verdict.diff_summary)
        j["diff_summary"] = *verdict.diff_summary;
    if (verdict.is_hidden) {
        j["sandbox_run"].erase("stdout");
        j["sandbox_run"].erase("stderr");
    }
}

void to_json(json &j, const grading_result &result) {
    j = {{"exercise_id", result.exercise_id},
         {"overall_status", get_status_name(result.overall_status)},
         {"score", result.score},
         {"max_score", result.max_score},
         {"verdicts", result.verdicts},
         {"total_duration_ms", result.total_duration_ms},
         {"peak_memory_bytes", result.peak_memory_bytes},
         {"truncated", result.truncated},
         {"message", result.message}};
    if (result.first_failure)
        j["first_failure"] = *result.first_failure;
    else
        j["first_failure"] = nullptr;
}

}  // namespace grader
