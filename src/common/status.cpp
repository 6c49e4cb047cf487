#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace grader {
using namespace std;

// clang-format off
static const unordered_map<exit_status, const char *> exit_status_display = boost::assign::map_list_of
    (exit_status::NORMAL, "Exited Normally")
    (exit_status::KILLED_TIMEOUT, "Time Limit Exceeded")
    (exit_status::KILLED_MEMORY, "Memory Limit Exceeded")
    (exit_status::KILLED_OUTPUT_OVERFLOW, "Output Limit Exceeded")
    (exit_status::RUNTIME_ERROR, "Runtime Error")
    (exit_status::INTERNAL_ERROR, "Internal Error")
    (exit_status::CANCELLED, "Cancelled");

static const unordered_map<exit_status, const char *> exit_status_name = boost::assign::map_list_of
    (exit_status::NORMAL, "normal")
    (exit_status::KILLED_TIMEOUT, "killed_timeout")
    (exit_status::KILLED_MEMORY, "killed_memory")
    (exit_status::KILLED_OUTPUT_OVERFLOW, "killed_output_overflow")
    (exit_status::RUNTIME_ERROR, "runtime_error")
    (exit_status::INTERNAL_ERROR, "internal_error")
    (exit_status::CANCELLED, "cancelled");

static const unordered_map<grading_status, const char *> grading_status_display = boost::assign::map_list_of
    (grading_status::PASSED, "All tests passed")
    (grading_status::FAILED, "No tests passed")
    (grading_status::PARTIAL, "Some tests passed")
    (grading_status::INFRASTRUCTURE_ERROR, "Grading temporarily unavailable")
    (grading_status::CANCELLED, "Grading cancelled");

static const unordered_map<grading_status, const char *> grading_status_name = boost::assign::map_list_of
    (grading_status::PASSED, "passed")
    (grading_status::FAILED, "failed")
    (grading_status::PARTIAL, "partial")
    (grading_status::INFRASTRUCTURE_ERROR, "infrastructure_error")
    (grading_status::CANCELLED, "cancelled");

static const unordered_map<request_state, const char *> request_state_name = boost::assign::map_list_of
    (request_state::QUEUED, "queued")
    (request_state::RUNNING, "running")
    (request_state::COMPLETED, "completed")
    (request_state::CANCELLED, "cancelled");
// clang-format on

const char *get_display_message(exit_status stat) {
    return exit_status_display.at(stat);
}

const char *get_display_message(grading_status stat) {
    return grading_status_display.at(stat);
}

const char *get_status_name(exit_status stat) {
    return exit_status_name.at(stat);
}

const char *get_status_name(grading_status stat) {
    return grading_status_name.at(stat);
}

const char *get_state_name(request_state state) {
    return request_state_name.at(state);
}

}  // namespace grader
